#include <chrono>
#include <exception>
#include <utility>

#include "receiver/capture_pipeline.hpp"
#include "util/log.hpp"

namespace receiver
{

CapturePipeline::CapturePipeline(const util::Config    &cfg,
                                 channel::IFrameSource &source,
                                 DecoderFactory         make_decoder,
                                 ResultQueue           &results)
    : cfg_(cfg),
      source_(source),
      make_decoder_(std::move(make_decoder)),
      results_(results),
      frames_(cfg.frame_queue_capacity),
      decoder_count_(cfg.decoder_count ? cfg.decoder_count : 1)
{
}

bool CapturePipeline::start()
{
    if (running_.load())
        return true;
    if (!make_decoder_)
    {
        LOG_ERROR("start: no decoder factory");
        return false;
    }
    stop_.store(false);
    source_closed_.store(false);
    live_decoders_.store(decoder_count_);
    running_.store(true);

    producer_ = std::thread([this] { producer_loop(); });
    decoders_.reserve(decoder_count_);
    for (unsigned i = 0; i < decoder_count_; ++i)
        decoders_.emplace_back([this, i] { decoder_loop(i); });

    LOG_INFO("capture pipeline: source=%s decoders=%u fps=%u", source_.name().c_str(),
             decoder_count_, cfg_.grab_fps);
    return true;
}

void CapturePipeline::stop()
{
    if (!running_.exchange(false))
        return;
    {
        std::lock_guard<std::mutex> lk(nap_mu_);
        stop_.store(true);
    }
    nap_cv_.notify_all();
    // wake decoders blocked on either queue
    frames_.close();
    results_.close();

    if (producer_.joinable())
        producer_.join();
    for (auto &t : decoders_)
    {
        if (t.joinable())
            t.join();
    }
    decoders_.clear();

    LOG_INFO("capture pipeline stopped: captured=%llu dropped=%llu capture_faults=%llu "
             "decode_faults=%llu forwarded=%llu",
             (unsigned long long)stats_.frames_captured.load(),
             (unsigned long long)stats_.frames_dropped.load(),
             (unsigned long long)stats_.capture_faults.load(),
             (unsigned long long)stats_.decode_faults.load(),
             (unsigned long long)stats_.symbols_forwarded.load());
}

void CapturePipeline::nap(std::chrono::steady_clock::duration d)
{
    std::unique_lock<std::mutex> lk(nap_mu_);
    nap_cv_.wait_for(lk, d, [&] { return stop_.load(); });
}

void CapturePipeline::producer_loop()
{
    using clock          = std::chrono::steady_clock;
    const unsigned fps   = cfg_.grab_fps ? cfg_.grab_fps : 1;
    const auto     period = std::chrono::duration_cast<clock::duration>(std::chrono::seconds(1)) /
                        fps;
    auto next_grab = clock::now();

    while (!stop_.load())
    {
        channel::Frame frame;
        switch (source_.capture(frame))
        {
            case channel::CaptureStatus::Ok:
                stats_.frames_captured++;
                // stale frames are worse than lost ones: never wait long here
                if (!frames_.push_for(std::move(frame), cfg_.frame_push_timeout))
                {
                    if (stop_.load() || frames_.closed())
                        return;
                    stats_.frames_dropped++;
                    LOG_WARN("Frame queue is full. Decoders are too slow. Dropping frame.");
                }
                break;
            case channel::CaptureStatus::NoFrame:
                break;
            case channel::CaptureStatus::Fault:
                stats_.capture_faults++;
                LOG_WARN("capture from %s failed, retrying in %lld ms", source_.name().c_str(),
                         (long long)cfg_.capture_retry_delay.count());
                nap(cfg_.capture_retry_delay);
                next_grab = clock::now();
                continue;
            case channel::CaptureStatus::Closed:
                LOG_INFO("frame source %s closed", source_.name().c_str());
                // decoders finish what is queued, then exit
                source_closed_.store(true);
                frames_.close();
                return;
        }

        next_grab += period;
        const auto now = clock::now();
        if (next_grab > now)
            nap(next_grab - now);
        else
            next_grab = now;  // fell behind, don't try to catch up
    }
}

bool CapturePipeline::drained() const
{
    return source_closed_.load() && live_decoders_.load() == 0;
}

void CapturePipeline::decoder_loop(unsigned idx)
{
    run_decoder(idx);
    live_decoders_--;
}

void CapturePipeline::run_decoder(unsigned idx)
{
    std::unique_ptr<channel::ISymbolDecoder> decoder = make_decoder_();
    if (!decoder)
    {
        LOG_ERROR("decoder %u: factory returned no decoder", idx);
        return;
    }

    while (!stop_.load())
    {
        auto frame = frames_.pop();
        if (!frame)
            break;  // closed and drained

        std::vector<std::string> symbols;
        try
        {
            symbols = decoder->decode(*frame);
        }
        catch (const std::exception &e)
        {
            // one bad frame never takes the worker down
            stats_.decode_faults++;
            LOG_DEBUG("decoder %u: %s", idx, e.what());
            continue;
        }
        catch (...)
        {
            stats_.decode_faults++;
            LOG_DEBUG("decoder %u: unknown exception", idx);
            continue;
        }
        if (symbols.empty())
            continue;

        // only the first symbol of a frame is used; blocks while the assembler is behind
        if (!results_.push(std::move(symbols.front())))
            break;
        stats_.symbols_forwarded++;
    }
}

}  // namespace receiver
