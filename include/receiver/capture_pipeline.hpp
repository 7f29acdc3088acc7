#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "channel/ichannel.hpp"
#include "util/bounded_queue.hpp"
#include "util/config.hpp"

/*
  IFrameSource ──▶ producer ──▶ [frame queue] ──▶ decoder x N ──▶ [result queue] ──▶ Assembler
                   (grab_fps,     (bounded,        (one decoder     (bounded,
                    drops when     drop on full)     instance each)   blocks on full)
                    full)
*/

namespace receiver
{

using ResultQueue    = util::BoundedQueue<std::string>;
using DecoderFactory = std::function<std::unique_ptr<channel::ISymbolDecoder>()>;

struct PipelineStats
{
    std::atomic<std::uint64_t> frames_captured{0};
    std::atomic<std::uint64_t> frames_dropped{0};
    std::atomic<std::uint64_t> capture_faults{0};
    std::atomic<std::uint64_t> decode_faults{0};
    std::atomic<std::uint64_t> symbols_forwarded{0};
};

class CapturePipeline
{
  public:
    CapturePipeline(const util::Config    &cfg,
                    channel::IFrameSource &source,
                    DecoderFactory         make_decoder,
                    ResultQueue           &results);
    ~CapturePipeline() { stop(); }

    CapturePipeline(const CapturePipeline &)            = delete;
    CapturePipeline &operator=(const CapturePipeline &) = delete;

    bool start();
    // Closes both queues and joins every thread. Idempotent.
    void stop();

    // the source reported Closed and every decoder has exited: nothing more
    // will reach the result queue
    bool drained() const;

    bool                 running() const { return running_.load(); }
    unsigned             decoder_count() const { return decoder_count_; }
    const PipelineStats &stats() const { return stats_; }

  private:
    void producer_loop();
    void decoder_loop(unsigned idx);
    void run_decoder(unsigned idx);
    // sleep that returns early on stop()
    void nap(std::chrono::steady_clock::duration d);

    util::Config                       cfg_;
    channel::IFrameSource             &source_;
    DecoderFactory                     make_decoder_;
    ResultQueue                       &results_;
    util::BoundedQueue<channel::Frame> frames_;
    unsigned                           decoder_count_;

    std::atomic_bool         running_{false};
    std::atomic_bool         stop_{false};
    std::atomic_bool         source_closed_{false};
    std::atomic<unsigned>    live_decoders_{0};
    std::mutex               nap_mu_;
    std::condition_variable  nap_cv_;
    std::thread              producer_;
    std::vector<std::thread> decoders_;
    PipelineStats            stats_;
};

}  // namespace receiver
