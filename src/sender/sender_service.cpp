#include <chrono>
#include <thread>

#include "proto/chunk_source.hpp"
#include "proto/envelope.hpp"
#include "sender/sender_service.hpp"
#include "util/log.hpp"

namespace sender
{

const char *send_outcome_name(SendOutcome o)
{
    switch (o)
    {
        case SendOutcome::Completed:
            return "completed";
        case SendOutcome::SourceError:
            return "source error";
        case SendOutcome::Cancelled:
            return "cancelled";
        case SendOutcome::PresentFailed:
            return "present failed";
    }
    return "?";
}

SenderService::SenderService(const util::Config       &cfg,
                             channel::ISymbolRenderer &renderer,
                             channel::IPresenter      &presenter)
    : cfg_(cfg), renderer_(renderer), presenter_(presenter)
{
}

void SenderService::stop()
{
    // unblocks a scheduler waiting on the slot
    handoff_.close();
    if (gen_thr_.joinable())
        gen_thr_.join();
}

SendOutcome SenderService::run(const std::string             &path,
                               const std::set<std::uint32_t> *selector,
                               const std::atomic_bool        &cancel)
{
    proto::ChunkSource src(path, cfg_.chunk_size);
    if (!src.open())
        return SendOutcome::SourceError;

    if (!proto::is_safe_file_name(src.file_name()))
    {
        LOG_ERROR("Source file name '%s' cannot be sent (not valid UTF-8)", path.c_str());
        return SendOutcome::SourceError;
    }

    const std::uint32_t total_parts = src.total_parts();
    if (total_parts == 0)
    {
        LOG_ERROR("Source file '%s' is empty, nothing to send", path.c_str());
        return SendOutcome::SourceError;
    }
    LOG_INFO("Total parts to generate: %u", total_parts);

    std::uint32_t display_total = total_parts;
    if (selector)
    {
        std::uint32_t in_range = 0;
        for (auto p : *selector)
        {
            if (p >= 1 && p <= total_parts)
                ++in_range;
            else
                LOG_WARN("Remediation part %u is outside 1..%u, skipped", p, total_parts);
        }
        if (in_range == 0)
        {
            LOG_ERROR("No remediation part matches '%s'", path.c_str());
            return SendOutcome::SourceError;
        }
        display_total = in_range;
    }

    Scheduler sched(renderer_, handoff_);
    gen_thr_ = std::thread([this, &sched, &src, total_parts, selector] {
        result_ = sched.run(src, total_parts, selector);
    });

    SendOutcome outcome = SendOutcome::Completed;
    while (true)
    {
        if (cancel.load())
        {
            LOG_SYSTEM("Broadcast stopped by user.");
            outcome = SendOutcome::Cancelled;
            break;
        }
        auto item = handoff_.pop_for(cfg_.poll_interval);
        if (!item)
        {
            if (handoff_.closed())
                break;
            continue;
        }
        if (!item->has_value())
        {
            presenter_.finish();
            break;
        }
        const channel::RenderedUnit &unit = **item;
        if (!presenter_.show(unit))
        {
            LOG_ERROR("Presenter rejected part %u", unit.part_number);
            outcome = SendOutcome::PresentFailed;
            break;
        }
        ++shown_;
        LOG_DEBUG("Part %zu/%u on display (part number %u)", shown_, display_total,
                  unit.part_number);
        std::this_thread::sleep_for(cfg_.display_interval);
    }

    stop();

    if (outcome != SendOutcome::Completed)
        return outcome;
    if (result_.encode_failed)
        return SendOutcome::PresentFailed;
    if (result_.source != proto::SourceStatus::Ok)
        return SendOutcome::SourceError;
    return SendOutcome::Completed;
}

}  // namespace sender
