#include <utility>

#include "receiver/receiver_service.hpp"
#include "util/log.hpp"

namespace receiver
{

ReceiverService::ReceiverService(const util::Config      &cfg,
                                 channel::IFrameSource   &source,
                                 DecoderFactory           make_decoder,
                                 const store::DraftStore &store)
    : cfg_(cfg),
      results_(cfg.result_queue_capacity),
      asm_(cfg, store),
      pipeline_(cfg, source, std::move(make_decoder), results_)
{
}

Outcome ReceiverService::run(const std::atomic_bool &cancel)
{
    LOG_SYSTEM("--- Scanner Started ---");
    LOG_SYSTEM("Using %u parallel decoders.", pipeline_.decoder_count());
    LOG_SYSTEM("Press Ctrl+C to stop scanning and save a draft.");
    LOG_SYSTEM("Waiting for the first part...");

    if (!pipeline_.start())
    {
        asm_.interrupt();
        return asm_.finish();
    }

    while (!asm_.terminal())
    {
        if (cancel.load())
        {
            asm_.interrupt();
            break;
        }
        if (asm_.check_stall(Clock::now()))
            break;

        // short poll so the stall rule and `cancel` are re-evaluated while idle
        auto item = results_.pop_for(cfg_.poll_interval);
        if (!item)
        {
            // decoders push before they exit, so an empty queue here is final
            if (pipeline_.drained() && results_.size() == 0)
            {
                LOG_SYSTEM("Frame source closed, no more parts can arrive.");
                asm_.interrupt();
                break;
            }
            continue;
        }
        asm_.feed(*item, Clock::now());
    }

    LOG_INFO("Stopping capture workers (%s)...", state_name(asm_.state()));
    pipeline_.stop();
    return asm_.finish();
}

}  // namespace receiver
