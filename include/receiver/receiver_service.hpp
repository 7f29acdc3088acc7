#pragma once
#include <atomic>

#include "channel/ichannel.hpp"
#include "receiver/assembler.hpp"
#include "receiver/capture_pipeline.hpp"
#include "store/draft_store.hpp"
#include "util/config.hpp"

namespace receiver
{

// Runs the capture pipeline and feeds the assembler until it reaches a
// terminal state, then stops the pipeline and writes the artifacts.
class ReceiverService
{
  public:
    ReceiverService(const util::Config      &cfg,
                    channel::IFrameSource   &source,
                    DecoderFactory           make_decoder,
                    const store::DraftStore &store);

    ReceiverService(const ReceiverService &)            = delete;
    ReceiverService &operator=(const ReceiverService &) = delete;

    // Blocks. `cancel` is checked at least once per poll interval.
    Outcome run(const std::atomic_bool &cancel);

    const Assembler       &assembler() const { return asm_; }
    const CapturePipeline &pipeline() const { return pipeline_; }

  private:
    util::Config    cfg_;
    ResultQueue     results_;
    Assembler       asm_;
    CapturePipeline pipeline_;
};

}  // namespace receiver
