#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>

#include "channel/ichannel.hpp"
#include "proto/chunk_source.hpp"
#include "util/bounded_queue.hpp"

namespace sender
{

// Single-slot rendezvous to the presentation side. std::nullopt marks the end
// of the sequence.
using Handoff = util::BoundedQueue<std::optional<channel::RenderedUnit>>;

struct ScheduleResult
{
    std::size_t         sent{0};
    proto::SourceStatus source{proto::SourceStatus::Ok};
    bool                cancelled{false};  // handoff closed under us
    bool                encode_failed{false};
};

class Scheduler
{
  public:
    Scheduler(channel::ISymbolRenderer &renderer, Handoff &out);

    // Walk `src` (already open) and hand off one rendered unit per part, in
    // part order. With a selector, parts outside it are read but not sent.
    // The end sentinel is always pushed unless the handoff was closed.
    ScheduleResult run(proto::ChunkSource                &src,
                       std::uint32_t                      total_parts,
                       const std::set<std::uint32_t>     *selector = nullptr);

  private:
    channel::ISymbolRenderer &renderer_;
    Handoff                  &out_;
};

}  // namespace sender
