#include <string>
#include <utility>

#include "proto/envelope.hpp"
#include "sender/scheduler.hpp"
#include "util/log.hpp"

namespace sender
{

Scheduler::Scheduler(channel::ISymbolRenderer &renderer, Handoff &out)
    : renderer_(renderer), out_(out)
{
}

ScheduleResult Scheduler::run(proto::ChunkSource            &src,
                              std::uint32_t                  total_parts,
                              const std::set<std::uint32_t> *selector)
{
    ScheduleResult res;
    const std::string file_name = src.file_name();

    proto::Part part;
    while (src.next(part))
    {
        if (selector && selector->count(part.number) == 0)
            continue;

        LOG_INFO("  > Broadcasting part %u/%u", part.number, total_parts);

        proto::Envelope env;
        env.part_number = part.number;
        env.total_parts = total_parts;
        env.file_name   = file_name;
        env.payload     = std::move(part.bytes);

        const std::string text = proto::encode(env);
        if (text.empty())
        {
            LOG_ERROR("run: cannot encode part %u", part.number);
            res.encode_failed = true;
            break;
        }

        channel::RenderedUnit unit;
        unit.part_number = env.part_number;
        unit.total_parts = total_parts;
        if (!renderer_.render(text, unit.symbol))
        {
            LOG_ERROR("run: cannot render part %u", part.number);
            res.encode_failed = true;
            break;
        }

        // blocks until the presenter took the previous unit
        if (!out_.push(std::move(unit)))
        {
            res.cancelled = true;
            return res;
        }
        ++res.sent;
    }
    res.source = src.status();

    if (!out_.push(std::nullopt))
        res.cancelled = true;
    return res;
}

}  // namespace sender
