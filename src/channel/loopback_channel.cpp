#include "channel/loopback_channel.hpp"
#include "util/log.hpp"

namespace channel
{

bool LoopbackChannel::show(const RenderedUnit &unit)
{
    ++shown_;
    if (lose_ && lose_(unit))
    {
        LOG_DEBUG("loopback: part %u lost", unit.part_number);
        return true;
    }
    for (unsigned i = 0; i < repeat_; ++i)
    {
        if (!frames_.push(unit.symbol))
            return false;
    }
    return true;
}

void LoopbackChannel::finish()
{
    frames_.close();
}

CaptureStatus LoopbackChannel::capture(Frame &out)
{
    auto f = frames_.pop_for(wait_);
    if (f)
    {
        out = std::move(*f);
        return CaptureStatus::Ok;
    }
    return frames_.closed() ? CaptureStatus::Closed : CaptureStatus::NoFrame;
}

}  // namespace channel
