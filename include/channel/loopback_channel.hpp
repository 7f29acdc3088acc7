#pragma once
#include <chrono>
#include <cstddef>
#include <functional>

#include "channel/ichannel.hpp"
#include "util/bounded_queue.hpp"

namespace channel
{

// LoopbackChannel: the presenter and the camera in one object, joined by a
// queue. Used to run sender and receiver in one process without a screen.
class LoopbackChannel final : public IPresenter, public IFrameSource
{
  public:
    using LossFn = std::function<bool(const RenderedUnit &)>;  // true = never seen

    explicit LoopbackChannel(std::size_t capacity = 4096,
                             std::chrono::milliseconds wait = std::chrono::milliseconds(20))
        : frames_(capacity), wait_(wait)
    {
    }

    // each shown unit is captured `n` times (a camera over-sampling the display)
    void set_repeat(unsigned n) { repeat_ = n ? n : 1; }
    void set_loss(LossFn fn) { lose_ = std::move(fn); }

    bool          show(const RenderedUnit &unit) override;
    void          finish() override;
    CaptureStatus capture(Frame &out) override;
    std::string   name() const override { return "loopback"; }

    std::size_t shown() const { return shown_; }

  private:
    util::BoundedQueue<Frame> frames_;
    std::chrono::milliseconds wait_;
    unsigned                  repeat_{1};
    LossFn                    lose_{};
    std::size_t               shown_{0};
};

}  // namespace channel
