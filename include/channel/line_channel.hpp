#pragma once
#include <chrono>
#include <string>

#include "channel/ichannel.hpp"

namespace channel
{

// Line channel: a symbol is the transport text itself, one per line. Lets a
// sender and a receiver be joined by a pipe: gapcast-send f | gapcast-recv
class LineRenderer final : public ISymbolRenderer
{
  public:
    bool render(const std::string &text, Frame &out) override;
};

class LinePresenter final : public IPresenter
{
  public:
    explicit LinePresenter(int fd) : fd_(fd) {}

    bool        show(const RenderedUnit &unit) override;
    void        finish() override;
    std::string name() const override { return "line"; }

  private:
    int fd_;
};

class LineFrameSource final : public IFrameSource
{
  public:
    LineFrameSource(int fd, std::chrono::milliseconds wait) : fd_(fd), wait_(wait) {}

    CaptureStatus capture(Frame &out) override;
    std::string   name() const override { return "line"; }

  private:
    bool take_line(Frame &out);

    int                       fd_;
    std::chrono::milliseconds wait_;
    std::string               buf_;
    bool                      eof_{false};
};

class LineDecoder final : public ISymbolDecoder
{
  public:
    std::vector<std::string> decode(const Frame &frame) override;
};

}  // namespace channel
