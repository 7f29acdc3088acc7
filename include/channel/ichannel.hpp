#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace channel
{

// An image (or, for the line channel, the text itself) crossing the visual gap
using Frame = std::vector<std::uint8_t>;

struct RenderedUnit
{
    std::uint32_t part_number{0};
    std::uint32_t total_parts{0};
    Frame         symbol;
};

enum class CaptureStatus
{
    Ok,
    NoFrame,  // nothing available yet, try again
    Fault,    // transient capture failure (screen locked, device busy...)
    Closed,   // the source is gone for good
};

// Sender side: text -> visual symbol
struct ISymbolRenderer
{
    virtual bool render(const std::string &text, Frame &out) = 0;
    virtual ~ISymbolRenderer()                               = default;
};

// Sender side: puts one symbol on display until the next one replaces it
struct IPresenter
{
    virtual bool        show(const RenderedUnit &unit) = 0;
    virtual void        finish()                       = 0;  // end of sequence
    virtual std::string name() const { return ""; }
    virtual ~IPresenter() = default;
};

// Receiver side: one frame per call
struct IFrameSource
{
    virtual CaptureStatus capture(Frame &out) = 0;
    virtual std::string   name() const { return ""; }
    virtual ~IFrameSource() = default;
};

// Receiver side: every symbol found in a frame, raw bytes, possibly none.
// May throw; callers treat that as a per-frame fault.
struct ISymbolDecoder
{
    virtual std::vector<std::string> decode(const Frame &frame) = 0;
    virtual ~ISymbolDecoder()                                   = default;
};

}  // namespace channel
