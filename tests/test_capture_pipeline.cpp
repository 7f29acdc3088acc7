#include <atomic>
#include <chrono>
#include <deque>
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "receiver/capture_pipeline.hpp"

using namespace std::chrono_literals;
using namespace receiver;

namespace
{

// Hands out a scripted list of captures, then reports the source closed
// (or idles forever when `close_at_end` is false).
class ScriptedSource final : public channel::IFrameSource
{
  public:
    struct Step
    {
        channel::CaptureStatus status;
        std::string            text;
    };

    ScriptedSource(std::vector<Step> steps, bool close_at_end)
        : steps_(steps.begin(), steps.end()), close_at_end_(close_at_end)
    {
    }

    channel::CaptureStatus capture(channel::Frame &out) override
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (steps_.empty())
        {
            if (close_at_end_)
                return channel::CaptureStatus::Closed;
            std::this_thread::sleep_for(2ms);
            return channel::CaptureStatus::NoFrame;
        }
        Step s = steps_.front();
        steps_.pop_front();
        out.assign(s.text.begin(), s.text.end());
        return s.status;
    }
    std::string name() const override { return "scripted"; }

  private:
    std::mutex       mu_;
    std::deque<Step> steps_;
    bool             close_at_end_;
};

// "boom" throws, "odd" throws a non-std value, "none" has no symbol, anything
// else yields itself plus an extra symbol
class FakeDecoder final : public channel::ISymbolDecoder
{
  public:
    std::vector<std::string> decode(const channel::Frame &frame) override
    {
        std::string s(frame.begin(), frame.end());
        if (s == "boom")
            throw std::runtime_error("decoder crashed");
        if (s == "odd")
            throw 42;
        if (s == "none")
            return {};
        return {s, "second-" + s};
    }
};

// Blocks every decode until released
class GatedDecoder final : public channel::ISymbolDecoder
{
  public:
    explicit GatedDecoder(std::atomic<bool> &open) : open_(open) {}
    std::vector<std::string> decode(const channel::Frame &frame) override
    {
        while (!open_.load())
            std::this_thread::sleep_for(1ms);
        return {std::string(frame.begin(), frame.end())};
    }

  private:
    std::atomic<bool> &open_;
};

util::Config fast_config()
{
    util::Config cfg;
    cfg.grab_fps            = 240;
    cfg.decoder_count       = 4;
    cfg.frame_push_timeout  = 5ms;
    cfg.capture_retry_delay = 10ms;
    return cfg;
}

std::set<std::string> collect(ResultQueue &q, std::size_t want)
{
    std::set<std::string> got;
    std::size_t           n = 0;
    while (n < want)
    {
        auto s = q.pop_for(2s);
        if (!s)
            break;
        got.insert(*s);
        ++n;
    }
    return got;
}

}  // namespace

TEST(CapturePipeline, DecodesAndForwardsFirstSymbolOnly)
{
    using St = channel::CaptureStatus;
    ScriptedSource src({{St::Ok, "a"},
                        {St::Ok, "boom"},
                        {St::Ok, "b"},
                        {St::Ok, "none"},
                        {St::NoFrame, ""},
                        {St::Ok, "c"}},
                       /*close_at_end=*/false);

    ResultQueue     results(16);
    CapturePipeline pipe(fast_config(), src, [] { return std::make_unique<FakeDecoder>(); },
                         results);
    ASSERT_TRUE(pipe.start());
    EXPECT_EQ(pipe.decoder_count(), 4u);

    auto got = collect(results, 3);
    // give a stray "second-*" symbol a chance to show up before stopping
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(results.size(), 0u);
    pipe.stop();

    EXPECT_EQ(got, (std::set<std::string>{"a", "b", "c"}));
    EXPECT_EQ(pipe.stats().frames_captured.load(), 5u);
    EXPECT_EQ(pipe.stats().decode_faults.load(), 1u);
    EXPECT_EQ(pipe.stats().symbols_forwarded.load(), 3u);
    EXPECT_FALSE(pipe.running());
}

TEST(CapturePipeline, CaptureFaultIsRetried)
{
    using St = channel::CaptureStatus;
    ScriptedSource src({{St::Fault, ""}, {St::Fault, ""}, {St::Ok, "after"}}, true);

    ResultQueue     results(4);
    CapturePipeline pipe(fast_config(), src, [] { return std::make_unique<FakeDecoder>(); },
                         results);
    ASSERT_TRUE(pipe.start());
    auto got = collect(results, 1);
    pipe.stop();

    EXPECT_EQ(got, (std::set<std::string>{"after"}));
    EXPECT_EQ(pipe.stats().capture_faults.load(), 2u);
}

TEST(CapturePipeline, DropsFramesWhenDecodersLag)
{
    using St = channel::CaptureStatus;
    std::vector<ScriptedSource::Step> steps;
    for (int i = 0; i < 40; ++i)
        steps.push_back({St::Ok, "f" + std::to_string(i)});
    ScriptedSource src(steps, false);

    util::Config cfg         = fast_config();
    cfg.decoder_count        = 1;
    cfg.frame_queue_capacity = 2;

    std::atomic<bool> gate{false};
    ResultQueue       results(64);
    CapturePipeline   pipe(cfg, src, [&] { return std::make_unique<GatedDecoder>(gate); },
                           results);
    ASSERT_TRUE(pipe.start());

    // 40 frames at 240 fps with a 5 ms push timeout: well under a second
    for (int i = 0; i < 200 && pipe.stats().frames_captured.load() < 40; ++i)
        std::this_thread::sleep_for(10ms);
    EXPECT_EQ(pipe.stats().frames_captured.load(), 40u);
    EXPECT_GT(pipe.stats().frames_dropped.load(), 0u);

    gate.store(true);
    pipe.stop();
    const auto &st = pipe.stats();
    EXPECT_LE(st.symbols_forwarded.load() + st.frames_dropped.load(), 40u);
}

TEST(CapturePipeline, StopIsPromptAndIdempotent)
{
    ScriptedSource  src({}, false);
    util::Config    cfg = fast_config();
    cfg.grab_fps        = 1;  // the producer spends its time napping
    ResultQueue     results(4);
    CapturePipeline pipe(cfg, src, [] { return std::make_unique<FakeDecoder>(); }, results);
    ASSERT_TRUE(pipe.start());
    std::this_thread::sleep_for(20ms);

    const auto t0 = std::chrono::steady_clock::now();
    pipe.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 500ms);
    pipe.stop();
    EXPECT_TRUE(results.closed());
}

TEST(CapturePipeline, ClosedSourceDrainsDecoders)
{
    ScriptedSource  src({{channel::CaptureStatus::Ok, "only"}}, true);
    ResultQueue     results(4);
    CapturePipeline pipe(fast_config(), src, [] { return std::make_unique<FakeDecoder>(); },
                         results);
    ASSERT_TRUE(pipe.start());
    auto got = collect(results, 1);
    EXPECT_EQ(got.count("only"), 1u);

    // decoders exit on their own once the source is gone
    for (int i = 0; i < 200 && !pipe.drained(); ++i)
        std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(pipe.drained());
    EXPECT_TRUE(pipe.running());
    pipe.stop();
}

TEST(CapturePipeline, OpenSourceIsNeverDrained)
{
    ScriptedSource  src({}, false);
    ResultQueue     results(4);
    CapturePipeline pipe(fast_config(), src, [] { return std::make_unique<FakeDecoder>(); },
                         results);
    ASSERT_TRUE(pipe.start());
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pipe.drained());
    pipe.stop();
}

TEST(CapturePipeline, FullResultQueueBlocksDecoders)
{
    using St = channel::CaptureStatus;
    ScriptedSource src({{St::Ok, "a"}, {St::Ok, "b"}, {St::Ok, "c"}, {St::Ok, "d"},
                        {St::Ok, "e"}},
                       true);

    util::Config cfg  = fast_config();
    cfg.decoder_count = 2;
    ResultQueue     results(1);
    CapturePipeline pipe(cfg, src, [] { return std::make_unique<FakeDecoder>(); }, results);
    ASSERT_TRUE(pipe.start());

    // nobody reads yet: one symbol sits in the queue, the decoders wait on it
    for (int i = 0; i < 200 && pipe.stats().frames_captured.load() < 5; ++i)
        std::this_thread::sleep_for(5ms);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(pipe.stats().frames_captured.load(), 5u);
    EXPECT_EQ(pipe.stats().symbols_forwarded.load(), 1u);
    EXPECT_EQ(results.size(), 1u);
    EXPECT_FALSE(pipe.drained());

    auto got = collect(results, 5);
    EXPECT_EQ(got, (std::set<std::string>{"a", "b", "c", "d", "e"}));
    for (int i = 0; i < 200 && !pipe.drained(); ++i)
        std::this_thread::sleep_for(5ms);
    ASSERT_TRUE(pipe.drained());
    EXPECT_EQ(pipe.stats().symbols_forwarded.load(), 5u);
    EXPECT_EQ(pipe.stats().frames_dropped.load(), 0u);
    pipe.stop();
}

TEST(CapturePipeline, NonStandardThrowCountsAsFault)
{
    using St = channel::CaptureStatus;
    ScriptedSource  src({{St::Ok, "odd"}, {St::Ok, "x"}}, true);
    util::Config    cfg = fast_config();
    cfg.decoder_count   = 1;
    ResultQueue     results(4);
    CapturePipeline pipe(cfg, src, [] { return std::make_unique<FakeDecoder>(); }, results);
    ASSERT_TRUE(pipe.start());

    auto got = collect(results, 1);
    EXPECT_EQ(got, (std::set<std::string>{"x"}));
    pipe.stop();
    EXPECT_EQ(pipe.stats().decode_faults.load(), 1u);
}
