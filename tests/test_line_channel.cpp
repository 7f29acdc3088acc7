#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

#include "channel/line_channel.hpp"
#include "channel/loopback_channel.hpp"

using namespace std::chrono_literals;
using namespace channel;

static std::string as_text(const Frame &f)
{
    return std::string(f.begin(), f.end());
}

TEST(LineChannel, RendererRejectsMultiLineText)
{
    LineRenderer r;
    Frame        f;
    EXPECT_TRUE(r.render("{\"p\":1}", f));
    EXPECT_EQ(as_text(f), "{\"p\":1}");
    EXPECT_FALSE(r.render("a\nb", f));
    EXPECT_FALSE(r.render("", f));
}

TEST(LineChannel, PipeRoundTrip)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    LinePresenter pres(fds[1]);
    RenderedUnit  u;
    u.part_number = 1;
    u.total_parts = 2;
    u.symbol      = {'a', 'b', 'c'};
    ASSERT_TRUE(pres.show(u));
    u.symbol = {'d', 'e'};
    ASSERT_TRUE(pres.show(u));
    // CRLF and an unterminated tail
    const char tail[] = "crlf\r\nlast";
    ASSERT_EQ(::write(fds[1], tail, sizeof(tail) - 1), (ssize_t)(sizeof(tail) - 1));
    ::close(fds[1]);

    LineFrameSource src(fds[0], 50ms);
    Frame           f;
    ASSERT_EQ(src.capture(f), CaptureStatus::Ok);
    EXPECT_EQ(as_text(f), "abc");
    ASSERT_EQ(src.capture(f), CaptureStatus::Ok);
    EXPECT_EQ(as_text(f), "de");
    ASSERT_EQ(src.capture(f), CaptureStatus::Ok);
    EXPECT_EQ(as_text(f), "crlf");

    CaptureStatus st = CaptureStatus::NoFrame;
    for (int i = 0; i < 10 && st == CaptureStatus::NoFrame; ++i)
        st = src.capture(f);
    ASSERT_EQ(st, CaptureStatus::Ok);
    EXPECT_EQ(as_text(f), "last");
    EXPECT_EQ(src.capture(f), CaptureStatus::Closed);
    ::close(fds[0]);
}

TEST(LineChannel, IdleSourceReportsNoFrame)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    LineFrameSource src(fds[0], 10ms);
    Frame           f;
    EXPECT_EQ(src.capture(f), CaptureStatus::NoFrame);
    ::close(fds[1]);
    EXPECT_EQ(src.capture(f), CaptureStatus::Closed);
    ::close(fds[0]);
}

TEST(LineChannel, DecoderYieldsWholeLine)
{
    LineDecoder d;
    EXPECT_TRUE(d.decode(Frame{}).empty());
    auto syms = d.decode(Frame{'x', 'y'});
    ASSERT_EQ(syms.size(), 1u);
    EXPECT_EQ(syms[0], "xy");
}

TEST(LoopbackChannel, RepeatLossAndClose)
{
    LoopbackChannel ch(64, 5ms);
    ch.set_repeat(3);
    ch.set_loss([](const RenderedUnit &u) { return u.part_number == 2; });

    RenderedUnit u;
    u.total_parts = 2;
    u.part_number = 1;
    u.symbol      = {'1'};
    ASSERT_TRUE(ch.show(u));
    u.part_number = 2;
    u.symbol      = {'2'};
    ASSERT_TRUE(ch.show(u));
    EXPECT_EQ(ch.shown(), 2u);

    Frame f;
    for (int i = 0; i < 3; ++i)
    {
        ASSERT_EQ(ch.capture(f), CaptureStatus::Ok);
        EXPECT_EQ(as_text(f), "1");
    }
    EXPECT_EQ(ch.capture(f), CaptureStatus::NoFrame);
    ch.finish();
    EXPECT_EQ(ch.capture(f), CaptureStatus::Closed);
}
