#include <gtest/gtest.h>

#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

using namespace transport;

TEST(Loopback, EchoesFrame)
{
    LoopbackTransport t;
    Frame             captured;

    Settings s{};
    s.role           = "loopback";
    s.max_frame_size = 100;

    ASSERT_TRUE(t.start(s, [&](const Frame &f) { captured = f; }));
    EXPECT_TRUE(t.link_ready());
    EXPECT_EQ(t.name(), "loopback");

    Frame f = {1, 2, 3, 4, 5};
    EXPECT_TRUE(t.send(f));
    EXPECT_EQ(captured, f);

    t.stop();
    EXPECT_FALSE(t.link_ready());
}

TEST(Loopback, SendFailsWhenNotStarted)
{
    LoopbackTransport t;
    Frame             f = {0x42};
    EXPECT_FALSE(t.send(f));
}

TEST(Loopback, RejectsOversizedFrame)
{
    LoopbackTransport t;
    int               delivered = 0;

    Settings s{};
    s.max_frame_size = 4;
    ASSERT_TRUE(t.start(s, [&](const Frame &) { ++delivered; }));

    EXPECT_TRUE(t.send(Frame(4, 0xaa)));
    wirefrag::set_log_level(wirefrag::Level::Info);
    testing::internal::CaptureStderr();
    EXPECT_FALSE(t.send(Frame(5, 0xaa)));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("exceeds limit"), std::string::npos);
    EXPECT_EQ(delivered, 1);
}

TEST(Loopback, HoldQueuesUntilDeliver)
{
    LoopbackTransport  t;
    std::vector<Frame> seen;

    ASSERT_TRUE(t.start(Settings{}, [&](const Frame &f) { seen.push_back(f); }));
    t.hold(true);
    EXPECT_TRUE(t.send(Frame{1}));
    EXPECT_TRUE(t.send(Frame{2}));
    EXPECT_TRUE(seen.empty());

    auto held = t.take_held();
    ASSERT_EQ(held.size(), 2u);
    EXPECT_TRUE(t.take_held().empty());

    // reversed
    EXPECT_TRUE(t.deliver(held[1]));
    EXPECT_TRUE(t.deliver(held[0]));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], Frame{2});
    EXPECT_EQ(seen[1], Frame{1});

    t.stop();
    EXPECT_FALSE(t.deliver(held[0]));
}
