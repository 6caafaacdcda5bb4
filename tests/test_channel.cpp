#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/message_channel.hpp"
#include "proto/frag.hpp"
#include "transport/loopback_transport.hpp"
#include "util/timer_queue.hpp"

static frag::Bytes to_bytes(const std::string &s)
{
    return frag::Bytes(s.begin(), s.end());
}

TEST(ChannelLoopback, Short_Roundtrip)
{
    transport::LoopbackTransport t;
    std::vector<frag::Bytes>     got;

    app::MessageChannel ch(t, /*max_frame_size=*/100);
    ASSERT_TRUE(ch.start([&](const frag::Bytes &m) { got.push_back(m); }));

    const auto msg = to_bytes("hello, loopback!");
    ASSERT_TRUE(ch.send(msg));

    // Loopback is synchronous; after send, on_rx has run.
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], msg);
    EXPECT_EQ(ch.stats().frames_sent, 1u);
    EXPECT_EQ(ch.stats().messages_received, 1u);

    ch.stop();
}

TEST(ChannelLoopback, Long_Roundtrip_Fragmented)
{
    transport::LoopbackTransport t;
    std::vector<frag::Bytes>     got;

    // Force fragmentation with a small frame
    app::MessageChannel ch(t, /*max_frame_size=*/32);
    ASSERT_TRUE(ch.start([&](const frag::Bytes &m) { got.push_back(m); }));

    frag::Bytes msg(4096, 'X');
    ASSERT_TRUE(ch.send(msg));
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], msg);

    // header + ceil(4096 / 19) data frames
    EXPECT_EQ(ch.stats().frames_sent, 1u + (4096 + 18) / 19);
    EXPECT_EQ(ch.stats().fragmented_sends, 1u);
    EXPECT_EQ(ch.stats().receive_errors, 0u);
    EXPECT_EQ(ch.reassembler().pending_batch_count(), 0u);
    ch.stop();
}

TEST(ChannelLoopback, ThresholdIsFrameMinusMarker)
{
    transport::LoopbackTransport t;
    app::MessageChannel          ch(t, 32);
    ASSERT_TRUE(ch.start(nullptr));

    ASSERT_TRUE(ch.send(frag::Bytes(31, 1)));
    EXPECT_EQ(ch.stats().frames_sent, 1u);
    ASSERT_TRUE(ch.send(frag::Bytes(32, 1)));
    EXPECT_EQ(ch.stats().frames_sent, 1u + 3u);  // header + 19 + 13
    ch.stop();
}

TEST(ChannelLoopback, ReorderedFramesStillDeliver)
{
    transport::LoopbackTransport t;
    std::vector<frag::Bytes>     got;
    util::TimerQueue             q;

    app::MessageChannel ch(t, 64, {}, q.api());
    ASSERT_TRUE(ch.start([&](const frag::Bytes &m) { got.push_back(m); }));

    t.hold(true);
    frag::Bytes msg(500);
    for (std::size_t i = 0; i < msg.size(); ++i)
        msg[i] = static_cast<std::uint8_t>(i * 7);
    ASSERT_TRUE(ch.send(msg));
    auto frames = t.take_held();
    ASSERT_GT(frames.size(), 2u);
    EXPECT_EQ(q.pending(), 0u);

    std::reverse(frames.begin(), frames.end());  // header arrives last
    for (const auto &f : frames)
        ASSERT_TRUE(t.deliver(f));

    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], msg);
    EXPECT_EQ(q.pending(), 0u);
    ch.stop();
}

TEST(ChannelLoopback, GarbageCountedAsError)
{
    transport::LoopbackTransport t;
    int                          delivered = 0;

    app::MessageChannel ch(t, 64);
    ASSERT_TRUE(ch.start([&](const frag::Bytes &) { ++delivered; }));
    ASSERT_TRUE(t.deliver(transport::Frame{0x55, 1, 2}));
    ASSERT_TRUE(t.deliver(transport::Frame{}));
    EXPECT_EQ(ch.stats().receive_errors, 2u);
    EXPECT_EQ(ch.stats().frames_received, 2u);
    EXPECT_EQ(delivered, 0);
    ch.stop();
}

TEST(ChannelLoopback, StopDisposesReassembler)
{
    transport::LoopbackTransport t;
    app::MessageChannel          ch(t, 64);
    ASSERT_TRUE(ch.start(nullptr));
    ch.stop();
    EXPECT_TRUE(ch.reassembler().disposed());
    EXPECT_FALSE(t.link_ready());
    EXPECT_FALSE(ch.send(frag::Bytes{1}));
}

TEST(ChannelLoopback, RestartAfterStopRefused)
{
    transport::LoopbackTransport t;
    int                          delivered = 0;
    app::MessageChannel          ch(t, 64);
    ASSERT_TRUE(ch.start([&](const frag::Bytes &) { ++delivered; }));
    ch.stop();

    EXPECT_FALSE(ch.start([&](const frag::Bytes &) { ++delivered; }));
    EXPECT_FALSE(t.link_ready());
    EXPECT_FALSE(ch.send(to_bytes("after stop")));
    EXPECT_EQ(delivered, 0);
}

TEST(ChannelLoopback, RejectsTinyFrame)
{
    transport::LoopbackTransport t;
    EXPECT_THROW({ app::MessageChannel ch(t, frag::HEADER_FRAME_SIZE); }, std::invalid_argument);
}
