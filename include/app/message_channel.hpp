#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

#include "proto/frag.hpp"
#include "proto/reassembler.hpp"
#include "transport/itransport.hpp"
#include "util/timer_queue.hpp"

namespace app
{

using OnMessage = std::function<void(const frag::Bytes &)>;

struct ChannelStats
{
    std::uint64_t messages_sent     = 0;
    std::uint64_t frames_sent       = 0;
    std::uint64_t fragmented_sends  = 0;
    std::uint64_t messages_received = 0;
    std::uint64_t frames_received   = 0;
    std::uint64_t receive_errors    = 0;
};

// Binds one transport to the framer on the way out and a Reassembler on the way in.
class MessageChannel
{
  public:
    // Throws std::invalid_argument when max_frame_size cannot hold a header frame
    // plus one data byte.
    MessageChannel(transport::ITransport &t, std::size_t max_frame_size,
                   frag::ReassemblerConfig cfg = {}, util::TimerApi timers = {});

    // A channel is single-use: start() after stop() returns false.
    bool start(OnMessage on_message);
    void stop();

    // One frame when the payload fits, otherwise header + data frames.
    bool send(const frag::Bytes &payload);
    void on_rx(const transport::Frame &f);

    const ChannelStats      &stats() const { return stats_; }
    const frag::Reassembler &reassembler() const { return rx_; }

  private:
    transport::ITransport &tx_;
    std::size_t            max_frame_;
    frag::Reassembler      rx_;
    OnMessage              on_message_;
    ChannelStats           stats_;
};

}  // namespace app
