#include <utility>

#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: an in-process link to exercise the send/receive pipeline without a network.
bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    on_rx_     = std::move(on_rx);
    max_frame_ = s.max_frame_size;
    started_   = true;
    return true;
}

bool LoopbackTransport::send(const Frame &one_frame)
{
    if (!started_ || !on_rx_)
        return false;
    if (max_frame_ != 0 && one_frame.size() > max_frame_)
    {
        LOG_WARN("loopback: frame of %zu bytes exceeds limit %zu", one_frame.size(), max_frame_);
        return false;
    }
    if (holding_)
    {
        held_.push_back(one_frame);
        return true;
    }
    on_rx_(one_frame);
    return true;
}

std::vector<Frame> LoopbackTransport::take_held()
{
    std::vector<Frame> out;
    out.swap(held_);
    return out;
}

bool LoopbackTransport::deliver(const Frame &f)
{
    if (!started_ || !on_rx_)
        return false;
    on_rx_(f);
    return true;
}

void LoopbackTransport::stop()
{
    started_ = false;
    on_rx_   = nullptr;
    held_.clear();
}

bool LoopbackTransport::link_ready() const
{
    return started_;
}

}  // namespace transport
