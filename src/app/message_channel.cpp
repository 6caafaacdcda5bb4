#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "app/message_channel.hpp"
#include "util/log.hpp"

namespace app
{

MessageChannel::MessageChannel(transport::ITransport &t, std::size_t max_frame_size,
                               frag::ReassemblerConfig cfg, util::TimerApi timers)
    : tx_(t), max_frame_(max_frame_size), rx_(std::move(cfg), std::move(timers))
{
    if (max_frame_size <= frag::HEADER_FRAME_SIZE)
        throw std::invalid_argument("max_frame_size must exceed " +
                                    std::to_string(frag::HEADER_FRAME_SIZE));
}

bool MessageChannel::start(OnMessage on_message)
{
    if (rx_.disposed())
    {
        LOG_ERROR("start: channel was stopped and cannot be restarted");
        return false;
    }
    on_message_ = std::move(on_message);

    transport::Settings s{};
    s.role           = tx_.name();
    s.max_frame_size = max_frame_;

    bool ok = tx_.start(s, [this](const transport::Frame &f) { this->on_rx(f); });
    if (!ok)
    {
        LOG_ERROR("start: transport %s failed to start", tx_.name().c_str());
        return false;
    }
    return true;
}

void MessageChannel::stop()
{
    tx_.stop();
    rx_.dispose();
}

bool MessageChannel::send(const frag::Bytes &payload)
{
    std::vector<frag::Bytes> frames;
    // the complete-message frame spends one byte on its marker
    if (!frag::should_fragment(payload.size(), max_frame_ - 1))
    {
        frames.push_back(frag::wrap_complete_message(payload));
    }
    else
    {
        try
        {
            frames = frag::fragment_payload(
                payload, static_cast<std::int64_t>(max_frame_ - frag::DATA_PREFIX_SIZE));
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("send: fragmentation failed: %s", e.what());
            return false;
        }
    }

    for (const auto &f : frames)
    {
        if (!tx_.send(f))
        {
            LOG_ERROR("send: transport.send failed");
            return false;
        }
        ++stats_.frames_sent;
    }
    ++stats_.messages_sent;
    if (frames.size() > 1)
        ++stats_.fragmented_sends;
    LOG_DEBUG("sent %zu bytes in %zu frame(s)", payload.size(), frames.size());
    return true;
}

void MessageChannel::on_rx(const transport::Frame &f)
{
    ++stats_.frames_received;
    auto r = rx_.receive_raw(f);
    switch (r.status)
    {
    case frag::ReceiveStatus::Complete:
        ++stats_.messages_received;
        if (on_message_)
            on_message_(r.data);
        break;
    case frag::ReceiveStatus::Pending:
        break;
    case frag::ReceiveStatus::Error:
        ++stats_.receive_errors;
        LOG_WARN("on_rx: dropping frame (%s: %s)", frag::to_string(r.error.type),
                 r.error.detail.c_str());
        break;
    }
}

}  // namespace app
