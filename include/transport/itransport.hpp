#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Frame   = std::vector<std::uint8_t>;
using OnFrame = std::function<void(const Frame &)>;

struct Settings
{
    std::string role;  // free-form label, "loopback" for the in-process transport
    std::size_t max_frame_size = constants::DEFAULT_MAX_FRAME_SIZE;  // 0 = unlimited
};

// Delivers exact frames or nothing; no retransmission.
struct ITransport
{
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual bool        send(const Frame &one_frame)            = 0;  // frame == 1 transport send
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
