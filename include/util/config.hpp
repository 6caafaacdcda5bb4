#pragma once
#include <cstddef>
#include <cstdint>

#include "proto/reassembler.hpp"
#include "util/constants.hpp"

namespace config
{

struct RuntimeConfig
{
    std::size_t        max_frame_size         = constants::DEFAULT_MAX_FRAME_SIZE;
    std::uint32_t      timeout_ms             = constants::DEFAULT_TIMEOUT_MS;
    std::size_t        max_concurrent_batches = constants::DEFAULT_MAX_CONCURRENT_BATCHES;
    std::size_t        max_total_reassembly_bytes = constants::DEFAULT_MAX_TOTAL_REASSEMBLY_BYTES;
    frag::OrphanPolicy orphan_policy              = frag::OrphanPolicy::Buffer;
};

// Defaults overridden by WIREFRAG_MAX_FRAME, WIREFRAG_TIMEOUT_MS, WIREFRAG_MAX_BATCHES,
// WIREFRAG_MAX_BYTES and WIREFRAG_ORPHANS. Bad values are logged and ignored.
RuntimeConfig load_config_from_env();

// Strict decimal parse within [lo, hi]; false leaves `out` alone.
bool parse_size(const char *s, std::size_t lo, std::size_t hi, std::size_t &out);

frag::ReassemblerConfig to_reassembler_config(const RuntimeConfig &rc);

}  // namespace config
