#pragma once
#include <cstddef>
#include <cstdint>

namespace constants
{
// Data channels cap messages near 16KB; a frame is one transport send.
inline constexpr std::size_t DEFAULT_MAX_FRAME_SIZE = 16 * 1024;
inline constexpr std::size_t MIN_MAX_FRAME_SIZE     = 32;
inline constexpr std::size_t MAX_MAX_FRAME_SIZE     = 16 * 1024 * 1024;

// Reassembly limits
inline constexpr std::uint32_t DEFAULT_TIMEOUT_MS                 = 10000;
inline constexpr std::size_t   DEFAULT_MAX_CONCURRENT_BATCHES     = 32;
inline constexpr std::size_t   DEFAULT_MAX_TOTAL_REASSEMBLY_BYTES = 50 * 1024 * 1024;

}  // namespace constants
