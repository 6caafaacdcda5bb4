#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace frag
{

inline constexpr std::size_t BATCH_ID_SIZE = 8;
inline constexpr std::size_t BATCH_KEY_LEN = BATCH_ID_SIZE * 2;  // lowercase hex

// One fragmented transfer; identical across every fragment of that transfer.
using BatchId = std::array<std::uint8_t, BATCH_ID_SIZE>;

// 8 bytes from libsodium's CSPRNG. Throws std::runtime_error if libsodium cannot start.
BatchId generate_batch_id();

// Table key form: 16 lowercase hex characters.
std::string batch_id_to_key(const BatchId &id);

// Inverse of batch_id_to_key. Accepts either hex case; anything but exactly 16 hex
// characters yields nullopt.
std::optional<BatchId> key_to_batch_id(std::string_view key);

}  // namespace frag
