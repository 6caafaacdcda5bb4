#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "proto/batch_id.hpp"

/*
TX:
codec.encode(msg) = opaque bytes
  -> should_fragment(bytes.size(), threshold) ?
       fragment_payload(bytes, max_fragment_size)   // [header][data 0]..[data n-1]
     : wrap_complete_message(bytes)                 // [0x01][bytes]
        -> transport.send(chunk) for each chunk

RX:
transport.on_rx(chunk)
  -> parse_transport_payload(chunk)  // CompleteMessage | FragmentHeader | FragmentData
      -> Reassembler::receive(payload)
            -> Complete ? codec.decode(data)

Wire layouts, integers big-endian:
  complete  [0x01][payload...]
  header    [0x02][batch_id:8][count:u32][total_size:u32]     17 bytes
  data      [0x03][batch_id:8][index:u32][data...]            13 byte prefix
*/

namespace frag
{

using Bytes = std::vector<std::uint8_t>;

// --- Protocol constants ---
inline constexpr std::uint8_t MESSAGE_COMPLETE = 0x01;
inline constexpr std::uint8_t FRAGMENT_HEADER  = 0x02;
inline constexpr std::uint8_t FRAGMENT_DATA    = 0x03;

inline constexpr std::size_t HEADER_FRAME_SIZE = 1 + BATCH_ID_SIZE + 4 + 4;  // 17
inline constexpr std::size_t DATA_PREFIX_SIZE  = 1 + BATCH_ID_SIZE + 4;      // 13

// --- Wire shapes ---
struct CompleteMessage
{
    Bytes data;
};

struct FragmentHeader
{
    BatchId       batch_id{};
    std::uint32_t count{0};  // > 0
    std::uint32_t total_size{0};
};

struct FragmentData
{
    BatchId       batch_id{};
    std::uint32_t index{0};
    Bytes         data;
};

// Every consumer must handle all three shapes (std::visit).
using TransportPayload = std::variant<CompleteMessage, FragmentHeader, FragmentData>;

// --- Errors ---
enum class ParseErrorCode
{
    EmptyPayload,
    UnknownPrefix,
    TruncatedHeader,
    TruncatedData,
    InvalidCount,
};

struct ParseError
{
    ParseErrorCode code{ParseErrorCode::EmptyPayload};
    std::string    detail;
};

enum class ReassembleErrorCode
{
    MissingFragments,
    InvalidIndex,
    SizeMismatch,
};

struct ReassembleError
{
    ReassembleErrorCode        code{ReassembleErrorCode::MissingFragments};
    std::vector<std::uint32_t> missing;  // MissingFragments only
    std::uint64_t              expected{0};
    std::uint64_t              actual{0};
    std::string                detail;
};

const char *to_string(ParseErrorCode code);
const char *to_string(ReassembleErrorCode code);

// TX
Bytes              wrap_complete_message(const Bytes &data);
Bytes              create_fragment_header(const BatchId &batch_id,
                                          std::uint32_t  count,
                                          std::uint32_t  total_size);
Bytes              create_fragment_data(const BatchId &batch_id,
                                        std::uint32_t  index,
                                        const Bytes   &data);
// Header chunk followed by ceil(size / max_fragment_size) data chunks under a fresh
// batch id; an empty payload gets one empty data chunk. Throws std::invalid_argument
// if max_fragment_size <= 0 and std::length_error if the payload does not fit the u32
// wire fields.
std::vector<Bytes> fragment_payload(const Bytes &data, std::int64_t max_fragment_size);

inline bool should_fragment(std::size_t payload_size, std::size_t threshold_size)
{
    return payload_size > threshold_size;
}

// 17 + 13 * max(1, ceil(total_size / max_fragment_size)), the exact byte cost
// fragment_payload() adds. Throws std::invalid_argument if
// max_fragment_size <= 0.
std::size_t calculate_fragmentation_overhead(std::size_t  total_size,
                                             std::int64_t max_fragment_size);

// RX
std::optional<TransportPayload> parse_transport_payload(const Bytes &bytes,
                                                        ParseError  *err = nullptr);
std::optional<Bytes>            reassemble_fragments(const FragmentHeader                 &header,
                                                     const std::map<std::uint32_t, Bytes> &fragments,
                                                     ReassembleError *err = nullptr);

}  // namespace frag
