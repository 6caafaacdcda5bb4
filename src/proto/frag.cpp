#include <arpa/inet.h>  // htonl, ntohl
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

namespace
{

void put_u32(std::uint8_t *out, std::uint32_t v)
{
    std::uint32_t be = htonl(v);
    std::memcpy(out, &be, sizeof be);
}

std::uint32_t get_u32(const std::uint8_t *in)
{
    std::uint32_t be;
    std::memcpy(&be, in, sizeof be);
    return ntohl(be);
}

bool fail(ParseError *err, ParseErrorCode code, std::string detail)
{
    if (err)
    {
        err->code   = code;
        err->detail = std::move(detail);
    }
    return false;
}

std::size_t ceil_div(std::size_t size, std::int64_t max_fragment_size)
{
    if (max_fragment_size <= 0)
        throw std::invalid_argument("max_fragment_size must be positive");
    const auto step = static_cast<std::uint64_t>(max_fragment_size);
    return static_cast<std::size_t>((size + step - 1) / step);
}

}  // namespace

const char *to_string(ParseErrorCode code)
{
    switch (code)
    {
        case ParseErrorCode::EmptyPayload:
            return "empty_payload";
        case ParseErrorCode::UnknownPrefix:
            return "unknown_prefix";
        case ParseErrorCode::TruncatedHeader:
            return "truncated_header";
        case ParseErrorCode::TruncatedData:
            return "truncated_data";
        case ParseErrorCode::InvalidCount:
            return "invalid_count";
    }
    return "?";
}

const char *to_string(ReassembleErrorCode code)
{
    switch (code)
    {
        case ReassembleErrorCode::MissingFragments:
            return "missing_fragments";
        case ReassembleErrorCode::InvalidIndex:
            return "invalid_index";
        case ReassembleErrorCode::SizeMismatch:
            return "size_mismatch";
    }
    return "?";
}

Bytes wrap_complete_message(const Bytes &data)
{
    Bytes out;
    out.reserve(1 + data.size());
    out.push_back(MESSAGE_COMPLETE);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes create_fragment_header(const BatchId &batch_id, std::uint32_t count, std::uint32_t total_size)
{
    Bytes out(HEADER_FRAME_SIZE);
    out[0] = FRAGMENT_HEADER;
    std::copy(batch_id.begin(), batch_id.end(), out.begin() + 1);
    put_u32(out.data() + 1 + BATCH_ID_SIZE, count);
    put_u32(out.data() + 1 + BATCH_ID_SIZE + 4, total_size);
    return out;
}

Bytes create_fragment_data(const BatchId &batch_id, std::uint32_t index, const Bytes &data)
{
    Bytes out(DATA_PREFIX_SIZE + data.size());
    out[0] = FRAGMENT_DATA;
    std::copy(batch_id.begin(), batch_id.end(), out.begin() + 1);
    put_u32(out.data() + 1 + BATCH_ID_SIZE, index);
    if (!data.empty())
        std::memcpy(out.data() + DATA_PREFIX_SIZE, data.data(), data.size());
    return out;
}

std::vector<Bytes> fragment_payload(const Bytes &data, std::int64_t max_fragment_size)
{
    // an empty payload still travels as one empty data fragment, a zero count never parses
    const std::size_t count = std::max<std::size_t>(1, ceil_div(data.size(), max_fragment_size));
    if (data.size() > std::numeric_limits<std::uint32_t>::max())
    {
        LOG_ERROR("fragment_payload: payload too large (%zu bytes)", data.size());
        throw std::length_error("payload size does not fit in u32");
    }

    const BatchId      id = generate_batch_id();
    const std::size_t  step = static_cast<std::size_t>(max_fragment_size);
    std::vector<Bytes> out;
    out.reserve(count + 1);
    out.push_back(create_fragment_header(id, static_cast<std::uint32_t>(count),
                                         static_cast<std::uint32_t>(data.size())));

    for (std::size_t i = 0; i < count; i++)
    {
        const std::size_t start = i * step;
        const std::size_t take  = std::min(step, data.size() - start);
        out.push_back(create_fragment_data(
            id, static_cast<std::uint32_t>(i),
            Bytes(data.begin() + start, data.begin() + start + take)));
    }
    LOG_DEBUG("fragment_payload: batch=%s size=%zu count=%zu", batch_id_to_key(id).c_str(),
              data.size(), count);
    return out;
}

std::size_t calculate_fragmentation_overhead(std::size_t total_size, std::int64_t max_fragment_size)
{
    // an empty payload still travels as one empty data chunk
    return HEADER_FRAME_SIZE +
           DATA_PREFIX_SIZE * std::max<std::size_t>(1, ceil_div(total_size, max_fragment_size));
}

std::optional<TransportPayload> parse_transport_payload(const Bytes &bytes, ParseError *err)
{
    if (bytes.empty())
    {
        fail(err, ParseErrorCode::EmptyPayload, "empty payload");
        return std::nullopt;
    }

    switch (bytes[0])
    {
        case MESSAGE_COMPLETE:
            return TransportPayload{CompleteMessage{Bytes(bytes.begin() + 1, bytes.end())}};

        case FRAGMENT_HEADER:
        {
            if (bytes.size() != HEADER_FRAME_SIZE)
            {
                fail(err, ParseErrorCode::TruncatedHeader,
                     "fragment header must be " + std::to_string(HEADER_FRAME_SIZE) +
                         " bytes, got " + std::to_string(bytes.size()));
                return std::nullopt;
            }
            FragmentHeader h;
            std::copy(bytes.begin() + 1, bytes.begin() + 1 + BATCH_ID_SIZE, h.batch_id.begin());
            h.count      = get_u32(bytes.data() + 1 + BATCH_ID_SIZE);
            h.total_size = get_u32(bytes.data() + 1 + BATCH_ID_SIZE + 4);
            if (h.count == 0)
            {
                fail(err, ParseErrorCode::InvalidCount, "fragment count cannot be zero");
                return std::nullopt;
            }
            return TransportPayload{h};
        }

        case FRAGMENT_DATA:
        {
            // data portion may be empty
            if (bytes.size() < DATA_PREFIX_SIZE)
            {
                fail(err, ParseErrorCode::TruncatedData,
                     "fragment data needs at least " + std::to_string(DATA_PREFIX_SIZE) +
                         " bytes, got " + std::to_string(bytes.size()));
                return std::nullopt;
            }
            FragmentData d;
            std::copy(bytes.begin() + 1, bytes.begin() + 1 + BATCH_ID_SIZE, d.batch_id.begin());
            d.index = get_u32(bytes.data() + 1 + BATCH_ID_SIZE);
            d.data.assign(bytes.begin() + DATA_PREFIX_SIZE, bytes.end());
            return TransportPayload{std::move(d)};
        }

        default:
        {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned>(bytes[0]));
            fail(err, ParseErrorCode::UnknownPrefix,
                 std::string("unknown transport payload prefix ") + hex);
            return std::nullopt;
        }
    }
}

std::optional<Bytes> reassemble_fragments(const FragmentHeader                 &header,
                                          const std::map<std::uint32_t, Bytes> &fragments,
                                          ReassembleError                      *err)
{
    std::vector<std::uint32_t> missing;
    for (std::uint32_t i = 0; i < header.count; i++)
    {
        if (fragments.find(i) == fragments.end())
            missing.push_back(i);
    }
    if (!missing.empty())
    {
        if (err)
        {
            std::string list;
            for (std::size_t k = 0; k < missing.size() && k < 10; k++)
            {
                if (k)
                    list += ", ";
                list += std::to_string(missing[k]);
            }
            if (missing.size() > 10)
                list += ", ...";
            err->code   = ReassembleErrorCode::MissingFragments;
            err->detail = "missing " + std::to_string(missing.size()) + " fragments: " + list;
            err->missing = std::move(missing);
        }
        return std::nullopt;
    }

    // std::map is ordered, so only the last key can be out of range
    if (!fragments.empty() && fragments.rbegin()->first >= header.count)
    {
        if (err)
        {
            err->code   = ReassembleErrorCode::InvalidIndex;
            err->detail = "invalid fragment index " + std::to_string(fragments.rbegin()->first) +
                          " (count " + std::to_string(header.count) + ")";
        }
        return std::nullopt;
    }

    std::uint64_t actual = 0;
    for (const auto &kv : fragments)
        actual += kv.second.size();
    if (actual != header.total_size)
    {
        if (err)
        {
            err->code     = ReassembleErrorCode::SizeMismatch;
            err->expected = header.total_size;
            err->actual   = actual;
            err->detail   = "size mismatch: expected " + std::to_string(header.total_size) +
                          " bytes, got " + std::to_string(actual);
        }
        return std::nullopt;
    }

    Bytes out;
    out.reserve(header.total_size);
    for (const auto &kv : fragments)
        out.insert(out.end(), kv.second.begin(), kv.second.end());
    return out;
}

}  // namespace frag
