#include <sodium.h>
#include <stdexcept>

#include "proto/batch_id.hpp"
#include "util/log.hpp"

namespace frag
{

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

BatchId generate_batch_id()
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("generate_batch_id: sodium_init failed");
        throw std::runtime_error("libsodium initialisation failed");
    }
    BatchId id{};
    randombytes_buf(id.data(), id.size());
    return id;
}

std::string batch_id_to_key(const BatchId &id)
{
    char hex[BATCH_KEY_LEN + 1];
    sodium_bin2hex(hex, sizeof(hex), id.data(), id.size());
    return std::string(hex, BATCH_KEY_LEN);
}

std::optional<BatchId> key_to_batch_id(std::string_view key)
{
    if (key.size() != BATCH_KEY_LEN)
        return std::nullopt;

    BatchId     id{};
    std::size_t out_len = 0;
    const char *end     = nullptr;
    if (sodium_hex2bin(id.data(), id.size(), key.data(), key.size(), /*ignore=*/nullptr,
                       &out_len, &end) != 0 ||
        out_len != id.size() || end != key.data() + key.size())
    {
        return std::nullopt;
    }
    return id;
}

}  // namespace frag
