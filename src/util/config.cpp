#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

bool parse_size(const char *s, std::size_t lo, std::size_t hi, std::size_t &out)
{
    if (!s || !*s || *s == '-' || *s == '+')
        return false;
    errno                  = 0;
    char              *p   = nullptr;
    unsigned long long v   = std::strtoull(s, &p, 10);
    if (errno == ERANGE || !p || *p != '\0')
        return false;
    if (v < lo || v > hi)
        return false;
    out = static_cast<std::size_t>(v);
    return true;
}

static void read_size_env(const char *key, std::size_t lo, std::size_t hi, std::size_t &field)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    std::size_t v = 0;
    if (parse_size(e, lo, hi, v))
    {
        field = v;
        LOG_INFO("Using %s=%zu", key, v);
    }
    else
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %zu..%zu)", key, e, lo, hi);
    }
}

RuntimeConfig load_config_from_env()
{
    RuntimeConfig rc;
    const std::size_t size_max = std::numeric_limits<std::size_t>::max();

    read_size_env("WIREFRAG_MAX_FRAME", constants::MIN_MAX_FRAME_SIZE,
                  constants::MAX_MAX_FRAME_SIZE, rc.max_frame_size);

    std::size_t timeout = rc.timeout_ms;
    read_size_env("WIREFRAG_TIMEOUT_MS", 1, std::numeric_limits<std::uint32_t>::max(), timeout);
    rc.timeout_ms = static_cast<std::uint32_t>(timeout);

    read_size_env("WIREFRAG_MAX_BATCHES", 1, size_max, rc.max_concurrent_batches);
    read_size_env("WIREFRAG_MAX_BYTES", 1, size_max, rc.max_total_reassembly_bytes);

    if (const char *o = std::getenv("WIREFRAG_ORPHANS"))
    {
        if (std::strcmp(o, "buffer") == 0)
            rc.orphan_policy = frag::OrphanPolicy::Buffer;
        else if (std::strcmp(o, "drop") == 0)
            rc.orphan_policy = frag::OrphanPolicy::Drop;
        else
            LOG_WARN("Ignoring invalid WIREFRAG_ORPHANS='%s' (expect buffer|drop)", o);
    }
    return rc;
}

frag::ReassemblerConfig to_reassembler_config(const RuntimeConfig &rc)
{
    frag::ReassemblerConfig cfg;
    cfg.timeout_ms                 = rc.timeout_ms;
    cfg.max_concurrent_batches     = rc.max_concurrent_batches;
    cfg.max_total_reassembly_bytes = rc.max_total_reassembly_bytes;
    cfg.orphan_policy              = rc.orphan_policy;
    return cfg;
}

}  // namespace config
