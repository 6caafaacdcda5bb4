#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include "proto/batch_id.hpp"
#include "proto/frag.hpp"
#include "proto/reassembler.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  wirefragctl [--max-frame <bytes>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  overhead <payload_size> <max_fragment_size>\n"
                         "  split <in_file> <out_dir>\n"
                         "  join <out_file> <chunk_file>...\n"
                         "  inspect <chunk_file>\n");
}

static bool read_file(const std::string &path, frag::Bytes &out)
{
    std::FILE *f = std::fopen(path.c_str(), "rb");
    if (!f)
        return false;
    out.clear();
    std::uint8_t buf[4096];
    size_t       n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
        out.insert(out.end(), buf, buf + n);
    const bool ok = !std::ferror(f);
    std::fclose(f);
    return ok;
}

static bool write_file(const std::string &path, const frag::Bytes &data)
{
    std::FILE *f = std::fopen(path.c_str(), "wb");
    if (!f)
        return false;
    const bool wrote = data.empty() || std::fwrite(data.data(), 1, data.size(), f) == data.size();
    const bool closed = std::fclose(f) == 0;
    return wrote && closed;
}

static std::string chunk_name(size_t i)
{
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%05zu.bin", i);
    return name;
}

static int cmd_overhead(const std::vector<std::string> &args)
{
    if (args.size() != 3)
    {
        print_usage();
        return exitc::bad_args;
    }
    size_t total = 0, max_frag = 0;
    if (!config::parse_size(args[1].c_str(), 0, UINT32_MAX, total) ||
        !config::parse_size(args[2].c_str(), 1, UINT32_MAX, max_frag))
    {
        std::fprintf(stderr, "error: sizes must be decimal integers, max_fragment_size >= 1\n");
        return exitc::bad_args;
    }
    const size_t overhead =
        frag::calculate_fragmentation_overhead(total, static_cast<std::int64_t>(max_frag));
    const size_t fragments = (overhead - frag::HEADER_FRAME_SIZE) / frag::DATA_PREFIX_SIZE;
    std::printf("fragments=%zu overhead=%zu\n", fragments, overhead);
    return exitc::ok;
}

static int cmd_split(const std::vector<std::string> &args, size_t max_frame)
{
    if (args.size() != 3)
    {
        print_usage();
        return exitc::bad_args;
    }
    frag::Bytes payload;
    if (!read_file(args[1], payload))
    {
        std::fprintf(stderr, "error: cannot read %s\n", args[1].c_str());
        return exitc::io_error;
    }

    std::vector<frag::Bytes> chunks;
    if (!frag::should_fragment(payload.size(), max_frame - 1))
    {
        chunks.push_back(frag::wrap_complete_message(payload));
    }
    else
    {
        try
        {
            chunks = frag::fragment_payload(
                payload, static_cast<std::int64_t>(max_frame - frag::DATA_PREFIX_SIZE));
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "error: %s\n", e.what());
            return exitc::bad_input;
        }
    }

    for (size_t i = 0; i < chunks.size(); ++i)
    {
        const std::string path = args[2] + "/" + chunk_name(i);
        if (!write_file(path, chunks[i]))
        {
            std::fprintf(stderr, "error: cannot write %s\n", path.c_str());
            return exitc::io_error;
        }
    }
    std::printf("chunks=%zu\n", chunks.size());
    return exitc::ok;
}

static int cmd_join(const std::vector<std::string> &args)
{
    if (args.size() < 3)
    {
        print_usage();
        return exitc::bad_args;
    }
    frag::Reassembler rx(config::to_reassembler_config(config::load_config_from_env()));

    for (size_t i = 2; i < args.size(); ++i)
    {
        frag::Bytes chunk;
        if (!read_file(args[i], chunk))
        {
            std::fprintf(stderr, "error: cannot read %s\n", args[i].c_str());
            return exitc::io_error;
        }
        auto r = rx.receive_raw(chunk);
        if (r.status == frag::ReceiveStatus::Error)
        {
            std::fprintf(stderr, "error: %s: %s (%s)\n", args[i].c_str(),
                         frag::to_string(r.error.type), r.error.detail.c_str());
            return exitc::bad_input;
        }
        if (r.status == frag::ReceiveStatus::Complete)
        {
            if (!write_file(args[1], r.data))
            {
                std::fprintf(stderr, "error: cannot write %s\n", args[1].c_str());
                return exitc::io_error;
            }
            std::printf("bytes=%zu\n", r.data.size());
            return exitc::ok;
        }
    }
    std::fprintf(stderr, "error: %zu batch(es) still incomplete\n", rx.pending_batch_count());
    return exitc::incomplete;
}

static int cmd_inspect(const std::vector<std::string> &args)
{
    if (args.size() != 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    frag::Bytes chunk;
    if (!read_file(args[1], chunk))
    {
        std::fprintf(stderr, "error: cannot read %s\n", args[1].c_str());
        return exitc::io_error;
    }
    frag::ParseError err;
    auto             p = frag::parse_transport_payload(chunk, &err);
    if (!p)
    {
        std::printf("invalid %s: %s\n", frag::to_string(err.code), err.detail.c_str());
        return exitc::bad_input;
    }
    std::visit(
        [](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, frag::CompleteMessage>)
                std::printf("complete size=%zu\n", v.data.size());
            else if constexpr (std::is_same_v<T, frag::FragmentHeader>)
                std::printf("header batch=%s count=%" PRIu32 " total_size=%" PRIu32 "\n",
                            frag::batch_id_to_key(v.batch_id).c_str(), v.count, v.total_size);
            else
                std::printf("data batch=%s index=%" PRIu32 " size=%zu\n",
                            frag::batch_id_to_key(v.batch_id).c_str(), v.index, v.data.size());
        },
        *p);
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args, size_t max_frame)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"overhead", [&]() -> int { return cmd_overhead(args); }},
        {"split", [&]() -> int { return cmd_split(args, max_frame); }},
        {"join", [&]() -> int { return cmd_join(args); }},
        {"inspect", [&]() -> int { return cmd_inspect(args); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    wirefrag::init_log_from_env();

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // environment first, then --max-frame
    size_t max_frame = config::load_config_from_env().max_frame_size;

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--max-frame")
        {
            if (i + 1 >= argc ||
                !config::parse_size(argv[i + 1], constants::MIN_MAX_FRAME_SIZE,
                                    constants::MAX_MAX_FRAME_SIZE, max_frame))
            {
                std::fprintf(stderr, "error: --max-frame expects %zu..%zu\n",
                             constants::MIN_MAX_FRAME_SIZE, constants::MAX_MAX_FRAME_SIZE);
                return exitc::bad_args;
            }
            ++i;
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    try
    {
        return run_cmd(args[0], args, max_frame);
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("%s", e.what());
        return exitc::bad_input;
    }
}
