// tests/test_env.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

struct AllConfigEnv
{
    EnvGuard frame{"WIREFRAG_MAX_FRAME"}, timeout{"WIREFRAG_TIMEOUT_MS"},
        batches{"WIREFRAG_MAX_BATCHES"}, bytes{"WIREFRAG_MAX_BYTES"}, orphans{"WIREFRAG_ORPHANS"};
    AllConfigEnv()
    {
        frame.unset();
        timeout.unset();
        batches.unset();
        bytes.unset();
        orphans.unset();
    }
};

TEST(Env_Config, DefaultsWithoutEnv)
{
    AllConfigEnv env;
    auto         rc = config::load_config_from_env();
    EXPECT_EQ(rc.max_frame_size, constants::DEFAULT_MAX_FRAME_SIZE);
    EXPECT_EQ(rc.timeout_ms, 10000u);
    EXPECT_EQ(rc.max_concurrent_batches, 32u);
    EXPECT_EQ(rc.max_total_reassembly_bytes, 50u * 1024 * 1024);
    EXPECT_EQ(rc.orphan_policy, frag::OrphanPolicy::Buffer);
}

TEST(Env_Config, OverridesAndLogs)
{
    AllConfigEnv env;
    env.frame.set("512");
    env.timeout.set("250");
    env.batches.set("4");
    env.bytes.set("4096");
    env.orphans.set("drop");

    wirefrag::set_log_level(wirefrag::Level::Info);
    testing::internal::CaptureStderr();
    auto        rc  = config::load_config_from_env();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc.max_frame_size, 512u);
    EXPECT_EQ(rc.timeout_ms, 250u);
    EXPECT_EQ(rc.max_concurrent_batches, 4u);
    EXPECT_EQ(rc.max_total_reassembly_bytes, 4096u);
    EXPECT_EQ(rc.orphan_policy, frag::OrphanPolicy::Drop);
    EXPECT_NE(err.find("Using WIREFRAG_MAX_FRAME=512"), std::string::npos);

    auto cfg = config::to_reassembler_config(rc);
    EXPECT_EQ(cfg.timeout_ms, 250u);
    EXPECT_EQ(cfg.max_concurrent_batches, 4u);
    EXPECT_EQ(cfg.max_total_reassembly_bytes, 4096u);
    EXPECT_EQ(cfg.orphan_policy, frag::OrphanPolicy::Drop);
}

TEST(Env_Config, InvalidValuesIgnored)
{
    AllConfigEnv env;
    env.frame.set("8");  // below the minimum
    env.timeout.set("0");
    env.batches.set("-3");
    env.bytes.set("12abc");
    env.orphans.set("keep");

    wirefrag::set_log_level(wirefrag::Level::Info);
    testing::internal::CaptureStderr();
    auto        rc  = config::load_config_from_env();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc.max_frame_size, constants::DEFAULT_MAX_FRAME_SIZE);
    EXPECT_EQ(rc.timeout_ms, constants::DEFAULT_TIMEOUT_MS);
    EXPECT_EQ(rc.max_concurrent_batches, constants::DEFAULT_MAX_CONCURRENT_BATCHES);
    EXPECT_EQ(rc.max_total_reassembly_bytes, constants::DEFAULT_MAX_TOTAL_REASSEMBLY_BYTES);
    EXPECT_EQ(rc.orphan_policy, frag::OrphanPolicy::Buffer);
    EXPECT_NE(err.find("Ignoring invalid WIREFRAG_MAX_FRAME='8'"), std::string::npos);
    EXPECT_NE(err.find("Ignoring invalid WIREFRAG_ORPHANS='keep'"), std::string::npos);
}

TEST(Env_Config, ParseSizeBounds)
{
    std::size_t v = 7;
    EXPECT_TRUE(config::parse_size("32", 32, 64, v));
    EXPECT_EQ(v, 32u);
    EXPECT_FALSE(config::parse_size("65", 32, 64, v));
    EXPECT_FALSE(config::parse_size("", 0, 64, v));
    EXPECT_FALSE(config::parse_size(" 40", 0, 64, v));
    EXPECT_FALSE(config::parse_size("+40", 0, 64, v));
    EXPECT_FALSE(config::parse_size(nullptr, 0, 64, v));
    EXPECT_EQ(v, 32u);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace wirefrag;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    set_log_level(Level::Info);
}

TEST(LogLevel, FromEnv)
{
    using namespace wirefrag;
    EnvGuard g("WIREFRAG_LOG_LEVEL");

    g.set("warn");
    init_log_from_env();
    EXPECT_EQ(global_level(), Level::Warning);

    // unknown names fall back to info, with a warning
    g.set("chatty");
    testing::internal::CaptureStderr();
    init_log_from_env();
    std::string warn = testing::internal::GetCapturedStderr();
    EXPECT_EQ(global_level(), Level::Info);
    EXPECT_NE(warn.find("Ignoring invalid WIREFRAG_LOG_LEVEL=chatty"), std::string::npos);

    set_log_level(Level::Error);
    g.unset();
    init_log_from_env();
    EXPECT_EQ(global_level(), Level::Error);

    set_log_level(Level::Info);
}

TEST(LogLevel, ParseLogLevelNames)
{
    using namespace wirefrag;
    Level lv = Level::Debug;
    EXPECT_TRUE(parse_log_level("err", lv));
    EXPECT_EQ(lv, Level::Error);
    EXPECT_TRUE(parse_log_level("WARNING", lv));
    EXPECT_EQ(lv, Level::Warning);
    EXPECT_FALSE(parse_log_level("system", lv));
    EXPECT_FALSE(parse_log_level(nullptr, lv));
    EXPECT_EQ(lv, Level::Warning);
}
