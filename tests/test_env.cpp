// tests/test_env.cpp
// BTMGR_* environment settings: control socket path, bus/dedup selection, log level.
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <optional>
#include <string>

#include "app/daemon_config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace
{

// sets or clears one variable for the scope of a test, restores it afterwards
class ScopedEnv
{
  public:
    explicit ScopedEnv(const char *name) : name_(name)
    {
        if (const char *v = std::getenv(name))
            saved_ = v;
    }
    ~ScopedEnv()
    {
        if (saved_)
            ::setenv(name_.c_str(), saved_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }

    void set(const std::string &v) const { ::setenv(name_.c_str(), v.c_str(), 1); }
    void clear() const { ::unsetenv(name_.c_str()); }

  private:
    std::string                name_;
    std::optional<std::string> saved_;
};

}  // namespace

TEST(DaemonConfig, DefaultsWhenUnset)
{
    ScopedEnv bus("BTMGR_BUS");
    ScopedEnv dedup("BTMGR_DEDUP");
    bus.clear();
    dedup.clear();

    app::DaemonConfig cfg = app::daemon_config_from_env();
    EXPECT_EQ(cfg.bus, app::BusKind::Bluez);
    EXPECT_EQ(cfg.duplicates, bt::DuplicatePolicy::KeepAll);
    EXPECT_STREQ(app::bus_kind_name(cfg.bus), "bluez");
    EXPECT_STREQ(app::duplicate_policy_name(cfg.duplicates), "all");
}

TEST(DaemonConfig, LoopbackAndFirstAreRecognised)
{
    ScopedEnv bus("BTMGR_BUS");
    ScopedEnv dedup("BTMGR_DEDUP");
    bus.set("loopback");
    dedup.set("first");

    app::DaemonConfig cfg = app::daemon_config_from_env();
    EXPECT_EQ(cfg.bus, app::BusKind::Loopback);
    EXPECT_EQ(cfg.duplicates, bt::DuplicatePolicy::FirstByPriority);
    EXPECT_STREQ(app::duplicate_policy_name(cfg.duplicates), "first");
}

TEST(DaemonConfig, ExplicitDefaultsAreQuiet)
{
    ScopedEnv bus("BTMGR_BUS");
    ScopedEnv dedup("BTMGR_DEDUP");
    bus.set("bluez");
    dedup.set("all");
    btmgr::set_log_level_by_name("DEBUG");

    testing::internal::CaptureStderr();
    app::DaemonConfig cfg = app::daemon_config_from_env();
    std::string       err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.bus, app::BusKind::Bluez);
    EXPECT_EQ(cfg.duplicates, bt::DuplicatePolicy::KeepAll);
    EXPECT_EQ(err.find("[WARN]"), std::string::npos);
}

TEST(DaemonConfig, UnknownValuesFallBackWithWarning)
{
    ScopedEnv bus("BTMGR_BUS");
    ScopedEnv dedup("BTMGR_DEDUP");
    bus.set("Loopback");  // case matters
    dedup.set("newest");
    btmgr::set_log_level_by_name("DEBUG");

    testing::internal::CaptureStderr();
    app::DaemonConfig cfg = app::daemon_config_from_env();
    std::string       err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(cfg.bus, app::BusKind::Bluez);
    EXPECT_EQ(cfg.duplicates, bt::DuplicatePolicy::KeepAll);
    EXPECT_NE(err.find("BTMGR_BUS 'Loopback'"), std::string::npos);
    EXPECT_NE(err.find("BTMGR_DEDUP 'newest'"), std::string::npos);
}

TEST(DaemonConfig, EmptyValueMeansDefault)
{
    ScopedEnv bus("BTMGR_BUS");
    ScopedEnv dedup("BTMGR_DEDUP");
    bus.set("");
    dedup.set("");

    app::DaemonConfig cfg = app::daemon_config_from_env();
    EXPECT_EQ(cfg.bus, app::BusKind::Bluez);
    EXPECT_EQ(cfg.duplicates, bt::DuplicatePolicy::KeepAll);
}

TEST(CtlSockPath, EnvOverridesDefault)
{
    ScopedEnv sock("BTMGR_CTL_SOCK");
    sock.set("/tmp/btmgr-env-test.sock");
    btmgr::set_log_level_by_name("DEBUG");

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, "/tmp/btmgr-env-test.sock");
    // the default path is announced, an explicit one is not
    EXPECT_EQ(err.find("Listening on"), std::string::npos);
}

TEST(CtlSockPath, UnderHomeCacheWhenUnset)
{
    ScopedEnv sock("BTMGR_CTL_SOCK");
    ScopedEnv home("HOME");
    sock.clear();
    const auto dir = std::filesystem::temp_directory_path() / "btmgr-env-home";
    home.set(dir.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    const std::string want = (dir / ".cache/btmgr/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find(want), std::string::npos);
}

TEST(LogLevel, ThresholdFromName)
{
    btmgr::set_log_level_by_name("WARN");
    testing::internal::CaptureStderr();
    LOG_INFO("info_hidden_at_warn");
    LOG_WARN("warn_shown_at_warn");
    LOG_SYSTEM("system_shown_at_warn");
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("info_hidden_at_warn"), std::string::npos);
    EXPECT_NE(out.find("warn_shown_at_warn"), std::string::npos);
    EXPECT_NE(out.find("system_shown_at_warn"), std::string::npos);

    btmgr::set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_shown_at_debug");
    out = testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("debug_shown_at_debug"), std::string::npos);
    EXPECT_NE(out.find("[DEBUG]"), std::string::npos);
}
