// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/exitcodes.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines;

static void on_line_cb(const std::string &line)
{
    std::lock_guard<std::mutex> lockguard(g_mu);
    g_lines.push_back(line);
}

static std::string temp_sock_path(const char *tag)
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/btmgr-cli-" + tag + "-" + std::to_string(::getpid()) + ".sock";
}

static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "./bin/btmgrctl --sock " + sock + " " + args + " 2>/dev/null";
    int         rc  = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, CommandsReachDaemon)
{
    test_cli::g_lines.clear();
    const auto sock = test_cli::temp_sock_path("ok");

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    EXPECT_EQ(test_cli::run_cli(sock, "active on"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "SCAN OFF"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "list"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "pair aa:bb:cc:dd:ee:ff"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "forget AA:BB:CC:DD:EE:FF"), exitc::ok);
    EXPECT_EQ(test_cli::run_cli(sock, "confirm"), exitc::ok);
    // rejected locally, never sent
    EXPECT_EQ(test_cli::run_cli(sock, "connect not-a-mac"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "scan maybe"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "status extra"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "frobnicate"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli(sock, "quit"), exitc::ok);

    th.join();
    ASSERT_TRUE(server_done.load());

    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        EXPECT_EQ(test_cli::g_lines,
                  (std::vector<std::string>{"ACTIVE on", "SCAN off", "LIST",
                                            "PAIR AA:BB:CC:DD:EE:FF",
                                            "FORGET AA:BB:CC:DD:EE:FF", "CONFIRM", "QUIT"}));
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(CLI, NoDaemonIsExitCode3)
{
    const auto sock = test_cli::temp_sock_path("none");
    EXPECT_EQ(test_cli::run_cli(sock, "status"), exitc::no_server);
}
