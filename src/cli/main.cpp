#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "util/mac.hpp"

namespace
{

std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  btmgrctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  active on|off                 show/hide: refresh loop + scan\n"
                         "  scan on|off\n"
                         "  list\n"
                         "  status\n"
                         "  select AA:BB:CC:DD:EE:FF      pair, connect or disconnect\n"
                         "  pair AA:BB:CC:DD:EE:FF\n"
                         "  connect AA:BB:CC:DD:EE:FF\n"
                         "  disconnect AA:BB:CC:DD:EE:FF\n"
                         "  forget AA:BB:CC:DD:EE:FF      then confirm|cancel\n"
                         "  confirm\n"
                         "  cancel\n"
                         "  quit\n");
}

int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        std::fprintf(stderr, "error: command must be a single non-empty line\n");
        return exitc::bad_args;
    }
    if (!ipc::send_line(sock, line + "\n"))
    {
        std::fprintf(stderr, "error: cannot reach btmgrd at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return exitc::ok;
}

using Sender = std::function<int(const std::string &)>;

int run_cmd(const std::string &cmd, const std::vector<std::string> &args, const Sender &send_line)
{
    auto no_args = [&](const char *wire) {
        return [&, wire]() -> int {
            if (args.size() != 1)
            {
                print_usage();
                return exitc::bad_args;
            }
            return send_line(wire);
        };
    };
    auto on_off = [&](const char *wire) {
        return [&, wire]() -> int {
            if (args.size() != 2)
            {
                print_usage();
                return exitc::bad_args;
            }
            std::string v = to_lower(args[1]);
            if (v != "on" && v != "off")
            {
                std::fprintf(stderr, "error: %s expects 'on' or 'off'\n", args[0].c_str());
                return exitc::bad_args;
            }
            return send_line(std::string(wire) + " " + v);
        };
    };
    auto with_mac = [&](const char *wire) {
        return [&, wire]() -> int {
            if (args.size() != 2)
            {
                print_usage();
                return exitc::bad_args;
            }
            if (!mac::is_valid(args[1]))
            {
                std::fprintf(stderr, "error: invalid MAC address: %s\n", args[1].c_str());
                return exitc::bad_args;
            }
            return send_line(std::string(wire) + " " + mac::normalize(args[1]));
        };
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"active", on_off("ACTIVE")},
        {"scan", on_off("SCAN")},
        {"list", no_args("LIST")},
        {"status", no_args("STATUS")},
        {"select", with_mac("SELECT")},
        {"pair", with_mac("PAIR")},
        {"connect", with_mac("CONNECT")},
        {"disconnect", with_mac("DISCONNECT")},
        {"forget", with_mac("FORGET")},
        {"confirm", no_args("CONFIRM")},
        {"cancel", no_args("CANCEL")},
        {"quit", no_args("QUIT")},
    };

    auto it = cmd_map.find(to_lower(cmd));
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
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // --sock beats BTMGR_CTL_SOCK beats the default
    std::string              sock;
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
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                print_usage();
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
            continue;
        }
        args.push_back(std::move(a));
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };
    return run_cmd(args[0], args, sender);
}
