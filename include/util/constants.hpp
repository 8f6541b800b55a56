#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// BlueZ object model
inline constexpr std::string_view BLUEZ_SERVICE        = "org.bluez";
inline constexpr std::string_view ADAPTER_IFACE        = "org.bluez.Adapter1";
inline constexpr std::string_view DEVICE_IFACE         = "org.bluez.Device1";
inline constexpr std::string_view OBJECT_MANAGER_IFACE = "org.freedesktop.DBus.ObjectManager";
inline constexpr std::string_view PROPERTIES_IFACE     = "org.freedesktop.DBus.Properties";
inline constexpr std::string_view PROPERTIES_CHANGED   = "PropertiesChanged";
inline constexpr std::string_view ERR_IN_PROGRESS      = "org.bluez.Error.InProgress";

// Orchestrator timing
inline constexpr std::chrono::milliseconds SCAN_PERIOD{5000};
inline constexpr std::chrono::milliseconds SCAN_TICK{500};
inline constexpr std::chrono::milliseconds ADAPTER_RETRY{1000};  // also the lower bound
inline constexpr std::chrono::milliseconds SIGNAL_WAIT{1000};
inline constexpr std::chrono::milliseconds INACTIVE_POLL{1000};
inline constexpr std::chrono::milliseconds JOIN_TIMEOUT{2000};

// sd-bus
inline constexpr std::size_t   SIGNAL_QUEUE_SIZE     = 10;
inline constexpr std::uint64_t BUS_CALL_TIMEOUT_USEC = 30ULL * 1000 * 1000;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("BTMGR_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/btmgr/ctl.sock";
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
