#include "app/daemon_config.hpp"

#include <cstdlib>
#include <cstring>

#include "util/log.hpp"

namespace app
{

const char *bus_kind_name(BusKind k)
{
    return k == BusKind::Loopback ? "loopback" : "bluez";
}

const char *duplicate_policy_name(bt::DuplicatePolicy p)
{
    return p == bt::DuplicatePolicy::FirstByPriority ? "first" : "all";
}

// ======================================================================
// Function: daemon_config_from_env
// - In: BTMGR_BUS (bluez|loopback), BTMGR_DEDUP (all|first); unset or empty
//       means the default
// - Out: parsed settings
// - Note: a typo falls back with a warning instead of stopping the daemon
// ======================================================================
DaemonConfig daemon_config_from_env()
{
    DaemonConfig cfg;

    const char *b = std::getenv("BTMGR_BUS");
    if (b && *b)
    {
        if (std::strcmp(b, "loopback") == 0)
            cfg.bus = BusKind::Loopback;
        else if (std::strcmp(b, "bluez") != 0)
            LOG_WARN("Unknown BTMGR_BUS '%s', using bluez", b);
    }

    const char *d = std::getenv("BTMGR_DEDUP");
    if (d && *d)
    {
        if (std::strcmp(d, "first") == 0)
            cfg.duplicates = bt::DuplicatePolicy::FirstByPriority;
        else if (std::strcmp(d, "all") != 0)
            LOG_WARN("Unknown BTMGR_DEDUP '%s', using all", d);
    }

    return cfg;
}

}  // namespace app
