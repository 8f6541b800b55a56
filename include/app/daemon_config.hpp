#pragma once
#include <string>

#include "bt/registry.hpp"

namespace app
{

enum class BusKind
{
    Bluez,     // two system-bus connections
    Loopback,  // in-process demo adapter
};

// Daemon settings read from BTMGR_BUS and BTMGR_DEDUP.
struct DaemonConfig
{
    BusKind             bus        = BusKind::Bluez;
    bt::DuplicatePolicy duplicates = bt::DuplicatePolicy::KeepAll;
};

const char *bus_kind_name(BusKind k);
const char *duplicate_policy_name(bt::DuplicatePolicy p);

// unknown values are logged and replaced by the default
DaemonConfig daemon_config_from_env();

}  // namespace app
