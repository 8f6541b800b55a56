#include "bt/registry.hpp"

#include <algorithm>
#include <set>

#include "util/constants.hpp"
#include "util/log.hpp"
#include "util/mac.hpp"

namespace bt
{

bool priority_before(const Device &a, const Device &b)
{
    if (a.connected != b.connected)
        return a.connected;
    if (a.paired != b.paired)
        return a.paired;
    return a.rssi > b.rssi;
}

// ======================================================================
// Function: build_snapshot
// - In: GetManagedObjects result, duplicate policy
// - Out: named devices sorted by priority, ties in enumeration order
// - Note: one bad property bag never fails the whole refresh
// ======================================================================
Snapshot build_snapshot(const bus::ManagedObjects &objects,
                        DuplicatePolicy            policy,
                        std::size_t               *skipped)
{
    const std::string device_iface(constants::DEVICE_IFACE);
    std::size_t       bad = 0;

    Snapshot out;
    out.reserve(objects.size());
    for (const auto &obj : objects)
    {
        auto it = obj.interfaces.find(device_iface);
        if (it == obj.interfaces.end())
            continue;

        std::string why;
        auto        dev = decode_device(obj.path, it->second, &why);
        if (!dev)
        {
            ++bad;
            LOG_WARN("[BT] skip device %s: %s", obj.path.c_str(), why.c_str());
            continue;
        }
        if (!is_named(*dev))
            continue;
        out.push_back(std::move(*dev));
    }

    std::stable_sort(out.begin(), out.end(), priority_before);

    if (policy == DuplicatePolicy::FirstByPriority)
    {
        std::set<std::string> seen;
        out.erase(std::remove_if(out.begin(), out.end(),
                                 [&](const Device &d) {
                                     return !seen.insert(mac::normalize(d.address)).second;
                                 }),
                  out.end());
    }

    if (skipped)
        *skipped = bad;
    return out;
}

std::optional<Device> DeviceRegistry::find_by_path(const std::string &path) const
{
    for (const auto &d : devices_)
    {
        if (d.path == path)
            return d;
    }
    return std::nullopt;
}

std::optional<Device> DeviceRegistry::find_by_address(const std::string &address) const
{
    for (const auto &d : devices_)
    {
        if (mac::equal(d.address, address))
            return d;
    }
    return std::nullopt;
}

}  // namespace bt
