#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "bt/device.hpp"
#include "bus/ibus.hpp"

namespace bt
{

using Snapshot = std::vector<Device>;

// What to do with distinct object paths that report the same address
// (e.g. one device seen over BR/EDR and LE).
enum class DuplicatePolicy
{
    KeepAll,          // every object path is listed
    FirstByPriority,  // one entry per address: the first after sorting
};

// connected desc, paired desc, rssi desc
bool priority_before(const Device &a, const Device &b);

// Device1 objects -> decoded, named, stably sorted snapshot.
// Objects that fail to decode are skipped and counted in *skipped.
Snapshot build_snapshot(const bus::ManagedObjects &objects,
                        DuplicatePolicy            policy,
                        std::size_t               *skipped = nullptr);

// Latest snapshot only; replaced wholesale, never patched. Not locked: the owner
// serializes access.
class DeviceRegistry
{
  public:
    void            replace(Snapshot next) { devices_ = std::move(next); }
    const Snapshot &snapshot() const { return devices_; }
    std::size_t     size() const { return devices_.size(); }

    std::optional<Device> find_by_path(const std::string &path) const;
    std::optional<Device> find_by_address(const std::string &address) const;

  private:
    Snapshot devices_;
};

}  // namespace bt
