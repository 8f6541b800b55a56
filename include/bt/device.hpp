#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "bus/ibus.hpp"

namespace bt
{

enum class DeviceType
{
    Unknown = 0,
    Controller,
    Audio,
    Keyboard,
    Mouse,
    Other
};

const char *device_type_name(DeviceType t);

struct Device
{
    std::string   address;  // identity, stable across refreshes
    std::string   name;
    bool          paired    = false;
    bool          connected = false;
    bool          trusted   = false;
    DeviceType    type      = DeviceType::Unknown;
    std::int16_t  rssi      = -100;
    std::uint32_t device_class = 0;
    std::string   path;  // current object path, may change between enumerations
};

// Name keywords first (case-insensitive), then the Class of Device major/minor fields.
DeviceType classify_device(std::uint32_t device_class, std::string_view name);

// Decode one Device1 property bag. Absent keys take their schema default; a present key
// with an unexpected type tag fails this device only (reason in *error when given).
std::optional<Device> decode_device(const std::string       &path,
                                    const bus::PropertyBag &props,
                                    std::string            *error = nullptr);

// unnamed devices (empty, or name == address) are scan noise
inline bool is_named(const Device &d)
{
    return !d.name.empty() && d.name != d.address;
}

}  // namespace bt
