#include "bt/device.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace bt
{
namespace
{

// Class of Device (Bluetooth Assigned Numbers, Baseband)
constexpr std::uint32_t MAJOR_AUDIO_VIDEO  = 0x04;
constexpr std::uint32_t MAJOR_PERIPHERAL   = 0x05;
constexpr std::uint32_t MINOR_JOYSTICK     = 0x01;
constexpr std::uint32_t MINOR_GAMEPAD      = 0x02;
constexpr std::uint32_t MINOR_KEYBOARD     = 0x10;
constexpr std::uint32_t MINOR_POINTING     = 0x20;

struct Keyword
{
    const char *needle;
    DeviceType  type;
};

// order matters: first hit wins
constexpr std::array<Keyword, 10> NAME_KEYWORDS = {{
    {"controller", DeviceType::Controller},
    {"dualsense", DeviceType::Controller},
    {"dualshock", DeviceType::Controller},
    {"gamepad", DeviceType::Controller},
    {"keyboard", DeviceType::Keyboard},
    {"mouse", DeviceType::Mouse},
    {"airpods", DeviceType::Audio},
    {"headphone", DeviceType::Audio},
    {"speaker", DeviceType::Audio},
    {"audio", DeviceType::Audio},
}};

struct PropertySpec
{
    const char   *name;
    char          type;
    bus::PropValue fallback;
};

// Device1 decode schema
const std::array<PropertySpec, 8> &device_schema()
{
    static const std::array<PropertySpec, 8> schema = {{
        {"Address", 's', std::string{}},
        {"Name", 's', std::string{}},
        {"Alias", 's', std::string{}},
        {"Paired", 'b', false},
        {"Connected", 'b', false},
        {"Trusted", 'b', false},
        {"Class", 'u', std::uint32_t{0}},
        {"RSSI", 'n', std::int16_t{-100}},
    }};
    return schema;
}

std::string lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

const char *device_type_name(DeviceType t)
{
    switch (t)
    {
        case DeviceType::Unknown:
            return "unknown";
        case DeviceType::Controller:
            return "controller";
        case DeviceType::Audio:
            return "audio";
        case DeviceType::Keyboard:
            return "keyboard";
        case DeviceType::Mouse:
            return "mouse";
        case DeviceType::Other:
            return "other";
    }
    return "?";
}

DeviceType classify_device(std::uint32_t device_class, std::string_view name)
{
    const std::string n = lower(name);
    for (const auto &kw : NAME_KEYWORDS)
    {
        if (n.find(kw.needle) != std::string::npos)
            return kw.type;
    }

    const std::uint32_t major = (device_class >> 8) & 0x1F;
    const std::uint32_t minor = (device_class >> 2) & 0x3F;
    if (major == MAJOR_PERIPHERAL)
    {
        if (minor == MINOR_JOYSTICK || minor == MINOR_GAMEPAD)
            return DeviceType::Controller;
        if (minor == MINOR_KEYBOARD)
            return DeviceType::Keyboard;
        if (minor == MINOR_POINTING)
            return DeviceType::Mouse;
    }
    else if (major == MAJOR_AUDIO_VIDEO)
    {
        return DeviceType::Audio;
    }
    return DeviceType::Other;
}

// ======================================================================
// Function: decode_device
// - In: object path and its org.bluez.Device1 property bag
// - Out: Device, or nullopt when a known key carries the wrong type
// - Note: validates the whole bag against the schema once, then reads
// ======================================================================
std::optional<Device> decode_device(const std::string       &path,
                                    const bus::PropertyBag &props,
                                    std::string            *error)
{
    bus::PropertyBag resolved;
    for (const auto &spec : device_schema())
    {
        auto it = props.find(spec.name);
        if (it == props.end())
            continue;
        if (it->second.type != spec.type || it->second.value.index() != spec.fallback.index())
        {
            if (error)
                *error = std::string("property ") + spec.name + " has type '" +
                         it->second.type + "', expected '" + spec.type + "'";
            return std::nullopt;
        }
        resolved.emplace(spec.name, it->second);
    }

    auto get = [&](const char *key) -> const bus::PropValue & {
        auto it = resolved.find(key);
        if (it != resolved.end())
            return it->second.value;
        for (const auto &spec : device_schema())
        {
            if (std::string_view(spec.name) == key)
                return spec.fallback;
        }
        static const bus::PropValue none{};
        return none;
    };

    Device d;
    d.path         = path;
    d.address      = std::get<std::string>(get("Address"));
    d.paired       = std::get<bool>(get("Paired"));
    d.connected    = std::get<bool>(get("Connected"));
    d.trusted      = std::get<bool>(get("Trusted"));
    d.device_class = std::get<std::uint32_t>(get("Class"));
    d.rssi         = std::get<std::int16_t>(get("RSSI"));

    if (resolved.count("Name"))
        d.name = std::get<std::string>(get("Name"));
    else if (resolved.count("Alias"))
        d.name = std::get<std::string>(get("Alias"));
    else
        d.name = d.address;

    d.type = classify_device(d.device_class, d.name);
    return d;
}

}  // namespace bt
