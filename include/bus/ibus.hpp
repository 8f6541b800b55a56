#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace bus
{

// (type tag, value); the tag is the bus signature character ('s', 'o', 'b', 'n', 'u', ...)
using PropValue =
    std::variant<std::string, bool, std::uint8_t, std::int16_t, std::uint16_t, std::int32_t,
                 std::uint32_t, std::int64_t, std::uint64_t>;

struct Property
{
    char      type = 's';
    PropValue value{};
};

using PropertyBag  = std::map<std::string, Property>;
using InterfaceMap = std::map<std::string, PropertyBag>;  // interface name -> properties

struct ManagedObject
{
    std::string  path;
    InterfaceMap interfaces;
};

// enumeration order as returned by the bus
using ManagedObjects = std::vector<ManagedObject>;

enum class CallStatus
{
    Ok,
    ErrorReply,      // method understood and rejected by the peer
    TransportError,  // no connection, timeout, local failure
};

struct CallResult
{
    CallStatus  status = CallStatus::Ok;
    std::string error_name;
    std::string message;

    bool ok() const { return status == CallStatus::Ok; }

    // what a consumer should see: message, else error name, else a generic text
    std::string describe() const
    {
        if (!message.empty())
            return message;
        if (!error_name.empty())
            return error_name;
        return "Unknown error";
    }

    static CallResult success() { return CallResult{}; }
    static CallResult error_reply(std::string name, std::string msg)
    {
        return CallResult{CallStatus::ErrorReply, std::move(name), std::move(msg)};
    }
    static CallResult transport_error(std::string msg)
    {
        return CallResult{CallStatus::TransportError, std::string{}, std::move(msg)};
    }
};

struct MethodCall
{
    std::string              service;
    std::string              path;
    std::string              interface;
    std::string              member;
    std::vector<std::string> path_args{};  // object path ('o') arguments, in order
};

struct MatchRule
{
    std::string type = "signal";
    std::string interface;
    std::string member;
    std::string arg0;  // optional first-argument filter

    std::string to_string() const;
    bool        matches(const std::string &iface,
                        const std::string &mem,
                        const std::string &first_arg) const;
};

struct PropertiesChanged
{
    std::string              path;       // emitting object
    std::string              interface;  // interface whose properties changed
    PropertyBag              changed;
    std::vector<std::string> invalidated;
};

enum class WaitStatus
{
    Signal,
    Timeout,
    Error
};

struct IBus
{
    virtual CallResult get_managed_objects(const std::string &service, ManagedObjects &out) = 0;
    virtual CallResult call_method(const MethodCall &call)                                 = 0;
    virtual CallResult set_property(const std::string &service,
                                    const std::string &path,
                                    const std::string &interface,
                                    const std::string &name,
                                    const Property    &value)                              = 0;
    virtual CallResult add_match(const MatchRule &rule)                                    = 0;
    virtual WaitStatus wait_properties_changed(std::chrono::milliseconds timeout,
                                               PropertiesChanged        &out)              = 0;
    virtual void        close()                                                            = 0;
    virtual std::string name() const { return ""; }
    virtual ~IBus() = default;
};

}  // namespace bus
