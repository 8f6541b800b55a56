#include "bus/ibus.hpp"

namespace bus
{

std::string MatchRule::to_string() const
{
    std::string out = "type='" + type + "'";
    if (!interface.empty())
        out += ",interface='" + interface + "'";
    if (!member.empty())
        out += ",member='" + member + "'";
    if (!arg0.empty())
        out += ",arg0='" + arg0 + "'";
    return out;
}

// loopback routing: same keys the bus daemon filters on
bool MatchRule::matches(const std::string &iface,
                        const std::string &mem,
                        const std::string &first_arg) const
{
    if (type != "signal")
        return false;
    if (!interface.empty() && interface != iface)
        return false;
    if (!member.empty() && member != mem)
        return false;
    if (!arg0.empty() && arg0 != first_arg)
        return false;
    return true;
}

}  // namespace bus
