// include/util/mac.hpp
#pragma once
#include <cctype>
#include <string>

namespace mac
{

// "AA:BB:CC:DD:EE:FF", either case
inline bool is_valid(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

inline std::string normalize(std::string mac)
{
    for (auto &c : mac)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return mac;
}

inline bool equal(const std::string &a, const std::string &b)
{
    return normalize(a) == normalize(b);
}

}  // namespace mac
