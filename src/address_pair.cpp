// ===================== src/address_pair.cpp =====================
#include "address_pair.hpp"

namespace wanwatch
{
    std::string value_or_none(const std::optional<std::string> &v)
    {
        return v ? *v : std::string("None");
    }

    std::string to_string(const AddressPair &pair)
    {
        return "IPv4=" + value_or_none(pair.ipv4) + " IPv6=" + value_or_none(pair.ipv6);
    }
} // namespace wanwatch
