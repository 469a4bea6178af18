// ===================== include/address_pair.hpp =====================
#pragma once
#include <optional>
#include <string>

namespace wanwatch
{
    // Resolved or stored {ipv4, ipv6} snapshot. Unset means "no observation".
    struct AddressPair
    {
        std::optional<std::string> ipv4;
        std::optional<std::string> ipv6;

        bool empty() const { return !ipv4 && !ipv6; }
    };

    inline bool operator==(const AddressPair &a, const AddressPair &b)
    {
        return a.ipv4 == b.ipv4 && a.ipv6 == b.ipv6;
    }
    inline bool operator!=(const AddressPair &a, const AddressPair &b) { return !(a == b); }

    // "IPv4=1.2.3.4 IPv6=none" for log lines.
    std::string to_string(const AddressPair &pair);
    std::string value_or_none(const std::optional<std::string> &v);
} // namespace wanwatch
