// ===================== include/ip_address.hpp =====================
#pragma once
#include <string>

namespace wanwatch
{
    // Loose plausibility check used on lookup-service output: has a '.' separator.
    bool looks_like_ipv4(const std::string &candidate);

    bool is_valid_ipv4(const std::string &text);
    bool is_valid_ipv6(const std::string &text);

    // True only for global unicast IPv6 (2000::/3). Malformed input returns false.
    bool is_globally_routable(const std::string &text);
} // namespace wanwatch
