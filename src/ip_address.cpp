// ===================== src/ip_address.cpp =====================
#include "ip_address.hpp"

#include <array>
#include <cstdint>
#include <arpa/inet.h>

namespace wanwatch
{
    namespace
    {
        using V6Bytes = std::array<uint8_t, 16>;

        bool parse_v6(const std::string &text, V6Bytes &out)
        {
            if (text.empty() || text.find('%') != std::string::npos) // zone ids are link-scoped
                return false;
            in6_addr a{};
            if (inet_pton(AF_INET6, text.c_str(), &a) != 1)
                return false;
            for (int i = 0; i < 16; ++i)
                out[i] = a.s6_addr[i];
            return true;
        }
    } // namespace

    bool looks_like_ipv4(const std::string &candidate)
    {
        return candidate.find('.') != std::string::npos;
    }

    bool is_valid_ipv4(const std::string &text)
    {
        in_addr a{};
        return inet_pton(AF_INET, text.c_str(), &a) == 1;
    }

    bool is_valid_ipv6(const std::string &text)
    {
        V6Bytes b{};
        return parse_v6(text, b);
    }

    bool is_globally_routable(const std::string &text)
    {
        V6Bytes a{};
        if (!parse_v6(text, a))
            return false;

        // Everything outside 2000::/3 is loopback, unspecified, mapped,
        // link-local, unique-local, multicast or otherwise reserved.
        return (a[0] & 0xE0) == 0x20;
    }
} // namespace wanwatch
