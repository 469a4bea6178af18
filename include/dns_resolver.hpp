// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

namespace wanwatch
{
    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;
    };

    class DNSResolver
    {
    public:
        // family: AF_UNSPEC, AF_INET or AF_INET6. Throws std::runtime_error when
        // the lookup fails or yields nothing for the requested family.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port, int family = AF_UNSPEC);
    };
} // namespace wanwatch
