// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <cstddef>
#include <string>
#include "dns_resolver.hpp"

namespace wanwatch
{
    class TcpSocket
    {
        int sockfd_;
        int timeout_ms_;

    public:
        // timeout_ms bounds connect, every send and every receive (0 = no limit).
        explicit TcpSocket(int timeout_ms = 0);
        ~TcpSocket();

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();
        bool connectTo(const ResolvedAddress &ra);
        bool sendAll(const std::string &data) const;
        // Returns bytes read, 0 on orderly close, -1 on error or timeout.
        long recvSome(char *buf, std::size_t len) const;
        std::string recvAll() const;
        int fd() const { return sockfd_; }
    };
} // namespace wanwatch
