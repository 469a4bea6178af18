// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace wanwatch
{
    TcpSocket::TcpSocket(int timeout_ms) : sockfd_(-1), timeout_ms_(timeout_ms) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    bool TcpSocket::connectTo(const ResolvedAddress &ra)
    {
        closeSocket();
        sockfd_ = ::socket(ra.family, ra.socktype, ra.protocol);
        if (sockfd_ == -1)
            return false;

        if (timeout_ms_ > 0)
        {
            // On Linux SO_SNDTIMEO also bounds connect().
            timeval tv{};
            tv.tv_sec = timeout_ms_ / 1000;
            tv.tv_usec = (timeout_ms_ % 1000) * 1000;
            (void)::setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            (void)::setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        if (::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ra.addr), ra.addrlen) == 0)
            return true;
        ::close(sockfd_);
        sockfd_ = -1;
        return false;
    }

    bool TcpSocket::sendAll(const std::string &data) const
    {
        if (sockfd_ == -1)
            return false;

        std::size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                return false;
            sent += static_cast<std::size_t>(n);
        }
        return true;
    }

    long TcpSocket::recvSome(char *buf, std::size_t len) const
    {
        if (sockfd_ == -1)
            return -1;
        return static_cast<long>(::recv(sockfd_, buf, len, 0));
    }

    std::string TcpSocket::recvAll() const
    {
        std::string response;
        response.reserve(8192);
        char buf[4096];
        while (true)
        {
            long bytes = recvSome(buf, sizeof(buf));
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace wanwatch
