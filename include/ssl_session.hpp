// ===================== include/ssl_session.hpp =====================
#pragma once
#include <cstddef>
#include <string>
#include <openssl/ssl.h>

namespace wanwatch
{
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;
        std::string last_error_;

    public:
        // verify_peer checks the certificate chain against the system store
        // and the certificate name against the handshake hostname.
        explicit SslSession(bool verify_peer = true);
        ~SslSession();

        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        bool handshake(int sockfd, const std::string &hostname);
        bool sendAll(const std::string &data) const;
        long recvSome(char *buf, std::size_t len) const;
        std::string recvAll() const;
        const std::string &lastError() const { return last_error_; }
    };
} // namespace wanwatch
