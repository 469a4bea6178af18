// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <stdexcept>

namespace wanwatch
{
    static std::string drain_openssl_errors()
    {
        std::string out;
        unsigned long code;
        while ((code = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            if (!out.empty())
                out += "; ";
            out += buf;
        }
        return out;
    }

    SslSession::SslSession(bool verify_peer) : ctx_(nullptr), ssl_(nullptr)
    {
        // OpenSSL 1.1+ auto-inits; these are no-ops/safe.
        SSL_library_init();
        SSL_load_error_strings();
        OpenSSL_add_all_algorithms();

        const SSL_METHOD *method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);
        if (!ctx_)
            throw std::runtime_error("Failed to create SSL_CTX: " + drain_openssl_errors());

        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        if (verify_peer)
        {
            if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
                throw std::runtime_error("Failed to load system CA store: " + drain_openssl_errors());
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        }
    }

    SslSession::~SslSession()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    bool SslSession::handshake(int sockfd, const std::string &hostname)
    {
        ssl_ = SSL_new(ctx_);
        if (!ssl_)
        {
            last_error_ = "SSL_new failed: " + drain_openssl_errors();
            return false;
        }
        SSL_set_fd(ssl_, sockfd);
        SSL_set_tlsext_host_name(ssl_, hostname.c_str());
        SSL_set1_host(ssl_, hostname.c_str());
        if (SSL_connect(ssl_) <= 0)
        {
            last_error_ = "TLS handshake with " + hostname + " failed: " + drain_openssl_errors();
            long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK)
                last_error_ += std::string(" (") + X509_verify_cert_error_string(verify) + ")";
            return false;
        }
        return true;
    }

    bool SslSession::sendAll(const std::string &data) const
    {
        if (!ssl_)
            return false;
        int n = SSL_write(ssl_, data.c_str(), static_cast<int>(data.size()));
        return n == static_cast<int>(data.size());
    }

    long SslSession::recvSome(char *buf, std::size_t len) const
    {
        if (!ssl_)
            return -1;
        return SSL_read(ssl_, buf, static_cast<int>(len));
    }

    std::string SslSession::recvAll() const
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
