// ===================== include/http_client.hpp =====================
#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <sys/socket.h>

namespace wanwatch
{
    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

    class HttpError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct HttpRequest
    {
        std::string method = "GET";
        std::string url;
        HttpHeaders headers;
        std::string body;
        int family = AF_UNSPEC; // AF_INET / AF_INET6 pins the connection to one stack
    };

    struct HttpResponse
    {
        int status = 0;
        std::string reason;
        HttpHeaders headers;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
        // Case-insensitive lookup; empty when absent.
        std::string header(const std::string &name) const;
    };

    // Transport seam: the resolver, channels and update checker only see this.
    class HttpClient
    {
    public:
        virtual ~HttpClient() = default;

        // Throws HttpError (or std::runtime_error from DNS) when no response
        // could be obtained. Non-2xx statuses are returned, not thrown.
        virtual HttpResponse send(const HttpRequest &request) = 0;

        HttpResponse get(const std::string &url, const HttpHeaders &headers = {}, int family = AF_UNSPEC);
        HttpResponse postJson(const std::string &url, const std::string &json, const HttpHeaders &headers = {});
    };

    class SocketHttpClient : public HttpClient
    {
    public:
        explicit SocketHttpClient(int timeout_ms, std::string user_agent = "wanwatch");

        HttpResponse send(const HttpRequest &request) override;

    private:
        int timeout_ms_;
        std::string user_agent_;
    };

    std::string build_request(const HttpRequest &request, const std::string &user_agent);
    // Throws HttpError when the status line is missing or malformed.
    HttpResponse parse_http_response(const std::string &raw);
    std::string decode_chunked(const std::string &body);
} // namespace wanwatch
