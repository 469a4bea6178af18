// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>

namespace wanwatch
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "api.ipify.org"
        int port;           // explicit ":port" or the scheme default
        std::string path;   // path plus query, e.g., "/?format=json"

        explicit ParsedURL(const std::string &url);

        bool isHttps() const { return scheme == "https"; }
        // Scheme is http/https and a host is present.
        bool valid() const;
        // Value for the Host header (port appended only when non-default).
        std::string hostHeader() const;
    };
} // namespace wanwatch
