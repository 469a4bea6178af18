// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"

#include <cctype>

namespace wanwatch
{
    static const int HTTPS_PORT = 443;
    static const int HTTP_PORT = 80;

    static bool all_digits(const std::string &s)
    {
        if (s.empty() || s.size() > 5)
            return false;
        for (unsigned char c : s)
            if (!std::isdigit(c))
                return false;
        return true;
    }

    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            for (auto &c : scheme)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            host_start = scheme_end + 3;
        }

        size_t path_start = url.find_first_of("/?", host_start);
        if (path_start != std::string::npos)
        {
            host = url.substr(host_start, path_start - host_start);
            path = url.substr(path_start);
            if (path[0] == '?')
                path = "/" + path;
        }
        else
        {
            host = url.substr(host_start);
            path = "/";
        }

        port = isHttps() ? HTTPS_PORT : HTTP_PORT;

        // "[v6]:port" or "name:port"
        if (!host.empty() && host[0] == '[')
        {
            size_t close = host.find(']');
            if (close != std::string::npos)
            {
                std::string rest = host.substr(close + 1);
                if (rest.size() > 1 && rest[0] == ':' && all_digits(rest.substr(1)))
                    port = std::stoi(rest.substr(1));
                host = host.substr(1, close - 1);
            }
        }
        else
        {
            size_t colon = host.rfind(':');
            if (colon != std::string::npos && all_digits(host.substr(colon + 1)))
            {
                port = std::stoi(host.substr(colon + 1));
                host = host.substr(0, colon);
            }
        }
    }

    bool ParsedURL::valid() const
    {
        return (scheme == "http" || scheme == "https") && !host.empty() && port > 0 && port <= 65535;
    }

    std::string ParsedURL::hostHeader() const
    {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        const int default_port = isHttps() ? HTTPS_PORT : HTTP_PORT;
        if (port != default_port)
            h += ":" + std::to_string(port);
        return h;
    }
} // namespace wanwatch
