//// ===================== File: src/geo_resolver.cpp =====================
#include "geo_resolver.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>

namespace wanwatch
{
    static const char *kIpinfoUrl = "https://ipinfo.io/json";

    GeoResolver::GeoResolver(HttpClient &http, std::string token, DiagLogger *diag)
        : http_(http), token_(std::move(token)), diag_(diag) {}

    std::optional<GeoInfo> GeoResolver::parse(const std::string &body)
    {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;

        auto grab = [&](const char *key)
        {
            auto it = j.find(key);
            return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
        };

        GeoInfo g{};
        g.ip = grab("ip");
        if (g.ip.empty())
            return std::nullopt;
        g.city = grab("city");
        g.region = grab("region");
        g.country = grab("country_name");
        if (g.country.empty())
            g.country = grab("country");
        g.org = grab("org");
        g.timezone = grab("timezone");
        return g;
    }

    std::optional<GeoInfo> GeoResolver::lookup() const
    {
        if (!enabled())
            return std::nullopt;

        try
        {
            // pinned to IPv4: the address returned is our IPv4 WAN address
            HttpResponse resp = http_.get(kIpinfoUrl,
                                          {{"Authorization", "Bearer " + token_}, {"Accept", "application/json"}},
                                          AF_INET);
            if (!resp.ok())
            {
                if (diag_)
                    diag_->warn("ipinfo.io returned HTTP " + std::to_string(resp.status) + ", falling back to simple detection");
                return std::nullopt;
            }
            auto g = parse(resp.body);
            if (!g && diag_)
                diag_->warn("ipinfo.io response not understood, falling back to simple detection");
            return g;
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->warn(std::string("ipinfo.io failed: ") + e.what() + ", falling back to simple detection");
            return std::nullopt;
        }
    }
} // namespace wanwatch
