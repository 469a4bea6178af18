// ===================== src/address_resolver.cpp =====================
#include "address_resolver.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"
#include "ip_address.hpp"
#include "string_utils.hpp"

#include <nlohmann/json.hpp>

namespace wanwatch
{
    std::vector<AddressService> default_ipv4_services()
    {
        return {
            {"ipify", "https://api.ipify.org?format=json", {"ip"}, true},
            {"ipapi.co", "https://ipapi.co/json", {"ip"}, false},
            {"ifconfig.me", "https://ifconfig.me/all.json", {"ip_addr", "ip"}, false},
            {"myip.com", "https://api.myip.com", {"ip", "IPv4", "query"}, false},
        };
    }

    std::vector<AddressService> default_ipv6_services()
    {
        return {
            {"ipify6", "https://api6.ipify.org?format=json", {"ip"}, true},
            {"ident.me", "https://v6.ident.me/.json", {"address", "ip"}, true},
            {"icanhazip", "https://ipv6.icanhazip.com", {}, true},
        };
    }

    AddressResolver::AddressResolver(HttpClient &http,
                                     std::vector<AddressService> ipv4_services,
                                     std::vector<AddressService> ipv6_services,
                                     std::string ipinfo_token,
                                     DiagLogger *diag)
        : http_(http),
          ipv4_services_(std::move(ipv4_services)),
          ipv6_services_(std::move(ipv6_services)),
          geo_(http, std::move(ipinfo_token), diag),
          diag_(diag) {}

    std::optional<std::string> AddressResolver::extract_address(const std::string &body,
                                                                const std::vector<std::string> &fields)
    {
        const std::string text = trim(body);
        if (text.empty())
            return std::nullopt;

        auto j = nlohmann::json::parse(text, nullptr, false);
        if (!j.is_discarded())
        {
            if (j.is_object())
            {
                for (const auto &f : fields)
                {
                    auto it = j.find(f);
                    if (it != j.end() && it->is_string())
                    {
                        std::string v = trim(it->get<std::string>());
                        if (!v.empty())
                            return v;
                    }
                }
                return std::nullopt;
            }
            if (j.is_string())
            {
                std::string v = trim(j.get<std::string>());
                return v.empty() ? std::nullopt : std::optional<std::string>(v);
            }
            return std::nullopt;
        }

        // plain-text endpoints answer with the bare address
        if (text.find_first_of(" \t\r\n<>{}\"") != std::string::npos)
            return std::nullopt;
        return text;
    }

    std::optional<std::string> AddressResolver::query(const AddressService &svc, int family) const
    {
        if (diag_)
            diag_->debug("Trying IP service: " + svc.name + " (" + svc.url + ")");

        HttpResponse resp = http_.get(svc.url, {{"Accept", "application/json"}}, family);
        if (!resp.ok())
            throw HttpError("HTTP " + std::to_string(resp.status) + " " + resp.reason);
        return extract_address(resp.body, svc.fields);
    }

    std::optional<std::string> AddressResolver::resolve_ipv4(std::optional<GeoInfo> &geo) const
    {
        geo.reset();
        if (geo_.enabled())
        {
            auto g = geo_.lookup();
            if (g && looks_like_ipv4(g->ip))
            {
                if (diag_)
                    diag_->debug("Retrieved IPv4 with geo data: " + g->ip);
                std::string ip = g->ip;
                geo = std::move(g);
                return ip;
            }
        }

        for (const auto &svc : ipv4_services_)
        {
            try
            {
                auto candidate = query(svc, AF_INET);
                if (!candidate)
                {
                    if (diag_)
                        diag_->warn("IPv4 service " + svc.name + " returned no address");
                    continue;
                }
                if (!looks_like_ipv4(*candidate) && !svc.dedicated)
                {
                    if (diag_)
                        diag_->warn("IPv4 service " + svc.name + " returned a non-IPv4 value: " + *candidate);
                    continue;
                }
                if (diag_)
                    diag_->debug("IPv4 from " + svc.name + ": " + *candidate);
                return candidate;
            }
            catch (const std::exception &e)
            {
                if (diag_)
                    diag_->warn("Failed to get IPv4 from " + svc.name + ": " + e.what());
            }
        }
        if (diag_)
            diag_->warn("All IPv4 services failed");
        return std::nullopt;
    }

    std::optional<std::string> AddressResolver::resolve_ipv6() const
    {
        for (const auto &svc : ipv6_services_)
        {
            try
            {
                auto candidate = query(svc, AF_INET6);
                if (!candidate)
                {
                    if (diag_)
                        diag_->warn("IPv6 service " + svc.name + " returned no address");
                    continue;
                }
                if (!is_globally_routable(*candidate))
                {
                    if (diag_)
                        diag_->warn("IPv6 service " + svc.name + " returned an ineligible address: " + *candidate);
                    continue;
                }
                if (diag_)
                    diag_->debug("IPv6 from " + svc.name + ": " + *candidate);
                return candidate;
            }
            catch (const std::exception &e)
            {
                if (diag_)
                    diag_->warn("Failed to get IPv6 from " + svc.name + ": " + e.what());
            }
        }
        if (diag_)
            diag_->warn("All IPv6 services failed (no IPv6 connectivity?)");
        return std::nullopt;
    }

    Resolution AddressResolver::resolve(bool monitor_ipv4, bool monitor_ipv6) const
    {
        Resolution out;
        if (monitor_ipv4)
            out.addresses.ipv4 = resolve_ipv4(out.geo);
        if (monitor_ipv6)
            out.addresses.ipv6 = resolve_ipv6();

        if ((monitor_ipv4 || monitor_ipv6) && out.addresses.empty())
        {
            std::string what = monitor_ipv4 && monitor_ipv6 ? "IPv4 or IPv6" : (monitor_ipv4 ? "IPv4" : "IPv6");
            throw ResolutionError("Failed to retrieve " + what + " address from all services");
        }
        return out;
    }
} // namespace wanwatch
