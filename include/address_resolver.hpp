// ===================== include/address_resolver.hpp =====================
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "address_pair.hpp"
#include "geo_resolver.hpp"

namespace wanwatch
{
    class DiagLogger;
    class HttpClient;

    // One public "what is my address" endpoint.
    struct AddressService
    {
        std::string name;
        std::string url;
        std::vector<std::string> fields; // JSON keys tried in order
        bool dedicated = false;          // endpoint only ever answers with its own family
    };

    std::vector<AddressService> default_ipv4_services();
    std::vector<AddressService> default_ipv6_services();

    struct Resolution
    {
        AddressPair addresses;
        std::optional<GeoInfo> geo;
    };

    // Nothing could be resolved for any enabled protocol.
    class ResolutionError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class AddressResolver
    {
    public:
        AddressResolver(HttpClient &http,
                        std::vector<AddressService> ipv4_services,
                        std::vector<AddressService> ipv6_services,
                        std::string ipinfo_token = {},
                        DiagLogger *diag = nullptr);

        // Throws ResolutionError when every enabled protocol came back empty.
        Resolution resolve(bool monitor_ipv4, bool monitor_ipv6) const;

        // Non-fatal per-protocol lookups; nullopt means no observation this cycle.
        std::optional<std::string> resolve_ipv4(std::optional<GeoInfo> &geo) const;
        std::optional<std::string> resolve_ipv6() const;

        // Pulls the address out of a service body: first matching JSON field,
        // or the whole trimmed body when it is a bare token.
        static std::optional<std::string> extract_address(const std::string &body,
                                                          const std::vector<std::string> &fields);

    private:
        std::optional<std::string> query(const AddressService &svc, int family) const;

        HttpClient &http_;
        std::vector<AddressService> ipv4_services_;
        std::vector<AddressService> ipv6_services_;
        GeoResolver geo_;
        DiagLogger *diag_;
    };
} // namespace wanwatch
