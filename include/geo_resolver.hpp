//// ===================== File: include/geo_resolver.hpp =====================
#pragma once
#include <string>
#include <optional>

namespace wanwatch {
class DiagLogger;
class HttpClient;

struct GeoInfo {
std::string ip;
std::string city;
std::string region;
std::string country; // full name when the provider has one, else the code
std::string org; // e.g., "AS15169 Google LLC"
std::string timezone; // e.g., "Europe/Berlin"
};

// ipinfo.io "own address + geo" lookup. Only used when a token is configured.
class GeoResolver {
public:
GeoResolver(HttpClient& http, std::string token, DiagLogger* diag = nullptr);

bool enabled() const { return !token_.empty(); }
std::optional<GeoInfo> lookup() const;

static std::optional<GeoInfo> parse(const std::string& body);

private:
HttpClient& http_;
std::string token_;
DiagLogger* diag_;
};
} // namespace wanwatch
