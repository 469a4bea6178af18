// ===================== include/update_checker.hpp =====================
#pragma once
#include <optional>
#include <string>
#include <tuple>

#include "channel_sender.hpp"

namespace wanwatch
{
    class DiagLogger;
    class HttpClient;
    class StateStore;

    struct SemVer
    {
        int major = 0;
        int minor = 0;
        int patch = 0;

        std::tuple<int, int, int> tie() const { return std::make_tuple(major, minor, patch); }
    };

    inline bool operator<(const SemVer &a, const SemVer &b) { return a.tie() < b.tie(); }
    inline bool operator>(const SemVer &a, const SemVer &b) { return b < a; }
    inline bool operator==(const SemVer &a, const SemVer &b) { return a.tie() == b.tie(); }

    // "v1.4.0" -> {1,4,0}; "2" -> {2,0,0}; "1.2.3-rc1" -> {1,2,3}; garbage -> {0,0,0}.
    SemVer parse_version(const std::string &text);

    // Release-feed poll. Read-only on state: the caller records the notified
    // mark once a channel actually delivered.
    class UpdateChecker
    {
    public:
        UpdateChecker(HttpClient &http, const StateStore &store, std::string current_version,
                      std::string feed_url, DiagLogger *diag = nullptr);

        // nullopt when up to date, already notified, or on any fetch/parse failure.
        std::optional<UpdateInfo> check() const;

        // Feed body -> UpdateInfo (no version comparison). nullopt when
        // the body has no usable tag_name.
        static std::optional<UpdateInfo> parse_release(const std::string &body, const std::string &current_version);

        const std::string &current_version() const { return current_version_; }

    private:
        HttpClient &http_;
        const StateStore &store_;
        std::string current_version_;
        std::string feed_url_;
        DiagLogger *diag_;
    };
} // namespace wanwatch
