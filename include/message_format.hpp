// ===================== include/message_format.hpp =====================
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "channel_sender.hpp"

namespace wanwatch
{
    // Rendering pieces shared by the Discord, Telegram and e-mail channels.

    // "Initial IP Detection" / "IP Address Changed".
    std::string event_title(const ChangeEvent &event);

    // One entry per changed family, e.g. {"IPv4", "1.1.1.1", "2.2.2.2"}.
    struct FieldChange
    {
        std::string family;
        std::string before;
        std::string after;
    };
    std::vector<FieldChange> field_changes(const ChangeEvent &event);

    // "City, Region, Country" with empty parts dropped; empty when no parts.
    std::string location_text(const GeoInfo &geo);

    // Up to max_items bullet points taken from the first 8 lines of a release
    // body; markdown headers are skipped.
    std::vector<std::string> changelog_items(const std::string &release_body, std::size_t max_items = 5);
    inline const char *kNoChangelog = "See release notes for details";

    // At most max_chars bytes, cut on a UTF-8 character boundary.
    std::string truncate(const std::string &s, std::size_t max_chars);
    inline constexpr std::size_t kMaxErrorChars = 1000;
} // namespace wanwatch
