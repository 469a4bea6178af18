// ===================== include/version.hpp =====================
#pragma once

namespace wanwatch
{
    inline constexpr int version_major = 1;
    inline constexpr int version_minor = 4;
    inline constexpr int version_patch = 1;

    // Compared against the release feed's tag_name.
    inline constexpr const char *version_string = "1.4.1";

    inline constexpr const char *release_feed_url =
        "https://api.github.com/repos/noxied/wanwatcher/releases/latest";
} // namespace wanwatch
