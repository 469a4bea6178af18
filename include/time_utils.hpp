// ===================== include/time_utils.hpp =====================
#pragma once
#include <chrono>
#include <string>

namespace wanwatch
{
    using system_clock = std::chrono::system_clock;

    // "2026-10-17 19:50:00.123" in local time (log lines).
    std::string local_timestamp_ms(system_clock::time_point t = system_clock::now());

    // "2026-10-17T19:50:00Z" (persisted state, webhook timestamps).
    std::string iso8601_utc(system_clock::time_point t = system_clock::now());

    // "Saturday, October 17, 2026 at 19:50:00" in local time (notification bodies).
    std::string human_local(system_clock::time_point t = system_clock::now());

    // "Sat, 17 Oct 2026 19:50:00 +0000" (e-mail Date header).
    std::string rfc2822_date(system_clock::time_point t = system_clock::now());
} // namespace wanwatch
