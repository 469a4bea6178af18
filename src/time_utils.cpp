// ===================== src/time_utils.cpp =====================
#include "time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace wanwatch
{
    static std::tm local_tm(system_clock::time_point t)
    {
        auto tt = system_clock::to_time_t(t);
        std::tm tm{};
        localtime_r(&tt, &tm);
        return tm;
    }

    static std::tm utc_tm(system_clock::time_point t)
    {
        auto tt = system_clock::to_time_t(t);
        std::tm tm{};
        gmtime_r(&tt, &tm);
        return tm;
    }

    static std::string format(const std::tm &tm, const char *fmt)
    {
        std::ostringstream oss;
        oss << std::put_time(&tm, fmt);
        return oss.str();
    }

    std::string local_timestamp_ms(system_clock::time_point t)
    {
        using namespace std::chrono;
        auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;
        std::ostringstream oss;
        oss << format(local_tm(t), "%Y-%m-%d %H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << ms.count();
        return oss.str();
    }

    std::string iso8601_utc(system_clock::time_point t)
    {
        return format(utc_tm(t), "%Y-%m-%dT%H:%M:%SZ");
    }

    std::string human_local(system_clock::time_point t)
    {
        return format(local_tm(t), "%A, %B %d, %Y at %H:%M:%S");
    }

    std::string rfc2822_date(system_clock::time_point t)
    {
        return format(local_tm(t), "%a, %d %b %Y %H:%M:%S %z");
    }
} // namespace wanwatch
