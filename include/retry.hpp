// ===================== include/retry.hpp =====================
#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace wanwatch
{
    class DiagLogger;

    struct RetryPolicy
    {
        int max_retries = 3;                          // total attempts, at least 1
        std::chrono::milliseconds base_delay{2000};   // wait before attempt n+1 is base * 2^n
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    void real_sleep(std::chrono::milliseconds d);

    struct RetryOutcome
    {
        bool delivered = false;
        int attempts = 0;
    };

    // Runs op until it returns true or the attempt budget is spent. A thrown
    // std::exception counts as a failed attempt. No sleep after the last attempt.
    RetryOutcome retry_with_backoff(const std::function<bool()> &op,
                                    const RetryPolicy &policy,
                                    const Sleeper &sleep = real_sleep,
                                    DiagLogger *diag = nullptr,
                                    const std::string &label = "operation");

    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int attempt);
} // namespace wanwatch
