// ===================== src/retry.cpp =====================
#include "retry.hpp"
#include "diag_logger.hpp"

#include <thread>

namespace wanwatch
{
    void real_sleep(std::chrono::milliseconds d)
    {
        std::this_thread::sleep_for(d);
    }

    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, int attempt)
    {
        if (attempt < 0)
            attempt = 0;
        if (attempt > 20)
            attempt = 20;
        return policy.base_delay * (1LL << attempt);
    }

    RetryOutcome retry_with_backoff(const std::function<bool()> &op,
                                    const RetryPolicy &policy,
                                    const Sleeper &sleep,
                                    DiagLogger *diag,
                                    const std::string &label)
    {
        const int budget = policy.max_retries < 1 ? 1 : policy.max_retries;
        RetryOutcome out;

        for (int attempt = 0; attempt < budget; ++attempt)
        {
            out.attempts = attempt + 1;
            const std::string tag = label + " attempt " + std::to_string(attempt + 1) + "/" + std::to_string(budget);
            try
            {
                if (op())
                {
                    if (diag && attempt > 0)
                        diag->info(tag + " succeeded");
                    out.delivered = true;
                    return out;
                }
                if (diag)
                    diag->warn(tag + " failed");
            }
            catch (const std::exception &e)
            {
                if (diag)
                    diag->warn(tag + " failed with error: " + e.what());
            }

            if (attempt + 1 < budget)
            {
                auto delay = backoff_delay(policy, attempt);
                if (diag)
                    diag->info("Retrying " + label + " in " + std::to_string(delay.count()) + " ms");
                sleep(delay);
            }
        }

        if (diag)
            diag->error(label + " failed after " + std::to_string(budget) + " attempts");
        return out;
    }
} // namespace wanwatch
