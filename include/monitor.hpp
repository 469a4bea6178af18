// ===================== include/monitor.hpp =====================
#pragma once
#include <atomic>
#include <chrono>
#include <optional>

#include "change_detector.hpp"
#include "channel_sender.hpp"
#include "config.hpp"
#include "notification_dispatcher.hpp"
#include "retry.hpp"

namespace wanwatch
{
    class AddressResolver;
    class DiagLogger;
    class StateStore;
    class UpdateChecker;

    enum class CycleStatus
    {
        Completed,        // resolved, classified, dispatched if needed, persisted
        ResolutionFailed, // nothing resolved; no classify, dispatch or persist
        PersistFailed,    // dispatch happened but the state file could not be written
        Aborted           // unexpected exception escaped the cycle
    };

    const char *to_string(CycleStatus status);

    struct CycleReport
    {
        CycleStatus status = CycleStatus::Completed;
        std::optional<ChangeKind> kind;
        ChannelResults results;
    };

    // Drives resolve -> classify -> dispatch -> persist on a fixed interval and
    // gates the release-feed check. Owns none of its collaborators.
    class Monitor
    {
    public:
        using clock = std::chrono::steady_clock;

        Monitor(const Config &cfg,
                const AddressResolver &resolver,
                const StateStore &store,
                NotificationDispatcher &dispatcher,
                const UpdateChecker *updates,
                DiagLogger *diag,
                NotifyContext ctx,
                Sleeper sleep = real_sleep);

        CycleReport run_cycle();

        // run_cycle() with every escaping std::exception logged and reported.
        CycleReport run_guarded_cycle();

        // Runs the update check when enabled and due. Returns true if it ran.
        bool maybe_check_update(clock::time_point now);

        // Unconditional check; records the mark when any channel delivered.
        void check_for_update();

        // Startup update check, first cycle at once, then one cycle per
        // interval until stop is set. Stop is polled once per second.
        void run(const std::atomic<bool> &stop);

    private:
        const Config &cfg_;
        const AddressResolver &resolver_;
        const StateStore &store_;
        NotificationDispatcher &dispatcher_;
        const UpdateChecker *updates_;
        DiagLogger *diag_;
        NotifyContext ctx_;
        Sleeper sleep_;
        std::optional<clock::time_point> last_update_check_;
    };
} // namespace wanwatch
