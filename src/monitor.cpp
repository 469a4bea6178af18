// ===================== src/monitor.cpp =====================
#include "monitor.hpp"
#include "address_resolver.hpp"
#include "diag_logger.hpp"
#include "state_store.hpp"
#include "update_checker.hpp"

namespace wanwatch
{
    const char *to_string(CycleStatus status)
    {
        switch (status)
        {
        case CycleStatus::Completed: return "completed";
        case CycleStatus::ResolutionFailed: return "resolution failed";
        case CycleStatus::PersistFailed: return "persist failed";
        case CycleStatus::Aborted: return "aborted";
        }
        return "unknown";
    }

    Monitor::Monitor(const Config &cfg,
                     const AddressResolver &resolver,
                     const StateStore &store,
                     NotificationDispatcher &dispatcher,
                     const UpdateChecker *updates,
                     DiagLogger *diag,
                     NotifyContext ctx,
                     Sleeper sleep)
        : cfg_(cfg), resolver_(resolver), store_(store), dispatcher_(dispatcher), updates_(updates),
          diag_(diag), ctx_(std::move(ctx)), sleep_(std::move(sleep)) {}

    CycleReport Monitor::run_cycle()
    {
        CycleReport report;
        if (diag_)
            diag_->info("Starting IP check for " + ctx_.server_name);

        Resolution res;
        try
        {
            res = resolver_.resolve(cfg_.monitor_ipv4, cfg_.monitor_ipv6);
        }
        catch (const ResolutionError &e)
        {
            if (diag_)
                diag_->error(std::string("IP check failed: ") + e.what());
            dispatcher_.dispatch_error(std::string("Error during IP check: ") + e.what(), ctx_.server_name);
            report.status = CycleStatus::ResolutionFailed;
            return report;
        }

        const AddressPair previous = store_.load();
        ChangeEvent event = ChangeDetector::make_event(res.addresses, previous, res.geo);
        report.kind = event.kind;

        if (diag_)
            diag_->info(std::string("Current ") + to_string(event.current) + " (" + to_string(event.kind) + ")");

        if (event.kind != ChangeKind::Unchanged)
        {
            if (diag_ && !event.is_first_run())
                diag_->info("Previous " + to_string(event.previous));
            report.results = dispatcher_.dispatch(event, ctx_);
        }

        // Unchanged cycles still rewrite the record so last_updated tracks the last good check.
        try
        {
            store_.save(event.current);
        }
        catch (const StateError &e)
        {
            if (diag_)
                diag_->error(std::string("Cycle error: ") + e.what());
            dispatcher_.dispatch_error(std::string("Failed to save IP state: ") + e.what(), ctx_.server_name);
            report.status = CycleStatus::PersistFailed;
            return report;
        }

        report.status = CycleStatus::Completed;
        return report;
    }

    CycleReport Monitor::run_guarded_cycle()
    {
        try
        {
            return run_cycle();
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->error(std::string("Main loop error: ") + e.what());
            dispatcher_.dispatch_error(std::string("Main loop error: ") + e.what(), ctx_.server_name);
            CycleReport report;
            report.status = CycleStatus::Aborted;
            return report;
        }
    }

    void Monitor::check_for_update()
    {
        if (!updates_)
            return;
        auto info = updates_->check();
        if (!info)
            return;

        ChannelResults results = dispatcher_.dispatch_update(*info, ctx_);
        if (!NotificationDispatcher::any_delivered(results))
        {
            if (diag_)
                diag_->warn("Update notification for v" + info->latest_version + " not delivered; will retry");
            return;
        }
        try
        {
            store_.save_update_mark(info->latest_version);
        }
        catch (const StateError &e)
        {
            if (diag_)
                diag_->error(std::string("Cannot record update notification: ") + e.what());
        }
    }

    bool Monitor::maybe_check_update(clock::time_point now)
    {
        if (!cfg_.update_check_enabled || !updates_)
            return false;
        const auto interval = std::chrono::seconds(cfg_.update_check_interval_s);
        if (last_update_check_ && now - *last_update_check_ < interval)
            return false;
        last_update_check_ = now;
        check_for_update();
        return true;
    }

    void Monitor::run(const std::atomic<bool> &stop)
    {
        if (diag_)
            diag_->info("Monitoring every " + std::to_string(cfg_.check_interval_s) + "s (IPv4: " +
                        (cfg_.monitor_ipv4 ? "on" : "off") + ", IPv6: " + (cfg_.monitor_ipv6 ? "on" : "off") + ")");

        if (cfg_.update_check_on_startup)
            maybe_check_update(clock::now());
        else
            last_update_check_ = clock::now();

        run_guarded_cycle();

        while (!stop.load())
        {
            for (int waited = 0; waited < cfg_.check_interval_s && !stop.load(); ++waited)
                sleep_(std::chrono::seconds(1));
            if (stop.load())
                break;
            maybe_check_update(clock::now());
            run_guarded_cycle();
        }

        if (diag_)
            diag_->info("Stop requested; monitor exiting");
    }
} // namespace wanwatch
