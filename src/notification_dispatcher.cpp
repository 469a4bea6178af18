// ===================== src/notification_dispatcher.cpp =====================
#include "notification_dispatcher.hpp"
#include "diag_logger.hpp"
#include "message_format.hpp"

namespace wanwatch
{
    NotificationDispatcher::NotificationDispatcher(RetryPolicy policy, DiagLogger *diag, Sleeper sleep)
        : policy_(policy), diag_(diag), sleep_(std::move(sleep)) {}

    void NotificationDispatcher::add_channel(std::unique_ptr<ChannelSender> channel)
    {
        if (channel)
            channels_.push_back(std::move(channel));
    }

    ChannelResults NotificationDispatcher::run_all(const std::string &what,
                                                   const std::function<bool(ChannelSender &)> &op)
    {
        ChannelResults results;
        for (auto &ch : channels_)
        {
            ChannelSender &sender = *ch;
            RetryOutcome out = retry_with_backoff([&] { return op(sender); }, policy_, sleep_, diag_,
                                                  sender.name() + " " + what);
            results[sender.name()] = out.delivered;
        }

        if (diag_)
        {
            std::size_t ok = 0;
            for (const auto &r : results)
                ok += r.second ? 1 : 0;
            diag_->info("Sent " + what + " to " + std::to_string(ok) + "/" + std::to_string(results.size()) +
                        " channel(s)");
        }
        return results;
    }

    ChannelResults NotificationDispatcher::dispatch(const ChangeEvent &event, const NotifyContext &ctx)
    {
        return run_all("notification", [&](ChannelSender &ch) { return ch.send(event, ctx); });
    }

    ChannelResults NotificationDispatcher::dispatch_update(const UpdateInfo &info, const NotifyContext &ctx)
    {
        return run_all("update notification", [&](ChannelSender &ch) { return ch.send_update(info, ctx); });
    }

    void NotificationDispatcher::dispatch_error(const std::string &message, const std::string &server_name)
    {
        const std::string shown = truncate(message, kMaxErrorChars);
        for (auto &ch : channels_)
        {
            try
            {
                if (!ch->send_error(shown, server_name) && diag_)
                    diag_->warn(ch->name() + " error notification not delivered");
            }
            catch (const std::exception &e)
            {
                if (diag_)
                    diag_->warn(ch->name() + " error notification failed: " + e.what());
            }
        }
    }

    bool NotificationDispatcher::any_delivered(const ChannelResults &results)
    {
        for (const auto &r : results)
            if (r.second)
                return true;
        return false;
    }
} // namespace wanwatch
