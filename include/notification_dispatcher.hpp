// ===================== include/notification_dispatcher.hpp =====================
#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "channel_sender.hpp"
#include "retry.hpp"

namespace wanwatch
{
    class DiagLogger;

    // channel name -> delivered
    using ChannelResults = std::map<std::string, bool>;

    // Fans one event out to every configured channel, sequentially, each
    // behind its own retry budget. One channel's failure never affects another.
    class NotificationDispatcher
    {
    public:
        explicit NotificationDispatcher(RetryPolicy policy = {}, DiagLogger *diag = nullptr,
                                        Sleeper sleep = real_sleep);

        void add_channel(std::unique_ptr<ChannelSender> channel);
        std::size_t channel_count() const { return channels_.size(); }

        ChannelResults dispatch(const ChangeEvent &event, const NotifyContext &ctx);
        ChannelResults dispatch_update(const UpdateInfo &info, const NotifyContext &ctx);

        // Single attempt per channel; failures are logged and dropped.
        void dispatch_error(const std::string &message, const std::string &server_name);

        static bool any_delivered(const ChannelResults &results);

    private:
        ChannelResults run_all(const std::string &what, const std::function<bool(ChannelSender &)> &op);

        RetryPolicy policy_;
        DiagLogger *diag_;
        Sleeper sleep_;
        std::vector<std::unique_ptr<ChannelSender>> channels_;
    };
} // namespace wanwatch
