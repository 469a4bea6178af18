// ===================== include/channel_sender.hpp =====================
#pragma once
#include <string>

#include "change_detector.hpp"

namespace wanwatch
{
    struct NotifyContext
    {
        std::string server_name;
        std::string version;
    };

    struct UpdateInfo
    {
        std::string current_version;
        std::string latest_version;
        std::string release_url;
        std::string release_body;
    };

    // One notification platform. Rendering and transport are the channel's
    // business; the dispatcher only sees delivered / not delivered.
    class ChannelSender
    {
    public:
        virtual ~ChannelSender() = default;

        virtual std::string name() const = 0;
        virtual bool send(const ChangeEvent &event, const NotifyContext &ctx) = 0;
        virtual bool send_update(const UpdateInfo &info, const NotifyContext &ctx) = 0;
        virtual bool send_error(const std::string &message, const std::string &server_name) = 0;
    };
} // namespace wanwatch
