// ===================== include/telegram_channel.hpp =====================
#pragma once
#include <string>

#include "channel_sender.hpp"
#include "config.hpp"

namespace wanwatch
{
    class HttpClient;

    // Telegram Bot API sendMessage. Delivered iff the API answers 200.
    class TelegramChannel : public ChannelSender
    {
    public:
        TelegramChannel(HttpClient &http, TelegramConfig cfg, DiagLogger *diag = nullptr);

        std::string name() const override { return "telegram"; }
        bool send(const ChangeEvent &event, const NotifyContext &ctx) override;
        bool send_update(const UpdateInfo &info, const NotifyContext &ctx) override;
        bool send_error(const std::string &message, const std::string &server_name) override;

        std::string api_url() const;

        // HTML bodies; every interpolated value is escaped.
        static std::string change_text(const ChangeEvent &event, const NotifyContext &ctx);
        static std::string update_text(const UpdateInfo &info, const NotifyContext &ctx);
        static std::string error_text(const std::string &message, const std::string &server_name);

    private:
        bool post(const std::string &text, const std::string &what);

        HttpClient &http_;
        TelegramConfig cfg_;
        DiagLogger *diag_;
    };
} // namespace wanwatch
