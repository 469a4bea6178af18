// ===================== include/discord_channel.hpp =====================
#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "channel_sender.hpp"
#include "config.hpp"

namespace wanwatch
{
    class HttpClient;

    // Discord incoming webhook. Delivered iff the webhook answers 2xx (204 in practice).
    class DiscordChannel : public ChannelSender
    {
    public:
        DiscordChannel(HttpClient &http, DiscordConfig cfg, DiagLogger *diag = nullptr);

        std::string name() const override { return "discord"; }
        bool send(const ChangeEvent &event, const NotifyContext &ctx) override;
        bool send_update(const UpdateInfo &info, const NotifyContext &ctx) override;
        bool send_error(const std::string &message, const std::string &server_name) override;

        nlohmann::json change_payload(const ChangeEvent &event, const NotifyContext &ctx) const;
        nlohmann::json update_payload(const UpdateInfo &info, const NotifyContext &ctx) const;
        nlohmann::json error_payload(const std::string &message, const std::string &server_name) const;

        static constexpr int kColorFirstRun = 0x00ff00;
        static constexpr int kColorChanged = 0xff9900;
        static constexpr int kColorUpdate = 0x00d9ff;
        static constexpr int kColorError = 0xff0000;

    private:
        nlohmann::json envelope(nlohmann::json embed) const;
        bool post(const nlohmann::json &payload, const std::string &what);

        HttpClient &http_;
        DiscordConfig cfg_;
        DiagLogger *diag_;
    };
} // namespace wanwatch
