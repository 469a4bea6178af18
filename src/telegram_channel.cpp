// ===================== src/telegram_channel.cpp =====================
#include "telegram_channel.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"
#include "message_format.hpp"
#include "string_utils.hpp"
#include "time_utils.hpp"

#include <nlohmann/json.hpp>

namespace wanwatch
{
    namespace
    {
        std::string code(const std::string &s) { return "<code>" + html_escape(s) + "</code>"; }
    } // namespace

    TelegramChannel::TelegramChannel(HttpClient &http, TelegramConfig cfg, DiagLogger *diag)
        : http_(http), cfg_(std::move(cfg)), diag_(diag) {}

    std::string TelegramChannel::api_url() const
    {
        return "https://api.telegram.org/bot" + cfg_.bot_token + "/sendMessage";
    }

    std::string TelegramChannel::change_text(const ChangeEvent &event, const NotifyContext &ctx)
    {
        const bool first = event.is_first_run();
        std::vector<std::string> lines = {
            std::string(first ? "\xF0\x9F\x9F\xA2" : "\xF0\x9F\x9F\xA0") + " <b>WAN IP Monitor Alert</b>",
            "<b>" + event_title(event) + "</b>",
            "Monitoring for <b>" + html_escape(ctx.server_name) + "</b>",
            "",
        };

        if (!first)
        {
            lines.push_back("<b>Changes Detected:</b>");
            for (const auto &c : field_changes(event))
                lines.push_back("  \xE2\x80\xA2 " + c.family + ": " + code(c.before) + " \xE2\x86\x92 " + code(c.after));
            lines.push_back("");
        }

        if (event.current.ipv4)
        {
            lines.push_back("<b>Current IPv4:</b>\n" + code(*event.current.ipv4));
            lines.push_back("");
        }
        if (event.current.ipv6)
        {
            lines.push_back("<b>Current IPv6:</b>\n" + code(*event.current.ipv6));
            lines.push_back("");
        }

        if (event.geo)
        {
            lines.push_back("<b>Location Information</b>");
            const std::string where = location_text(*event.geo);
            if (!where.empty())
                lines.push_back("\xF0\x9F\x8C\x8D " + html_escape(where));
            if (!event.geo->org.empty())
                lines.push_back("\xF0\x9F\x8F\xA2 " + html_escape(event.geo->org));
            if (!event.geo->timezone.empty())
                lines.push_back("\xF0\x9F\x95\x90 " + html_escape(event.geo->timezone));
            lines.push_back("");
        }

        lines.push_back("<b>Detected At:</b> " + human_local());
        lines.push_back("<b>Version:</b> v" + html_escape(ctx.version));
        return join(lines, "\n");
    }

    std::string TelegramChannel::update_text(const UpdateInfo &info, const NotifyContext &ctx)
    {
        std::vector<std::string> items;
        for (const auto &item : changelog_items(info.release_body))
            items.push_back("  \xE2\x80\xA2 " + html_escape(item));

        std::vector<std::string> lines = {
            "\xF0\x9F\x86\x95 <b>WANwatcher Update Available!</b>",
            "",
            "<b>Current Version:</b> v" + html_escape(info.current_version),
            "<b>Latest Version:</b> v" + html_escape(info.latest_version),
            "",
            "<b>What's New:</b>",
            items.empty() ? std::string(kNoChangelog) : join(items, "\n"),
            "",
            "<b>Full Changelog:</b>",
            "<a href=\"" + html_escape(info.release_url) + "\">View Release Notes</a>",
            "",
            "<i>Update check for " + html_escape(ctx.server_name) + "</i>",
        };
        return join(lines, "\n");
    }

    std::string TelegramChannel::error_text(const std::string &message, const std::string &server_name)
    {
        return "\xE2\x9A\xA0\xEF\xB8\x8F <b>WANwatcher Error</b>\n"
               "Server: <b>" + html_escape(server_name) + "</b>\n\n" +
               code(truncate(message, kMaxErrorChars));
    }

    bool TelegramChannel::post(const std::string &text, const std::string &what)
    {
        nlohmann::json payload = {
            {"chat_id", cfg_.chat_id},
            {"text", text},
            {"parse_mode", cfg_.parse_mode},
        };
        HttpResponse resp = http_.postJson(api_url(), payload.dump());
        if (resp.status == 200)
        {
            if (diag_)
                diag_->info("Telegram " + what + " sent");
            return true;
        }
        if (diag_)
            diag_->error("Telegram " + what + " failed (status " + std::to_string(resp.status) + "): " +
                         truncate(resp.body, 200));
        return false;
    }

    bool TelegramChannel::send(const ChangeEvent &event, const NotifyContext &ctx)
    {
        return post(change_text(event, ctx), "notification");
    }

    bool TelegramChannel::send_update(const UpdateInfo &info, const NotifyContext &ctx)
    {
        return post(update_text(info, ctx), "update notification");
    }

    bool TelegramChannel::send_error(const std::string &message, const std::string &server_name)
    {
        return post(error_text(message, server_name), "error notification");
    }
} // namespace wanwatch
