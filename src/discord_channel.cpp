// ===================== src/discord_channel.cpp =====================
#include "discord_channel.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"
#include "message_format.hpp"
#include "string_utils.hpp"
#include "time_utils.hpp"

using nlohmann::json;

namespace wanwatch
{
    namespace
    {
        json field(const std::string &name, const std::string &value, bool inline_field = false)
        {
            return json{{"name", name}, {"value", value}, {"inline", inline_field}};
        }
    } // namespace

    DiscordChannel::DiscordChannel(HttpClient &http, DiscordConfig cfg, DiagLogger *diag)
        : http_(http), cfg_(std::move(cfg)), diag_(diag) {}

    json DiscordChannel::envelope(json embed) const
    {
        json payload = {{"username", cfg_.bot_name}, {"embeds", json::array({std::move(embed)})}};
        if (!cfg_.avatar_url.empty())
            payload["avatar_url"] = cfg_.avatar_url;
        return payload;
    }

    json DiscordChannel::change_payload(const ChangeEvent &event, const NotifyContext &ctx) const
    {
        std::string info;
        if (event.is_first_run())
            info = "Monitoring started for **" + ctx.server_name + "**";
        else
        {
            std::vector<std::string> lines;
            for (const auto &c : field_changes(event))
                lines.push_back("**" + c.family + ":** `" + c.before + "` \xE2\x86\x92 `" + c.after + "`");
            info = lines.empty() ? "IP information updated" : join(lines, "\n");
        }

        json fields = json::array();
        if (event.current.ipv4)
            fields.push_back(field("\xF0\x9F\x93\x8D Current IPv4", "`" + *event.current.ipv4 + "`"));
        if (event.current.ipv6)
            fields.push_back(field("\xF0\x9F\x93\x8D Current IPv6", "`" + *event.current.ipv6 + "`"));

        if (event.geo)
        {
            std::vector<std::string> geo;
            const std::string where = location_text(*event.geo);
            if (!where.empty())
                geo.push_back("\xF0\x9F\x8C\x8D " + where);
            if (!event.geo->org.empty())
                geo.push_back("\xF0\x9F\x8F\xA2 " + event.geo->org);
            if (!event.geo->timezone.empty())
                geo.push_back("\xF0\x9F\x95\x90 " + event.geo->timezone);
            if (!geo.empty())
                fields.push_back(field("\xF0\x9F\x93\x8D Location Information", join(geo, "\n")));
        }

        fields.push_back(field("\xE2\x8F\xB0 Detected At", human_local()));
        fields.push_back(field("\xF0\x9F\x93\xA6 Version", "v" + ctx.version, true));

        json embed = {
            {"title", "\xF0\x9F\x8C\x90 WAN IP Monitor Alert"},
            {"description", "**" + event_title(event) + "**\n\n" + info},
            {"color", event.is_first_run() ? kColorFirstRun : kColorChanged},
            {"fields", fields},
            {"footer", {{"text", "wanwatch v" + ctx.version + " on " + ctx.server_name}}},
            {"timestamp", iso8601_utc()},
        };
        return envelope(std::move(embed));
    }

    json DiscordChannel::update_payload(const UpdateInfo &info, const NotifyContext &ctx) const
    {
        std::vector<std::string> items;
        for (const auto &item : changelog_items(info.release_body))
            items.push_back("\xE2\x80\xA2 " + item);
        const std::string preview = items.empty() ? kNoChangelog : join(items, "\n");

        json embed = {
            {"title", "\xF0\x9F\x86\x95 WANwatcher Update Available!"},
            {"description", "A new version of WANwatcher is ready to install."},
            {"color", kColorUpdate},
            {"fields", json::array({
                           field("\xF0\x9F\x93\xA6 Current Version", "`v" + info.current_version + "`", true),
                           field("\xF0\x9F\x8E\x81 Latest Version", "`v" + info.latest_version + "`", true),
                           field("\xF0\x9F\x93\x8B What's New", preview),
                           field("\xF0\x9F\x94\x97 Full Changelog", "[View Release Notes](" + info.release_url + ")"),
                       })},
            {"footer", {{"text", "Update check for " + ctx.server_name}}},
            {"timestamp", iso8601_utc()},
        };
        return envelope(std::move(embed));
    }

    json DiscordChannel::error_payload(const std::string &message, const std::string &server_name) const
    {
        json embed = {
            {"title", "\xE2\x9A\xA0\xEF\xB8\x8F WANwatcher Error"},
            {"description", "```\n" + truncate(message, kMaxErrorChars) + "\n```"},
            {"color", kColorError},
            {"footer", {{"text", server_name}}},
            {"timestamp", iso8601_utc()},
        };
        return envelope(std::move(embed));
    }

    bool DiscordChannel::post(const json &payload, const std::string &what)
    {
        HttpResponse resp = http_.postJson(cfg_.webhook_url, payload.dump());
        if (resp.ok())
        {
            if (diag_)
                diag_->info("Discord " + what + " sent (status " + std::to_string(resp.status) + ")");
            return true;
        }
        if (diag_)
            diag_->error("Discord " + what + " failed (status " + std::to_string(resp.status) + "): " +
                         truncate(resp.body, 200));
        return false;
    }

    bool DiscordChannel::send(const ChangeEvent &event, const NotifyContext &ctx)
    {
        return post(change_payload(event, ctx), "notification");
    }

    bool DiscordChannel::send_update(const UpdateInfo &info, const NotifyContext &ctx)
    {
        return post(update_payload(info, ctx), "update notification");
    }

    bool DiscordChannel::send_error(const std::string &message, const std::string &server_name)
    {
        return post(error_payload(message, server_name), "error notification");
    }
} // namespace wanwatch
