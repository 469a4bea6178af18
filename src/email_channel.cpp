// ===================== src/email_channel.cpp =====================
#include "email_channel.hpp"
#include "diag_logger.hpp"
#include "message_format.hpp"
#include "smtp_client.hpp"
#include "string_utils.hpp"
#include "time_utils.hpp"

#include <chrono>
#include <sstream>

namespace wanwatch
{
    namespace
    {
        const std::string kRule(60, '=');
        const std::string kDash(60, '-');

        std::string html_row(const std::string &label, const std::string &value)
        {
            return "<tr><td style=\"padding:8px 12px;font-weight:600;color:#555;width:35%\">" + html_escape(label) +
                   "</td><td style=\"padding:8px 12px;font-family:'Courier New',monospace\">" + html_escape(value) +
                   "</td></tr>\n";
        }

        std::string html_section(const std::string &title, const std::string &color)
        {
            return "<h3 style=\"color:" + color + ";border-bottom:2px solid " + color + "\">" + html_escape(title) +
                   "</h3>\n";
        }

        std::string html_page(const std::string &color, const std::string &heading, const std::string &sub,
                              const std::string &content, const std::string &footer)
        {
            return "<!DOCTYPE html>\n<html>\n<head><meta charset=\"UTF-8\"></head>\n"
                   "<body style=\"font-family:Arial,sans-serif;line-height:1.6;color:#333;background:#f5f5f5\">\n"
                   "<div style=\"max-width:600px;margin:20px auto;background:#fff;border-radius:8px\">\n"
                   "<div style=\"background:" + color + ";color:#fff;padding:30px 20px;text-align:center\">\n"
                   "<h1 style=\"margin:0\">" + heading + "</h1>\n"
                   "<p>" + sub + "</p>\n</div>\n"
                   "<div style=\"padding:30px 20px\">\n" + content + "</div>\n"
                   "<div style=\"background:#f9f9f9;padding:20px;text-align:center;font-size:12px;color:#666\">" +
                   footer + "</div>\n</div>\n</body>\n</html>\n";
        }

        std::string make_boundary()
        {
            auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
            return "=_wanwatch_" + std::to_string(ticks);
        }
    } // namespace

    std::string encode_header_value(const std::string &value)
    {
        for (unsigned char c : value)
            if (c >= 0x80 || c < 0x20)
                return "=?UTF-8?B?" + base64_encode(value) + "?=";
        return value;
    }

    std::string build_mime_message(const std::string &from, const std::vector<std::string> &to,
                                   const MailMessage &mail, const std::string &date,
                                   const std::string &boundary)
    {
        std::ostringstream m;
        m << "From: " << from << "\r\n"
          << "To: " << join(to, ", ") << "\r\n"
          << "Subject: " << encode_header_value(mail.subject) << "\r\n"
          << "Date: " << date << "\r\n"
          << "MIME-Version: 1.0\r\n"
          << "Content-Type: multipart/alternative; boundary=\"" << boundary << "\"\r\n"
          << "\r\n"
          << "--" << boundary << "\r\n"
          << "Content-Type: text/plain; charset=\"utf-8\"\r\n"
          << "Content-Transfer-Encoding: base64\r\n\r\n"
          << base64_lines(mail.text)
          << "--" << boundary << "\r\n"
          << "Content-Type: text/html; charset=\"utf-8\"\r\n"
          << "Content-Transfer-Encoding: base64\r\n\r\n"
          << base64_lines(mail.html)
          << "--" << boundary << "--\r\n";
        return m.str();
    }

    EmailChannel::EmailChannel(MailTransport &transport, EmailConfig cfg, DiagLogger *diag)
        : transport_(transport), cfg_(std::move(cfg)), diag_(diag) {}

    MailMessage EmailChannel::change_mail(const ChangeEvent &event, const NotifyContext &ctx) const
    {
        const bool first = event.is_first_run();
        const std::string title = event_title(event);
        const std::string color = first ? "#4CAF50" : "#FF9800";
        const std::string detected = human_local();
        const auto changes = field_changes(event);

        MailMessage mail;
        mail.subject = cfg_.subject_prefix + " " + title + " - " + ctx.server_name;

        // plain text
        std::vector<std::string> t = {kRule, "WAN IP MONITOR ALERT", kRule, "", title};
        if (first)
            t.push_back("Monitoring started for " + ctx.server_name);
        for (const auto &c : changes)
            t.push_back(c.family + ": " + c.before + " -> " + c.after);
        t.push_back("");
        t.push_back("CURRENT IP ADDRESSES:");
        t.push_back(kDash);
        if (event.current.ipv4)
            t.push_back("IPv4: " + *event.current.ipv4);
        if (event.current.ipv6)
            t.push_back("IPv6: " + *event.current.ipv6);
        t.push_back("");
        if (event.geo)
        {
            t.push_back("LOCATION INFORMATION:");
            t.push_back(kDash);
            const std::string where = location_text(*event.geo);
            if (!where.empty())
                t.push_back("Location: " + where);
            if (!event.geo->org.empty())
                t.push_back("ISP: " + event.geo->org);
            if (!event.geo->timezone.empty())
                t.push_back("Timezone: " + event.geo->timezone);
            t.push_back("");
        }
        t.push_back("DETECTION DETAILS:");
        t.push_back(kDash);
        t.push_back("Server: " + ctx.server_name);
        t.push_back("Detected: " + detected);
        t.push_back("Version: v" + ctx.version);
        t.push_back("");
        t.push_back(kRule);
        t.push_back("wanwatch v" + ctx.version + " on " + ctx.server_name);
        t.push_back(kRule);
        mail.text = join(t, "\n");

        // html
        std::string sub;
        if (first)
            sub = "Monitoring started for " + html_escape(ctx.server_name);
        else
        {
            std::vector<std::string> parts;
            for (const auto &c : changes)
                parts.push_back("<strong>" + c.family + ":</strong> " + html_escape(c.before) + " &rarr; " +
                                html_escape(c.after));
            sub = parts.empty() ? "IP information updated" : join(parts, "<br>");
        }

        std::string content = html_section("Current IP Addresses", color) + "<table>\n";
        if (event.current.ipv4)
            content += html_row("IPv4 Address:", *event.current.ipv4);
        if (event.current.ipv6)
            content += html_row("IPv6 Address:", *event.current.ipv6);
        content += "</table>\n";
        if (event.geo)
        {
            content += html_section("Location Information", color) + "<table>\n";
            const std::string where = location_text(*event.geo);
            if (!where.empty())
                content += html_row("Location:", where);
            if (!event.geo->org.empty())
                content += html_row("ISP / Organization:", event.geo->org);
            if (!event.geo->timezone.empty())
                content += html_row("Timezone:", event.geo->timezone);
            content += "</table>\n";
        }
        content += html_section("Detection Details", color) + "<table>\n" +
                   html_row("Server Name:", ctx.server_name) + html_row("Detected At:", detected) +
                   html_row("Version:", "v" + ctx.version) + "</table>\n";

        mail.html = html_page(color, "WAN IP Monitor Alert<br>" + html_escape(title), sub, content,
                              "wanwatch v" + html_escape(ctx.version) + " &middot; " + html_escape(ctx.server_name));
        return mail;
    }

    MailMessage EmailChannel::update_mail(const UpdateInfo &info, const NotifyContext &ctx) const
    {
        const auto items = changelog_items(info.release_body);

        MailMessage mail;
        mail.subject = cfg_.subject_prefix + " Update Available: v" + info.latest_version;

        std::vector<std::string> t = {
            "WANwatcher Update Available!",
            "",
            "Current Version: v" + info.current_version,
            "Latest Version: v" + info.latest_version,
            "",
            "What's New:",
        };
        if (items.empty())
            t.push_back(kNoChangelog);
        for (const auto &item : items)
            t.push_back("  * " + item);
        t.push_back("");
        t.push_back("View Full Changelog:");
        t.push_back(info.release_url);
        t.push_back("");
        t.push_back("---");
        t.push_back("Update check for " + ctx.server_name);
        mail.text = join(t, "\n");

        std::string list;
        if (items.empty())
            list = "<p>" + std::string(kNoChangelog) + "</p>\n";
        else
        {
            list = "<ul>\n";
            for (const auto &item : items)
                list += "<li>" + html_escape(item) + "</li>\n";
            list += "</ul>\n";
        }
        const std::string content =
            "<p><strong>Current Version:</strong> v" + html_escape(info.current_version) + "<br>\n"
            "<strong>Latest Version:</strong> v" + html_escape(info.latest_version) + "</p>\n" +
            html_section("What's New", "#00D9FF") + list +
            "<p style=\"text-align:center\"><a href=\"" + html_escape(info.release_url) +
            "\">View Full Changelog</a></p>\n";

        mail.html = html_page("#00D9FF", "WANwatcher Update Available!", "", content,
                              "Update check for " + html_escape(ctx.server_name));
        return mail;
    }

    MailMessage EmailChannel::error_mail(const std::string &message, const std::string &server_name) const
    {
        const std::string shown = truncate(message, kMaxErrorChars);

        MailMessage mail;
        mail.subject = cfg_.subject_prefix + " Error - " + server_name;
        mail.text = "WANwatcher Error\n\nServer: " + server_name + "\nTime: " + human_local() + "\n\n" + shown + "\n";
        mail.html = html_page("#F44336", "WANwatcher Error", html_escape(server_name),
                              "<pre style=\"white-space:pre-wrap\">" + html_escape(shown) + "</pre>\n",
                              html_escape(human_local()));
        return mail;
    }

    bool EmailChannel::deliver(const MailMessage &mail, const std::string &what)
    {
        const std::string message = build_mime_message(cfg_.from, cfg_.to, mail, rfc2822_date(), make_boundary());
        try
        {
            transport_.send_mail(cfg_.from, cfg_.to, message);
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->error("Email " + what + " failed: " + e.what());
            return false;
        }
        if (diag_)
            diag_->info("Email " + what + " sent to " + join(cfg_.to, ", "));
        return true;
    }

    bool EmailChannel::send(const ChangeEvent &event, const NotifyContext &ctx)
    {
        return deliver(change_mail(event, ctx), "notification");
    }

    bool EmailChannel::send_update(const UpdateInfo &info, const NotifyContext &ctx)
    {
        return deliver(update_mail(info, ctx), "update notification");
    }

    bool EmailChannel::send_error(const std::string &message, const std::string &server_name)
    {
        return deliver(error_mail(message, server_name), "error notification");
    }
} // namespace wanwatch
