// ===================== include/email_channel.hpp =====================
#pragma once
#include <string>
#include <vector>

#include "channel_sender.hpp"
#include "config.hpp"

namespace wanwatch
{
    class MailTransport;

    struct MailMessage
    {
        std::string subject;
        std::string text;
        std::string html;
    };

    // Full RFC 5322 message with a multipart/alternative (plain + HTML) body,
    // both parts UTF-8 and base64 encoded.
    std::string build_mime_message(const std::string &from, const std::vector<std::string> &to,
                                   const MailMessage &mail, const std::string &date,
                                   const std::string &boundary);

    // RFC 2047 B-encoding when the header value is not plain ASCII.
    std::string encode_header_value(const std::string &value);

    class EmailChannel : public ChannelSender
    {
    public:
        EmailChannel(MailTransport &transport, EmailConfig cfg, DiagLogger *diag = nullptr);

        std::string name() const override { return "email"; }
        bool send(const ChangeEvent &event, const NotifyContext &ctx) override;
        bool send_update(const UpdateInfo &info, const NotifyContext &ctx) override;
        bool send_error(const std::string &message, const std::string &server_name) override;

        MailMessage change_mail(const ChangeEvent &event, const NotifyContext &ctx) const;
        MailMessage update_mail(const UpdateInfo &info, const NotifyContext &ctx) const;
        MailMessage error_mail(const std::string &message, const std::string &server_name) const;

    private:
        bool deliver(const MailMessage &mail, const std::string &what);

        MailTransport &transport_;
        EmailConfig cfg_;
        DiagLogger *diag_;
    };
} // namespace wanwatch
