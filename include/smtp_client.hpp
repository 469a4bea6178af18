// ===================== include/smtp_client.hpp =====================
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace wanwatch
{
    class DiagLogger;

    class SmtpError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Mail submission seam: EmailChannel only sees this.
    class MailTransport
    {
    public:
        virtual ~MailTransport() = default;

        // message is a complete RFC 5322 message (headers + body, CRLF line
        // endings). Throws SmtpError when the server refuses or the link drops.
        virtual void send_mail(const std::string &from, const std::vector<std::string> &to,
                               const std::string &message) = 0;
    };

    struct SmtpSettings
    {
        std::string host;
        int port = 587;
        std::string user;
        std::string password;
        bool use_tls = true;  // STARTTLS after the first EHLO
        bool use_ssl = false; // implicit TLS from the first byte (port 465)
        int timeout_ms = 30000;
    };

    // One connection per message: connect, EHLO, [STARTTLS, EHLO], AUTH LOGIN,
    // MAIL FROM, RCPT TO per recipient, DATA, QUIT.
    class SmtpClient : public MailTransport
    {
    public:
        explicit SmtpClient(SmtpSettings settings, DiagLogger *diag = nullptr);

        void send_mail(const std::string &from, const std::vector<std::string> &to,
                       const std::string &message) override;

    private:
        SmtpSettings settings_;
        DiagLogger *diag_;
    };

    struct SmtpReply
    {
        int code = 0;
        std::string text; // all lines, codes stripped, joined with '\n'
    };

    // "250-SIZE" -> 250, "250 OK" -> 250, anything else -> -1.
    int parse_reply_code(const std::string &line);
    // True for the last line of a (possibly multi-line) reply: "250 OK", not "250-...".
    bool is_final_reply_line(const std::string &line);

    std::string base64_encode(const std::string &data);
    // Wraps base64 text at 76 columns with CRLF.
    std::string base64_lines(const std::string &data);

    // Normalises line endings to CRLF and doubles a leading '.' on every line.
    std::string dot_stuff(const std::string &message);
} // namespace wanwatch
