// ===================== src/smtp_client.cpp =====================
#include "smtp_client.hpp"
#include "diag_logger.hpp"
#include "dns_resolver.hpp"
#include "ssl_session.hpp"
#include "string_utils.hpp"
#include "tcp_socket.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <memory>
#include <openssl/evp.h>

namespace wanwatch
{
    int parse_reply_code(const std::string &line)
    {
        if (line.size() < 3)
            return -1;
        for (int i = 0; i < 3; ++i)
            if (!std::isdigit(static_cast<unsigned char>(line[i])))
                return -1;
        if (line.size() > 3 && line[3] != ' ' && line[3] != '-')
            return -1;
        return std::stoi(line.substr(0, 3));
    }

    bool is_final_reply_line(const std::string &line)
    {
        return parse_reply_code(line) >= 0 && (line.size() == 3 || line[3] == ' ');
    }

    std::string base64_encode(const std::string &data)
    {
        if (data.empty())
            return {};
        std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
        int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                reinterpret_cast<const unsigned char *>(data.data()),
                                static_cast<int>(data.size()));
        out.resize(n < 0 ? 0 : static_cast<size_t>(n));
        return out;
    }

    std::string base64_lines(const std::string &data)
    {
        const std::string encoded = base64_encode(data);
        std::string out;
        for (size_t pos = 0; pos < encoded.size(); pos += 76)
            out += encoded.substr(pos, 76) + "\r\n";
        return out;
    }

    std::string dot_stuff(const std::string &message)
    {
        std::string out;
        out.reserve(message.size() + 64);
        bool line_start = true;
        for (size_t i = 0; i < message.size(); ++i)
        {
            char c = message[i];
            if (line_start && c == '.')
                out += '.';
            if (c == '\r')
            {
                if (i + 1 < message.size() && message[i + 1] == '\n')
                    ++i;
                out += "\r\n";
                line_start = true;
                continue;
            }
            if (c == '\n')
            {
                out += "\r\n";
                line_start = true;
                continue;
            }
            out += c;
            line_start = false;
        }
        return out;
    }

    namespace
    {
        // Line-oriented SMTP link over a plain socket that may be upgraded to TLS.
        class SmtpLink
        {
        public:
            SmtpLink(const SmtpSettings &s, DiagLogger *diag) : s_(s), diag_(diag), tcp_(s.timeout_ms) {}

            void open()
            {
                auto addrs = DNSResolver::resolve(s_.host, s_.port);
                for (const auto &ra : addrs)
                {
                    if (tcp_.connectTo(ra))
                    {
                        if (s_.use_ssl)
                            startTls();
                        return;
                    }
                }
                throw SmtpError("cannot connect to " + s_.host + ":" + std::to_string(s_.port));
            }

            void startTls()
            {
                tls_ = std::make_unique<SslSession>();
                if (!tls_->handshake(tcp_.fd(), s_.host))
                    throw SmtpError("TLS handshake with " + s_.host + " failed: " + tls_->lastError());
                buf_.clear();
            }

            void write(const std::string &data)
            {
                bool sent = tls_ ? tls_->sendAll(data) : tcp_.sendAll(data);
                if (!sent)
                    throw SmtpError("send to " + s_.host + " failed");
            }

            SmtpReply readReply()
            {
                SmtpReply reply;
                std::vector<std::string> texts;
                for (;;)
                {
                    std::string line = readLine();
                    int code = parse_reply_code(line);
                    if (code < 0)
                        throw SmtpError("malformed SMTP reply: " + line);
                    reply.code = code;
                    texts.push_back(line.size() > 4 ? line.substr(4) : std::string());
                    if (is_final_reply_line(line))
                        break;
                }
                reply.text = join(texts, "\n");
                return reply;
            }

            // Sends cmd (CRLF appended) and requires one of the accepted reply codes.
            SmtpReply command(const std::string &cmd, std::initializer_list<int> accepted,
                              const std::string &shown = {})
            {
                if (diag_)
                    diag_->debug("SMTP > " + (shown.empty() ? cmd : shown));
                write(cmd + "\r\n");
                return expect(accepted, shown.empty() ? cmd : shown);
            }

            SmtpReply command(const std::string &cmd, int expected, const std::string &shown = {})
            {
                return command(cmd, {expected}, shown);
            }

            SmtpReply expect(std::initializer_list<int> accepted, const std::string &what)
            {
                SmtpReply r = readReply();
                if (diag_)
                    diag_->debug("SMTP < " + std::to_string(r.code) + " " + r.text);
                if (std::find(accepted.begin(), accepted.end(), r.code) == accepted.end())
                    throw SmtpError(what + ": server replied " + std::to_string(r.code) + " " + r.text);
                return r;
            }

            SmtpReply expect(int expected, const std::string &what) { return expect({expected}, what); }

        private:
            std::string readLine()
            {
                for (;;)
                {
                    size_t nl = buf_.find('\n');
                    if (nl != std::string::npos)
                    {
                        std::string line = buf_.substr(0, nl);
                        buf_.erase(0, nl + 1);
                        if (!line.empty() && line.back() == '\r')
                            line.pop_back();
                        return line;
                    }
                    char chunk[1024];
                    long n = tls_ ? tls_->recvSome(chunk, sizeof(chunk)) : tcp_.recvSome(chunk, sizeof(chunk));
                    if (n <= 0)
                        throw SmtpError("connection to " + s_.host + " closed or timed out");
                    buf_.append(chunk, static_cast<size_t>(n));
                }
            }

            const SmtpSettings &s_;
            DiagLogger *diag_;
            TcpSocket tcp_;
            std::unique_ptr<SslSession> tls_;
            std::string buf_;
        };
    } // namespace

    SmtpClient::SmtpClient(SmtpSettings settings, DiagLogger *diag)
        : settings_(std::move(settings)), diag_(diag) {}

    void SmtpClient::send_mail(const std::string &from, const std::vector<std::string> &to,
                               const std::string &message)
    {
        if (to.empty())
            throw SmtpError("no recipients");

        SmtpLink link(settings_, diag_);
        link.open();
        link.expect(220, "greeting");

        const std::string ehlo = "EHLO wanwatch";
        link.command(ehlo, 250);
        if (settings_.use_tls && !settings_.use_ssl)
        {
            link.command("STARTTLS", 220);
            link.startTls();
            link.command(ehlo, 250);
        }

        if (!settings_.user.empty())
        {
            link.command("AUTH LOGIN", 334);
            link.command(base64_encode(settings_.user), 334, "<user>");
            link.command(base64_encode(settings_.password), 235, "<password>");
        }

        link.command("MAIL FROM:<" + from + ">", 250);
        for (const auto &rcpt : to)
            link.command("RCPT TO:<" + rcpt + ">", {250, 251}); // 251: not local, will forward
        link.command("DATA", 354);

        std::string body = dot_stuff(message);
        if (body.size() < 2 || body.compare(body.size() - 2, 2, "\r\n") != 0)
            body += "\r\n";
        link.write(body + ".\r\n");
        link.expect(250, "end of DATA");

        // The message is accepted at this point; a failed QUIT is not a delivery failure.
        try
        {
            link.command("QUIT", 221);
        }
        catch (const SmtpError &e)
        {
            if (diag_)
                diag_->debug(std::string("SMTP QUIT: ") + e.what());
        }
    }
} // namespace wanwatch
