// ===================== src/http_client.cpp =====================
#include "http_client.hpp"
#include "dns_resolver.hpp"
#include "parsed_url.hpp"
#include "ssl_session.hpp"
#include "string_utils.hpp"
#include "tcp_socket.hpp"

namespace wanwatch
{
    std::string HttpResponse::header(const std::string &name) const
    {
        for (const auto &h : headers)
            if (iequals(h.first, name))
                return h.second;
        return {};
    }

    HttpResponse HttpClient::get(const std::string &url, const HttpHeaders &headers, int family)
    {
        HttpRequest req;
        req.url = url;
        req.headers = headers;
        req.family = family;
        return send(req);
    }

    HttpResponse HttpClient::postJson(const std::string &url, const std::string &json, const HttpHeaders &headers)
    {
        HttpRequest req;
        req.method = "POST";
        req.url = url;
        req.headers = headers;
        req.headers.emplace_back("Content-Type", "application/json");
        req.body = json;
        return send(req);
    }

    std::string build_request(const HttpRequest &request, const std::string &user_agent)
    {
        ParsedURL url(request.url);
        std::string req = request.method + " " + url.path + " HTTP/1.1\r\n" +
                          "Host: " + url.hostHeader() + "\r\n";

        bool has_agent = false;
        for (const auto &h : request.headers)
        {
            if (iequals(h.first, "User-Agent"))
                has_agent = true;
            req += h.first + ": " + h.second + "\r\n";
        }
        if (!has_agent)
            req += "User-Agent: " + user_agent + "\r\n";
        if (!request.body.empty() || request.method == "POST")
            req += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
        req += "Connection: close\r\n\r\n";
        req += request.body;
        return req;
    }

    std::string decode_chunked(const std::string &body)
    {
        std::string decoded;
        size_t pos = 0;
        while (pos < body.size())
        {
            size_t line_end = body.find("\r\n", pos);
            if (line_end == std::string::npos)
                break;
            // chunk extensions (";name=value") are ignored
            std::string size_str = body.substr(pos, line_end - pos);
            size_t semi = size_str.find(';');
            if (semi != std::string::npos)
                size_str = size_str.substr(0, semi);
            size_t chunk_size = 0;
            try
            {
                chunk_size = std::stoul(trim(size_str), nullptr, 16);
            }
            catch (const std::exception &)
            {
                break;
            }
            pos = line_end + 2;
            if (chunk_size == 0)
                break;
            if (pos + chunk_size <= body.size())
                decoded.append(body, pos, chunk_size);
            else
            {
                decoded.append(body, pos, std::string::npos); // truncated final chunk
                break;
            }
            pos += chunk_size + 2; // skip CRLF
        }
        return decoded;
    }

    HttpResponse parse_http_response(const std::string &raw)
    {
        size_t header_end = raw.find("\r\n\r\n");
        if (raw.empty() || header_end == std::string::npos)
            throw HttpError("malformed HTTP response (no header terminator)");

        const std::string head = raw.substr(0, header_end);
        std::string body = raw.substr(header_end + 4);

        std::vector<std::string> lines = split(head, '\n');
        std::string status_line = trim(lines.front());
        if (!starts_with(status_line, "HTTP/"))
            throw HttpError("malformed HTTP status line: " + status_line);

        HttpResponse resp;
        size_t sp1 = status_line.find(' ');
        if (sp1 == std::string::npos)
            throw HttpError("malformed HTTP status line: " + status_line);
        size_t sp2 = status_line.find(' ', sp1 + 1);
        try
        {
            resp.status = std::stoi(status_line.substr(sp1 + 1, sp2 - sp1 - 1));
        }
        catch (const std::exception &)
        {
            throw HttpError("malformed HTTP status code: " + status_line);
        }
        if (sp2 != std::string::npos)
            resp.reason = status_line.substr(sp2 + 1);

        for (size_t i = 1; i < lines.size(); ++i)
        {
            std::string line = trim(lines[i]);
            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            resp.headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }

        if (to_lower(resp.header("Transfer-Encoding")).find("chunked") != std::string::npos)
            body = decode_chunked(body);
        resp.body = std::move(body);
        return resp;
    }

    SocketHttpClient::SocketHttpClient(int timeout_ms, std::string user_agent)
        : timeout_ms_(timeout_ms), user_agent_(std::move(user_agent)) {}

    HttpResponse SocketHttpClient::send(const HttpRequest &request)
    {
        ParsedURL parsed(request.url);
        if (!parsed.valid())
            throw HttpError("invalid URL: " + request.url);

        auto addrs = DNSResolver::resolve(parsed.host, parsed.port, request.family);
        const std::string req = build_request(request, user_agent_);

        std::string last_error = "connect failed for all resolved addresses of " + parsed.host;
        for (const auto &ra : addrs)
        {
            TcpSocket tcp(timeout_ms_);
            if (!tcp.connectTo(ra))
                continue;

            std::string raw;
            if (parsed.isHttps())
            {
                SslSession tls;
                if (!tls.handshake(tcp.fd(), parsed.host))
                {
                    last_error = tls.lastError();
                    continue;
                }
                if (!tls.sendAll(req))
                    throw HttpError("TLS send to " + parsed.host + " failed");
                raw = tls.recvAll();
            }
            else
            {
                if (!tcp.sendAll(req))
                    throw HttpError("TCP send to " + parsed.host + " failed");
                raw = tcp.recvAll();
            }
            if (raw.empty())
                throw HttpError("empty response from " + parsed.host + " (timeout or connection reset)");
            return parse_http_response(raw);
        }
        throw HttpError(last_error);
    }
} // namespace wanwatch
