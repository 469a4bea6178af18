/**
 * @file test_smtp.cpp
 * @brief Tests for the SMTP wire helpers (reply codes, base64, dot-stuffing) and
 *        for the client dialogue against a scripted server on loopback.
 */
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <string>
#include <thread>
#include <vector>

#include "smtp_client.hpp"

using namespace wanwatch;

namespace {

// Plain-text SMTP server for one connection. Sends the greeting, then answers
// the i-th client line with replies[i]. Lines between a 354 reply and the
// lone "." are collected into message(). When the script runs out the
// connection is closed without answering.
class ScriptedSmtpServer {
public:
  ScriptedSmtpServer(std::string greeting, std::vector<std::string> replies)
      : greeting_(std::move(greeting)), replies_(std::move(replies)) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    set_timeout(listen_fd_);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(listen_fd_, 1);

    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    worker_ = std::thread([this] { serve(); });
  }

  ~ScriptedSmtpServer() {
    join();
    if (listen_fd_ >= 0) ::close(listen_fd_);
  }

  int port() const { return port_; }

  // Waits for the session to end; call before reading commands() or message().
  void join() {
    if (worker_.joinable()) worker_.join();
  }

  const std::vector<std::string>& commands() const { return commands_; }
  const std::string& message() const { return message_; }

private:
  static void set_timeout(int fd) {
    timeval tv{};
    tv.tv_sec = 5;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }

  void serve() {
    int fd = ::accept(listen_fd_, nullptr, nullptr);
    if (fd < 0) return;
    set_timeout(fd);
    send_text(fd, greeting_);

    std::string line;
    std::size_t next = 0;
    bool in_data = false;
    while (read_line(fd, line)) {
      if (in_data) {
        if (line != ".") {
          message_ += line + "\n";
          continue;
        }
        in_data = false;
      }
      commands_.push_back(line);
      if (next >= replies_.size()) break;
      const std::string& reply = replies_[next++];
      send_text(fd, reply);
      if (reply.compare(0, 3, "354") == 0) in_data = true;
    }
    ::close(fd);
  }

  static void send_text(int fd, const std::string& text) {
    std::size_t sent = 0;
    while (sent < text.size()) {
      ssize_t n = ::send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) return;
      sent += static_cast<std::size_t>(n);
    }
  }

  bool read_line(int fd, std::string& line) {
    for (;;) {
      const auto nl = buf_.find('\n');
      if (nl != std::string::npos) {
        line = buf_.substr(0, nl);
        buf_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
      }
      char chunk[512];
      ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
      if (n <= 0) return false;
      buf_.append(chunk, static_cast<std::size_t>(n));
    }
  }

  std::string greeting_;
  std::vector<std::string> replies_;
  int listen_fd_ = -1;
  int port_ = 0;
  std::thread worker_;
  std::string buf_;
  std::vector<std::string> commands_;
  std::string message_;
};

SmtpSettings plain_settings(int port, std::string user = {}, std::string password = {}) {
  SmtpSettings s;
  s.host = "127.0.0.1";
  s.port = port;
  s.user = std::move(user);
  s.password = std::move(password);
  s.use_tls = false;
  s.use_ssl = false;
  s.timeout_ms = 5000;
  return s;
}

const std::string kGreeting = "220 smtp.test ESMTP ready\r\n";
const std::string kEhloReply =
    "250-smtp.test greets wanwatch\r\n"
    "250-SIZE 35882577\r\n"
    "250 AUTH LOGIN PLAIN\r\n";

} // namespace

// ---------- Wire helpers ----------

TEST(SmtpReply, Codes) {
  EXPECT_EQ(parse_reply_code("250 OK"), 250);
  EXPECT_EQ(parse_reply_code("250-PIPELINING"), 250);
  EXPECT_EQ(parse_reply_code("354"), 354);
  EXPECT_EQ(parse_reply_code("25"), -1);
  EXPECT_EQ(parse_reply_code("abc def"), -1);
  EXPECT_EQ(parse_reply_code("250xOK"), -1);
}

TEST(SmtpReply, FinalLineDetection) {
  EXPECT_TRUE(is_final_reply_line("250 OK"));
  EXPECT_TRUE(is_final_reply_line("221"));
  EXPECT_FALSE(is_final_reply_line("250-SIZE 35882577"));
  EXPECT_FALSE(is_final_reply_line("hello"));
}

TEST(Base64, KnownVectors) {
  EXPECT_EQ(base64_encode(""), "");
  EXPECT_EQ(base64_encode("f"), "Zg==");
  EXPECT_EQ(base64_encode("fo"), "Zm8=");
  EXPECT_EQ(base64_encode("foo"), "Zm9v");
  EXPECT_EQ(base64_encode("user@example.com"), "dXNlckBleGFtcGxlLmNvbQ==");
}

TEST(Base64, LinesAreWrappedAt76) {
  const std::string text = base64_lines(std::string(100, 'x'));
  const auto first = text.find("\r\n");
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(first, 76u);
  EXPECT_EQ(text.substr(text.size() - 2), "\r\n");
}

TEST(DotStuff, LeadingDotsAndLineEndings) {
  EXPECT_EQ(dot_stuff(".hidden\nline\n.\n"), "..hidden\r\nline\r\n..\r\n");
  EXPECT_EQ(dot_stuff("a\r\nb"), "a\r\nb");
  EXPECT_EQ(dot_stuff("mid.dot"), "mid.dot");
}

// ---------- Dialogue ----------

TEST(SmtpClient, AuthenticatedDialogueInPlainMode) {
  ScriptedSmtpServer server(kGreeting, {
      kEhloReply,
      "334 VXNlcm5hbWU6\r\n",
      "334 UGFzc3dvcmQ6\r\n",
      "235 2.7.0 Authentication successful\r\n",
      "250 2.1.0 OK\r\n",
      "250 2.1.5 OK\r\n",
      "251 2.1.5 User not local; will forward\r\n",
      "354 End data with <CR><LF>.<CR><LF>\r\n",
      "250 2.0.0 queued as 42\r\n",
      "221 2.0.0 bye\r\n",
  });
  SmtpClient client(plain_settings(server.port(), "alice", "s3cret"));

  EXPECT_NO_THROW(client.send_mail("from@x.test", {"a@x.test", "b@x.test"},
                                   "Subject: hi\r\n\r\n.leading dot\nbody"));
  server.join();

  const std::vector<std::string> expected = {
      "EHLO wanwatch",
      "AUTH LOGIN",
      base64_encode("alice"),
      base64_encode("s3cret"),
      "MAIL FROM:<from@x.test>",
      "RCPT TO:<a@x.test>",
      "RCPT TO:<b@x.test>",
      "DATA",
      ".",
      "QUIT",
  };
  EXPECT_EQ(server.commands(), expected);
  EXPECT_EQ(server.message(), "Subject: hi\n\n..leading dot\nbody\n");
}

TEST(SmtpClient, RejectedPasswordThrows) {
  ScriptedSmtpServer server(kGreeting, {
      kEhloReply,
      "334 VXNlcm5hbWU6\r\n",
      "334 UGFzc3dvcmQ6\r\n",
      "535 5.7.8 Authentication credentials invalid\r\n",
  });
  SmtpClient client(plain_settings(server.port(), "alice", "wrong"));

  EXPECT_THROW(client.send_mail("from@x.test", {"a@x.test"}, "Subject: hi\r\n\r\nbody"), SmtpError);
  server.join();

  ASSERT_EQ(server.commands().size(), 4u);
  EXPECT_EQ(server.commands().back(), base64_encode("wrong"));
}

TEST(SmtpClient, RejectedRecipientThrows) {
  ScriptedSmtpServer server(kGreeting, {
      kEhloReply,
      "250 OK\r\n",
      "550 5.1.1 No such user\r\n",
  });
  SmtpClient client(plain_settings(server.port()));

  EXPECT_THROW(client.send_mail("from@x.test", {"ghost@x.test"}, "Subject: hi\r\n\r\nbody"), SmtpError);
  server.join();
  EXPECT_EQ(server.commands().back(), "RCPT TO:<ghost@x.test>");
}

TEST(SmtpClient, RefusedQuitStillDelivers) {
  ScriptedSmtpServer server(kGreeting, {
      kEhloReply,
      "250 OK\r\n",
      "250 OK\r\n",
      "354 go ahead\r\n",
      "250 queued\r\n",
      "500 5.5.1 Unrecognized command\r\n",
  });
  SmtpClient client(plain_settings(server.port()));

  EXPECT_NO_THROW(client.send_mail("from@x.test", {"a@x.test"}, "Subject: hi\r\n\r\nbody"));
  server.join();
  ASSERT_FALSE(server.commands().empty());
  EXPECT_EQ(server.commands().back(), "QUIT");
}

TEST(SmtpClient, ConnectionDroppedAtQuitStillDelivers) {
  ScriptedSmtpServer server(kGreeting, {
      kEhloReply,
      "250 OK\r\n",
      "250 OK\r\n",
      "354 go ahead\r\n",
      "250 queued\r\n",
  });
  SmtpClient client(plain_settings(server.port()));

  EXPECT_NO_THROW(client.send_mail("from@x.test", {"a@x.test"}, "Subject: hi\r\n\r\nbody"));
  server.join();
}

TEST(SmtpClient, BadGreetingThrows) {
  ScriptedSmtpServer server("554 5.3.2 not accepting mail\r\n", {});
  SmtpClient client(plain_settings(server.port()));

  EXPECT_THROW(client.send_mail("from@x.test", {"a@x.test"}, "Subject: hi\r\n\r\nbody"), SmtpError);
  server.join();
}
