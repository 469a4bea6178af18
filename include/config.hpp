// ===================== include/config.hpp =====================
#pragma once
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "diag_logger.hpp"
#include "retry.hpp"

namespace wanwatch
{
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct DiscordConfig
    {
        bool enabled = false;
        std::string webhook_url;
        std::string avatar_url;
        std::string bot_name = "WANwatcher";
    };

    struct TelegramConfig
    {
        bool enabled = false;
        std::string bot_token;
        std::string chat_id;
        std::string parse_mode = "HTML";
    };

    struct EmailConfig
    {
        bool enabled = false;
        std::string smtp_host;
        int smtp_port = 587;
        std::string smtp_user;
        std::string smtp_password;
        std::string from;
        std::vector<std::string> to;
        bool use_tls = true;
        bool use_ssl = false;
        std::string subject_prefix = "[WANwatcher]";
        int timeout_s = 30;
    };

    // Built once at startup, then only read.
    struct Config
    {
        DiscordConfig discord;
        TelegramConfig telegram;
        EmailConfig email;

        int check_interval_s = 900;
        bool monitor_ipv4 = true;
        bool monitor_ipv6 = true;

        bool update_check_enabled = true;
        int update_check_interval_s = 86400;
        bool update_check_on_startup = true;

        std::string ipinfo_token;
        std::string server_name = "WANwatcher Docker";
        std::string state_file = "/data/ipinfo.db";
        std::string update_mark_file = "/data/last_update_notified.txt";
        std::string log_file = "/logs/wanwatcher.log";
        LogLevel log_level = LogLevel::Info;

        int http_timeout_s = 10;
        RetryPolicy retry;

        std::size_t enabled_channel_count() const;
    };

    // Raw setting source; nullopt when a variable is not set.
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    EnvLookup process_env();
    EnvLookup map_env(std::map<std::string, std::string> values);

    // Expects values that passed ConfigValidator; throws ConfigError on
    // numbers that still do not parse.
    Config load_config(const EnvLookup &env);

    struct ValidationReport
    {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        bool ok() const { return errors.empty(); }
    };

    // Pre-flight gate run before anything else starts.
    class ConfigValidator
    {
    public:
        ValidationReport validate(const EnvLookup &env) const;

        bool validate_url(const std::string &url, const std::string &name, bool require_https, ValidationReport &r) const;
        bool validate_email(const std::string &email, const std::string &name, ValidationReport &r) const;
        bool validate_port(const std::string &port, const std::string &name, ValidationReport &r) const;
        bool validate_interval(const std::string &value, const std::string &name, int min_val, ValidationReport &r) const;
        bool validate_boolean(const std::string &value, const std::string &name, ValidationReport &r) const;
        bool validate_telegram_token(const std::string &token, ValidationReport &r) const;
        bool validate_telegram_chat_id(const std::string &chat_id, ValidationReport &r) const;
    };
} // namespace wanwatch
