// ===================== src/config.cpp =====================
#include "config.hpp"
#include "parsed_url.hpp"
#include "string_utils.hpp"

#include <cstdlib>
#include <regex>

namespace wanwatch
{
    namespace
    {
        std::string get(const EnvLookup &env, const std::string &key, const std::string &def)
        {
            auto v = env(key);
            return v ? *v : def;
        }

        bool get_bool(const EnvLookup &env, const std::string &key, bool def)
        {
            auto v = env(key);
            if (!v)
                return def;
            return to_lower(trim(*v)) == "true";
        }

        int get_int(const EnvLookup &env, const std::string &key, int def)
        {
            auto v = env(key);
            if (!v || trim(*v).empty())
                return def;
            try
            {
                size_t used = 0;
                int n = std::stoi(trim(*v), &used);
                if (used != trim(*v).size())
                    throw std::invalid_argument(*v);
                return n;
            }
            catch (const std::exception &)
            {
                throw ConfigError(key + ": invalid number '" + *v + "'");
            }
        }

        bool is_true(const std::string &v) { return to_lower(trim(v)) == "true"; }
    } // namespace

    std::size_t Config::enabled_channel_count() const
    {
        return static_cast<std::size_t>(discord.enabled) + static_cast<std::size_t>(telegram.enabled) +
               static_cast<std::size_t>(email.enabled);
    }

    EnvLookup process_env()
    {
        return [](const std::string &key) -> std::optional<std::string>
        {
            const char *v = std::getenv(key.c_str());
            if (!v)
                return std::nullopt;
            return std::string(v);
        };
    }

    EnvLookup map_env(std::map<std::string, std::string> values)
    {
        return [values = std::move(values)](const std::string &key) -> std::optional<std::string>
        {
            auto it = values.find(key);
            if (it == values.end())
                return std::nullopt;
            return it->second;
        };
    }

    Config load_config(const EnvLookup &env)
    {
        Config c;

        c.discord.enabled = get_bool(env, "DISCORD_ENABLED", false);
        c.discord.webhook_url = trim(get(env, "DISCORD_WEBHOOK_URL", ""));
        c.discord.avatar_url = trim(get(env, "DISCORD_AVATAR_URL", ""));
        c.discord.bot_name = get(env, "BOT_NAME", c.discord.bot_name);

        c.telegram.enabled = get_bool(env, "TELEGRAM_ENABLED", false);
        c.telegram.bot_token = trim(get(env, "TELEGRAM_BOT_TOKEN", ""));
        c.telegram.chat_id = trim(get(env, "TELEGRAM_CHAT_ID", ""));
        c.telegram.parse_mode = get(env, "TELEGRAM_PARSE_MODE", c.telegram.parse_mode);

        c.email.enabled = get_bool(env, "EMAIL_ENABLED", false);
        c.email.smtp_host = trim(get(env, "EMAIL_SMTP_HOST", ""));
        c.email.smtp_port = get_int(env, "EMAIL_SMTP_PORT", c.email.smtp_port);
        c.email.smtp_user = get(env, "EMAIL_SMTP_USER", "");
        c.email.smtp_password = get(env, "EMAIL_SMTP_PASSWORD", "");
        c.email.from = trim(get(env, "EMAIL_FROM", ""));
        c.email.to = split_list(get(env, "EMAIL_TO", ""));
        c.email.use_tls = get_bool(env, "EMAIL_USE_TLS", true);
        c.email.use_ssl = get_bool(env, "EMAIL_USE_SSL", false);
        c.email.subject_prefix = get(env, "EMAIL_SUBJECT_PREFIX", c.email.subject_prefix);

        c.check_interval_s = get_int(env, "CHECK_INTERVAL", c.check_interval_s);
        c.monitor_ipv4 = get_bool(env, "MONITOR_IPV4", true);
        c.monitor_ipv6 = get_bool(env, "MONITOR_IPV6", true);

        c.update_check_enabled = get_bool(env, "UPDATE_CHECK_ENABLED", true);
        c.update_check_interval_s = get_int(env, "UPDATE_CHECK_INTERVAL", c.update_check_interval_s);
        c.update_check_on_startup = get_bool(env, "UPDATE_CHECK_ON_STARTUP", true);

        c.ipinfo_token = trim(get(env, "IPINFO_TOKEN", ""));
        c.server_name = get(env, "SERVER_NAME", c.server_name);
        c.state_file = get(env, "IP_DB_FILE", c.state_file);
        c.update_mark_file = get(env, "UPDATE_MARK_FILE", c.update_mark_file);
        c.log_file = get(env, "LOG_FILE", c.log_file);
        c.log_level = parse_log_level(get(env, "LOG_LEVEL", "INFO"));

        c.http_timeout_s = get_int(env, "HTTP_TIMEOUT", c.http_timeout_s);
        c.retry.max_retries = get_int(env, "NOTIFY_MAX_RETRIES", c.retry.max_retries);
        c.retry.base_delay = std::chrono::seconds(get_int(env, "NOTIFY_BASE_DELAY", 2));
        return c;
    }

    // ---------------------------------------------------------------------
    // Validator
    // ---------------------------------------------------------------------

    bool ConfigValidator::validate_url(const std::string &url, const std::string &name, bool require_https,
                                       ValidationReport &r) const
    {
        if (url.empty())
            return false;
        if (url.find("://") == std::string::npos)
        {
            r.errors.push_back(name + ": Missing URL scheme (http:// or https://)");
            return false;
        }
        ParsedURL parsed(url);
        if (!parsed.valid())
        {
            r.errors.push_back(name + ": Invalid URL format (missing domain)");
            return false;
        }
        if (require_https && !parsed.isHttps())
            r.warnings.push_back(name + ": Using non-HTTPS URL is not recommended for security");
        if (url.size() > 2048)
        {
            r.errors.push_back(name + ": URL exceeds maximum length of 2048 characters");
            return false;
        }
        return true;
    }

    bool ConfigValidator::validate_email(const std::string &email, const std::string &name, ValidationReport &r) const
    {
        if (email.empty())
            return false;
        static const std::regex pattern(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
        if (!std::regex_match(email, pattern))
        {
            r.errors.push_back(name + ": Invalid email format '" + email + "'");
            return false;
        }
        return true;
    }

    bool ConfigValidator::validate_port(const std::string &port, const std::string &name, ValidationReport &r) const
    {
        static const std::regex digits(R"(^\d{1,6}$)");
        if (!std::regex_match(trim(port), digits))
        {
            r.errors.push_back(name + ": Invalid port number '" + port + "'");
            return false;
        }
        int n = std::stoi(trim(port));
        if (n < 1 || n > 65535)
        {
            r.errors.push_back(name + ": Port must be between 1 and 65535, got " + std::to_string(n));
            return false;
        }
        return true;
    }

    bool ConfigValidator::validate_interval(const std::string &value, const std::string &name, int min_val,
                                            ValidationReport &r) const
    {
        static const std::regex digits(R"(^-?\d{1,9}$)");
        if (!std::regex_match(trim(value), digits))
        {
            r.errors.push_back(name + ": Invalid interval '" + value + "'");
            return false;
        }
        int n = std::stoi(trim(value));
        if (n < min_val)
        {
            r.errors.push_back(name + ": Interval must be at least " + std::to_string(min_val) + " seconds, got " +
                               std::to_string(n));
            return false;
        }
        return true;
    }

    bool ConfigValidator::validate_boolean(const std::string &value, const std::string &name, ValidationReport &r) const
    {
        const std::string v = to_lower(trim(value));
        if (v != "true" && v != "false")
        {
            r.errors.push_back(name + ": Must be 'true' or 'false', got '" + value + "'");
            return false;
        }
        return true;
    }

    bool ConfigValidator::validate_telegram_token(const std::string &token, ValidationReport &r) const
    {
        if (token.empty())
            return false;
        static const std::regex pattern(R"(^\d{8,10}:[A-Za-z0-9_-]{30,50}$)");
        if (!std::regex_match(token, pattern))
        {
            r.errors.push_back("TELEGRAM_BOT_TOKEN: Invalid format (should be like 123456789:ABCdefGHI...)");
            return false;
        }
        return true;
    }

    bool ConfigValidator::validate_telegram_chat_id(const std::string &chat_id, ValidationReport &r) const
    {
        if (chat_id.empty())
            return false;
        if (chat_id[0] == '@')
            return true;
        static const std::regex numeric(R"(^-?\d+$)");
        if (!std::regex_match(chat_id, numeric))
        {
            r.errors.push_back("TELEGRAM_CHAT_ID: Must be numeric or start with @ for username");
            return false;
        }
        return true;
    }

    ValidationReport ConfigValidator::validate(const EnvLookup &env) const
    {
        ValidationReport r;

        // Discord
        const std::string discord_enabled = get(env, "DISCORD_ENABLED", "false");
        const std::string discord_webhook = trim(get(env, "DISCORD_WEBHOOK_URL", ""));
        const std::string discord_avatar = trim(get(env, "DISCORD_AVATAR_URL", ""));
        bool discord_ok = false;
        if (validate_boolean(discord_enabled, "DISCORD_ENABLED", r) && is_true(discord_enabled))
        {
            if (discord_webhook.empty())
                r.errors.push_back("DISCORD_ENABLED is true but DISCORD_WEBHOOK_URL is not set");
            else if (validate_url(discord_webhook, "DISCORD_WEBHOOK_URL", true, r))
            {
                discord_ok = true;
                if (discord_webhook.find("discord.com/api/webhooks/") == std::string::npos)
                    r.warnings.push_back("DISCORD_WEBHOOK_URL doesn't appear to be a Discord webhook URL");
                if (!discord_avatar.empty() && !validate_url(discord_avatar, "DISCORD_AVATAR_URL", false, r))
                    discord_ok = false;
            }
        }

        // Telegram
        const std::string telegram_enabled = get(env, "TELEGRAM_ENABLED", "false");
        const std::string telegram_token = trim(get(env, "TELEGRAM_BOT_TOKEN", ""));
        const std::string telegram_chat = trim(get(env, "TELEGRAM_CHAT_ID", ""));
        const std::string telegram_mode = get(env, "TELEGRAM_PARSE_MODE", "HTML");
        bool telegram_ok = false;
        if (validate_boolean(telegram_enabled, "TELEGRAM_ENABLED", r) && is_true(telegram_enabled))
        {
            if (telegram_token.empty())
                r.errors.push_back("TELEGRAM_ENABLED is true but TELEGRAM_BOT_TOKEN is not set");
            else if (telegram_chat.empty())
                r.errors.push_back("TELEGRAM_ENABLED is true but TELEGRAM_CHAT_ID is not set");
            else if (validate_telegram_token(telegram_token, r) && validate_telegram_chat_id(telegram_chat, r))
            {
                telegram_ok = true;
                if (telegram_mode != "HTML" && telegram_mode != "Markdown" && telegram_mode != "MarkdownV2")
                    r.warnings.push_back("TELEGRAM_PARSE_MODE: Unknown mode '" + telegram_mode + "', use HTML or Markdown");
            }
        }

        // Email
        const std::string email_enabled = get(env, "EMAIL_ENABLED", "false");
        bool email_ok = false;
        if (validate_boolean(email_enabled, "EMAIL_ENABLED", r) && is_true(email_enabled))
        {
            const std::vector<std::pair<std::string, std::string>> required = {
                {"EMAIL_SMTP_HOST", trim(get(env, "EMAIL_SMTP_HOST", ""))},
                {"EMAIL_SMTP_USER", get(env, "EMAIL_SMTP_USER", "")},
                {"EMAIL_SMTP_PASSWORD", get(env, "EMAIL_SMTP_PASSWORD", "")},
                {"EMAIL_FROM", trim(get(env, "EMAIL_FROM", ""))},
                {"EMAIL_TO", trim(get(env, "EMAIL_TO", ""))},
            };
            bool fields_ok = true;
            for (const auto &f : required)
            {
                if (f.second.empty())
                {
                    r.errors.push_back("EMAIL_ENABLED is true but " + f.first + " is not set");
                    fields_ok = false;
                    break;
                }
            }

            const std::string use_tls = get(env, "EMAIL_USE_TLS", "true");
            const std::string use_ssl = get(env, "EMAIL_USE_SSL", "false");
            if (fields_ok && validate_port(get(env, "EMAIL_SMTP_PORT", "587"), "EMAIL_SMTP_PORT", r) &&
                validate_email(trim(get(env, "EMAIL_FROM", "")), "EMAIL_FROM", r))
            {
                bool to_ok = true;
                for (const auto &to : split_list(get(env, "EMAIL_TO", "")))
                {
                    if (!validate_email(to, "EMAIL_TO", r))
                    {
                        to_ok = false;
                        break;
                    }
                }
                if (to_ok && validate_boolean(use_tls, "EMAIL_USE_TLS", r) &&
                    validate_boolean(use_ssl, "EMAIL_USE_SSL", r))
                {
                    if (is_true(use_tls) && is_true(use_ssl))
                        r.errors.push_back("EMAIL_USE_TLS and EMAIL_USE_SSL cannot both be enabled");
                    else
                        email_ok = true;
                }
            }
        }

        // General
        const std::string check_interval = get(env, "CHECK_INTERVAL", "900");
        if (validate_interval(check_interval, "CHECK_INTERVAL", 60, r) && std::stoi(trim(check_interval)) < 300)
            r.warnings.push_back("CHECK_INTERVAL is less than 5 minutes - may cause excessive API calls");

        const std::string monitor_ipv4 = get(env, "MONITOR_IPV4", "true");
        const std::string monitor_ipv6 = get(env, "MONITOR_IPV6", "true");
        if (validate_boolean(monitor_ipv4, "MONITOR_IPV4", r) && validate_boolean(monitor_ipv6, "MONITOR_IPV6", r) &&
            !is_true(monitor_ipv4) && !is_true(monitor_ipv6))
            r.errors.push_back("Both MONITOR_IPV4 and MONITOR_IPV6 are disabled - at least one must be enabled");

        // Update check
        const std::string update_enabled = get(env, "UPDATE_CHECK_ENABLED", "true");
        if (validate_boolean(update_enabled, "UPDATE_CHECK_ENABLED", r) && is_true(update_enabled))
        {
            if (validate_interval(get(env, "UPDATE_CHECK_INTERVAL", "86400"), "UPDATE_CHECK_INTERVAL", 3600, r))
                validate_boolean(get(env, "UPDATE_CHECK_ON_STARTUP", "true"), "UPDATE_CHECK_ON_STARTUP", r);
        }

        // Tunables
        validate_interval(get(env, "HTTP_TIMEOUT", "10"), "HTTP_TIMEOUT", 1, r);
        validate_interval(get(env, "NOTIFY_MAX_RETRIES", "3"), "NOTIFY_MAX_RETRIES", 1, r);
        validate_interval(get(env, "NOTIFY_BASE_DELAY", "2"), "NOTIFY_BASE_DELAY", 0, r);

        if (!is_true(discord_enabled) && !is_true(telegram_enabled) && !is_true(email_enabled))
            r.errors.push_back("No notification methods enabled - at least one must be configured");
        else if (!discord_ok && !telegram_ok && !email_ok)
            r.errors.push_back("No notification platforms properly configured - check your settings");

        return r;
    }
} // namespace wanwatch
