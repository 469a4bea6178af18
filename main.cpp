//// ===================== File: main.cpp =====================
/**
 * wanwatch: WAN address monitor. All settings come from the environment.
 *
 *   DISCORD_ENABLED=true DISCORD_WEBHOOK_URL=https://discord.com/api/webhooks/... ./build/wanwatch
 *   ./build/wanwatch --validate      # check settings and exit
 *   ./build/wanwatch --once          # one check cycle, then exit
 */

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "address_resolver.hpp"
#include "config.hpp"
#include "diag_logger.hpp"
#include "discord_channel.hpp"
#include "email_channel.hpp"
#include "http_client.hpp"
#include "monitor.hpp"
#include "notification_dispatcher.hpp"
#include "smtp_client.hpp"
#include "state_store.hpp"
#include "telegram_channel.hpp"
#include "update_checker.hpp"
#include "version.hpp"

using namespace std;
using namespace wanwatch;

static std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " [--once] [--validate] [--help]\n"
         << "\nOptions:\n"
         << "  --once       run the startup update check and one check cycle, then exit\n"
         << "  --validate   validate the environment configuration and exit\n"
         << "\nConfiguration is read from environment variables (see README).\n";
}

static void print_report(const ValidationReport &r) {
    for (const auto &w : r.warnings) cerr << "WARNING: " << w << "\n";
    for (const auto &e : r.errors) cerr << "ERROR: " << e << "\n";
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    bool once = false;
    bool validate_only = false;
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--once") once = true;
        else if (a == "--validate") validate_only = true;
        else if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        else { cerr << "Unknown option: " << a << "\n"; print_usage(argv[0]); return 1; }
    }

    const EnvLookup env = process_env();
    ValidationReport report = ConfigValidator().validate(env);
    print_report(report);
    if (!report.ok()) {
        cerr << "Configuration invalid (" << report.errors.size() << " error(s)); refusing to start\n";
        return 1;
    }
    if (validate_only) {
        cout << "Configuration OK (" << report.warnings.size() << " warning(s))\n";
        return 0;
    }

    try {
        const Config cfg = load_config(env);

        DiagLogger diag(cfg.log_file, cfg.log_level);
        if (!diag.ok()) {
            cerr << "Error: couldn't open log file: " << cfg.log_file << "\n";
            return 1;
        }
        diag.info(string("wanwatch v") + version_string + " starting on " + cfg.server_name);

        SocketHttpClient http(cfg.http_timeout_s * 1000, string("wanwatch/") + version_string);

        SmtpSettings smtp;
        smtp.host = cfg.email.smtp_host;
        smtp.port = cfg.email.smtp_port;
        smtp.user = cfg.email.smtp_user;
        smtp.password = cfg.email.smtp_password;
        smtp.use_tls = cfg.email.use_tls;
        smtp.use_ssl = cfg.email.use_ssl;
        smtp.timeout_ms = cfg.email.timeout_s * 1000;
        SmtpClient mailer(smtp, &diag);

        NotificationDispatcher dispatcher(cfg.retry, &diag);
        if (cfg.discord.enabled)
            dispatcher.add_channel(make_unique<DiscordChannel>(http, cfg.discord, &diag));
        if (cfg.telegram.enabled)
            dispatcher.add_channel(make_unique<TelegramChannel>(http, cfg.telegram, &diag));
        if (cfg.email.enabled)
            dispatcher.add_channel(make_unique<EmailChannel>(mailer, cfg.email, &diag));
        diag.info("Notification channels: " + to_string(dispatcher.channel_count()));

        AddressResolver resolver(http, default_ipv4_services(), default_ipv6_services(), cfg.ipinfo_token, &diag);
        StateStore store(cfg.state_file, cfg.update_mark_file, &diag);
        UpdateChecker updates(http, store, version_string, release_feed_url, &diag);

        NotifyContext ctx{cfg.server_name, version_string};
        Monitor monitor(cfg, resolver, store, dispatcher, cfg.update_check_enabled ? &updates : nullptr, &diag, ctx);

        if (once) {
            if (cfg.update_check_on_startup) monitor.maybe_check_update(Monitor::clock::now());
            CycleReport r = monitor.run_guarded_cycle();
            diag.info(string("Cycle ") + to_string(r.status));
            return r.status == CycleStatus::Completed ? 0 : 1;
        }

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        monitor.run(g_stop);
        diag.info("wanwatch stopped");
        return 0;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
