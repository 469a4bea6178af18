// ===================== src/update_checker.cpp =====================
#include "update_checker.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"
#include "state_store.hpp"
#include "string_utils.hpp"

#include <regex>
#include <nlohmann/json.hpp>

namespace wanwatch
{
    namespace
    {
        std::string strip_v(const std::string &s)
        {
            std::string t = trim(s);
            if (!t.empty() && (t[0] == 'v' || t[0] == 'V'))
                t.erase(0, 1);
            return t;
        }
    } // namespace

    SemVer parse_version(const std::string &text)
    {
        static const std::regex re(R"(^(\d+)(?:\.(\d+))?(?:\.(\d+))?)");
        const std::string t = strip_v(text);
        std::smatch m;
        SemVer v;
        if (!std::regex_search(t, m, re))
            return v;
        try
        {
            v.major = std::stoi(m[1].str());
            v.minor = m[2].matched ? std::stoi(m[2].str()) : 0;
            v.patch = m[3].matched ? std::stoi(m[3].str()) : 0;
        }
        catch (const std::out_of_range &)
        {
            return SemVer{};
        }
        return v;
    }

    UpdateChecker::UpdateChecker(HttpClient &http, const StateStore &store, std::string current_version,
                                 std::string feed_url, DiagLogger *diag)
        : http_(http), store_(store), current_version_(std::move(current_version)),
          feed_url_(std::move(feed_url)), diag_(diag) {}

    std::optional<UpdateInfo> UpdateChecker::parse_release(const std::string &body, const std::string &current_version)
    {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;
        auto tag = j.find("tag_name");
        if (tag == j.end() || !tag->is_string() || strip_v(tag->get<std::string>()).empty())
            return std::nullopt;

        UpdateInfo info;
        info.current_version = strip_v(current_version);
        info.latest_version = strip_v(tag->get<std::string>());
        auto url = j.find("html_url");
        if (url != j.end() && url->is_string())
            info.release_url = url->get<std::string>();
        auto rel_body = j.find("body");
        if (rel_body != j.end() && rel_body->is_string())
            info.release_body = rel_body->get<std::string>();
        return info;
    }

    std::optional<UpdateInfo> UpdateChecker::check() const
    {
        HttpResponse resp;
        try
        {
            resp = http_.get(feed_url_, {{"User-Agent", "wanwatch/" + current_version_},
                                         {"Accept", "application/vnd.github+json"}});
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->warn(std::string("Update check failed: ") + e.what());
            return std::nullopt;
        }
        if (!resp.ok())
        {
            if (diag_)
                diag_->warn("Update check failed: release feed returned status " + std::to_string(resp.status));
            return std::nullopt;
        }

        auto info = parse_release(resp.body, current_version_);
        if (!info)
        {
            if (diag_)
                diag_->warn("Update check failed: unreadable release feed");
            return std::nullopt;
        }

        if (!(parse_version(info->latest_version) > parse_version(info->current_version)))
        {
            if (diag_)
                diag_->debug("Running latest version (v" + info->current_version + ")");
            return std::nullopt;
        }

        auto mark = store_.load_update_mark();
        if (mark && strip_v(*mark) == info->latest_version)
        {
            if (diag_)
                diag_->debug("Update v" + info->latest_version + " already notified");
            return std::nullopt;
        }

        if (diag_)
            diag_->info("Update available: v" + info->current_version + " -> v" + info->latest_version);
        return info;
    }
} // namespace wanwatch
