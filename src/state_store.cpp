// ===================== src/state_store.cpp =====================
#include "state_store.hpp"
#include "diag_logger.hpp"
#include "ip_address.hpp"
#include "string_utils.hpp"
#include "time_utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace wanwatch
{
    namespace
    {
        std::optional<std::string> read_file(const std::string &path)
        {
            std::error_code ec;
            if (!fs::exists(path, ec))
                return std::nullopt;
            std::ifstream in(path, std::ios::binary);
            if (!in)
                return std::nullopt;
            std::ostringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }

        // string -> value, null -> unset, anything else -> not our format
        bool read_field(const nlohmann::json &j, const char *key, std::optional<std::string> &out)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                out.reset();
                return true;
            }
            if (!it->is_string())
                return false;
            std::string v = trim(it->get<std::string>());
            if (v.empty())
                out.reset();
            else
                out = v;
            return true;
        }

        nlohmann::json to_json_value(const std::optional<std::string> &v)
        {
            return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
        }
    } // namespace

    void write_file_atomically(const std::string &path, const std::string &content)
    {
        const fs::path target(path);
        std::error_code ec;
        if (target.has_parent_path())
        {
            fs::create_directories(target.parent_path(), ec);
            if (ec)
                throw StateError("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }

        const fs::path tmp = target.string() + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out)
                throw StateError("Cannot open " + tmp.string() + " for writing");
            out << content;
            out.flush();
            if (!out)
                throw StateError("Write to " + tmp.string() + " failed");
        }
        fs::rename(tmp, target, ec);
        if (ec)
        {
            fs::remove(tmp, ec);
            throw StateError("Cannot replace " + path + ": " + ec.message());
        }
    }

    StateStore::StateStore(std::string state_path, std::string mark_path, DiagLogger *diag)
        : state_path_(std::move(state_path)), mark_path_(std::move(mark_path)), diag_(diag) {}

    std::optional<AddressPair> StateStore::read_structured(const std::string &content)
    {
        auto j = nlohmann::json::parse(content, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;
        if (!j.contains("ipv4") && !j.contains("ipv6"))
            return std::nullopt;

        AddressPair pair;
        if (!read_field(j, "ipv4", pair.ipv4) || !read_field(j, "ipv6", pair.ipv6))
            return std::nullopt;
        return pair;
    }

    std::optional<AddressPair> StateStore::read_legacy(const std::string &content)
    {
        std::string text = trim(content);
        if (text.size() >= 2 && text.front() == '"' && text.back() == '"')
            text = trim(text.substr(1, text.size() - 2));
        if (!is_valid_ipv4(text))
            return std::nullopt;
        AddressPair pair;
        pair.ipv4 = text;
        return pair;
    }

    const std::vector<StateStore::FormatReader> &StateStore::format_readers()
    {
        static const std::vector<FormatReader> readers = {
            {"structured", &StateStore::read_structured},
            {"legacy-ipv4", &StateStore::read_legacy},
        };
        return readers;
    }

    std::optional<AddressPair> StateStore::parse_state(const std::string &content)
    {
        for (const auto &reader : format_readers())
        {
            if (auto pair = reader.read(content))
                return pair;
        }
        return std::nullopt;
    }

    AddressPair StateStore::load() const
    {
        std::optional<std::string> content;
        try
        {
            content = read_file(state_path_);
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->error("Error reading previous IP state from " + state_path_ + ": " + e.what());
            return {};
        }

        if (!content)
        {
            if (diag_)
                diag_->info("No previous IP found (first run)");
            return {};
        }

        for (const auto &reader : format_readers())
        {
            if (auto pair = reader.read(*content))
            {
                if (diag_)
                    diag_->debug(std::string("Previous state (") + reader.name + "): " + to_string(*pair));
                return *pair;
            }
        }

        if (diag_)
            diag_->error("State file " + state_path_ + " is corrupt, treating as first run");
        return {};
    }

    void StateStore::save(const AddressPair &pair) const
    {
        nlohmann::json j;
        j["ipv4"] = to_json_value(pair.ipv4);
        j["ipv6"] = to_json_value(pair.ipv6);
        j["last_updated"] = iso8601_utc();
        write_file_atomically(state_path_, j.dump(2) + "\n");
        if (diag_)
            diag_->debug("Saved current state: " + to_string(pair));
    }

    std::optional<std::string> StateStore::last_updated() const
    {
        auto content = read_file(state_path_);
        if (!content)
            return std::nullopt;
        auto j = nlohmann::json::parse(*content, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::nullopt;
        auto it = j.find("last_updated");
        if (it == j.end() || !it->is_string())
            return std::nullopt;
        return it->get<std::string>();
    }

    std::optional<std::string> StateStore::load_update_mark() const
    {
        std::optional<std::string> content;
        try
        {
            content = read_file(mark_path_);
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->warn("Error reading update mark " + mark_path_ + ": " + e.what());
            return std::nullopt;
        }
        if (!content)
            return std::nullopt;
        std::string v = trim(*content);
        if (v.empty())
            return std::nullopt;
        return v;
    }

    void StateStore::save_update_mark(const std::string &version) const
    {
        write_file_atomically(mark_path_, version + "\n");
        if (diag_)
            diag_->debug("Recorded update notification for version " + version);
    }
} // namespace wanwatch
