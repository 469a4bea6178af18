// ===================== include/state_store.hpp =====================
#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "address_pair.hpp"

namespace wanwatch
{
    class DiagLogger;

    class StateError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Sole owner of the address-state file and the update-notified mark.
    class StateStore
    {
    public:
        // A reader returns nullopt when the content is not in its format.
        struct FormatReader
        {
            const char *name;
            std::function<std::optional<AddressPair>(const std::string &)> read;
        };

        StateStore(std::string state_path, std::string mark_path, DiagLogger *diag = nullptr);

        // {} when there is no prior state or the file is unreadable/corrupt. Never throws.
        AddressPair load() const;
        // Whole-record overwrite with a fresh last_updated. Throws StateError.
        void save(const AddressPair &pair) const;

        std::optional<std::string> load_update_mark() const;
        void save_update_mark(const std::string &version) const;

        // last_updated of the structured record, if any.
        std::optional<std::string> last_updated() const;

        const std::string &state_path() const { return state_path_; }
        const std::string &mark_path() const { return mark_path_; }

        // Tried in order: structured JSON record, then legacy bare IPv4 text.
        static const std::vector<FormatReader> &format_readers();
        static std::optional<AddressPair> parse_state(const std::string &content);
        static std::optional<AddressPair> read_structured(const std::string &content);
        static std::optional<AddressPair> read_legacy(const std::string &content);

    private:
        std::string state_path_;
        std::string mark_path_;
        DiagLogger *diag_;
    };

    // Writes content to path via a temporary sibling and rename(). Throws StateError.
    void write_file_atomically(const std::string &path, const std::string &content);
} // namespace wanwatch
