// ===================== src/message_format.cpp =====================
#include "message_format.hpp"
#include "string_utils.hpp"

namespace wanwatch
{
    std::string event_title(const ChangeEvent &event)
    {
        return event.is_first_run() ? "Initial IP Detection" : "IP Address Changed";
    }

    std::vector<FieldChange> field_changes(const ChangeEvent &event)
    {
        std::vector<FieldChange> out;
        if (event.is_first_run())
            return out;
        if (event.ipv4_changed())
            out.push_back({"IPv4", value_or_none(event.previous.ipv4), value_or_none(event.current.ipv4)});
        if (event.ipv6_changed())
            out.push_back({"IPv6", value_or_none(event.previous.ipv6), value_or_none(event.current.ipv6)});
        return out;
    }

    std::string location_text(const GeoInfo &geo)
    {
        std::vector<std::string> parts;
        for (const auto *p : {&geo.city, &geo.region, &geo.country})
            if (!p->empty())
                parts.push_back(*p);
        return join(parts, ", ");
    }

    std::vector<std::string> changelog_items(const std::string &release_body, std::size_t max_items)
    {
        std::vector<std::string> items;
        auto lines = split(release_body, '\n');
        if (lines.size() > 8)
            lines.resize(8);

        static const char *bullets[] = {"- ", "* ", "\xE2\x80\xA2 "}; // "• "
        for (const auto &raw : lines)
        {
            std::string line = trim(raw);
            for (const char *b : bullets)
            {
                if (!starts_with(line, b))
                    continue;
                std::string cleaned = trim(line.substr(std::string(b).size()));
                while (!cleaned.empty() && (cleaned[0] == '-' || cleaned[0] == '*'))
                    cleaned = trim(cleaned.substr(1));
                if (!cleaned.empty() && cleaned[0] != '#')
                    items.push_back(cleaned);
                break;
            }
            if (items.size() == max_items)
                break;
        }
        return items;
    }

    std::string truncate(const std::string &s, std::size_t max_chars)
    {
        if (s.size() <= max_chars)
            return s;
        // Never split a multi-byte UTF-8 sequence: back up over continuation bytes.
        std::size_t cut = max_chars;
        while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80)
            --cut;
        return s.substr(0, cut);
    }
} // namespace wanwatch
