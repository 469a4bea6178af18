// ===================== src/string_utils.cpp =====================
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace wanwatch
{
    std::string trim(const std::string &s)
    {
        const char *ws = " \t\r\n\f\v";
        size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos)
            return {};
        size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    std::string to_lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string to_upper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    bool iequals(const std::string &a, const std::string &b)
    {
        return a.size() == b.size() && to_lower(a) == to_lower(b);
    }

    bool starts_with(const std::string &s, const std::string &prefix)
    {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    std::vector<std::string> split(const std::string &s, char sep)
    {
        std::vector<std::string> out;
        size_t start = 0;
        while (true)
        {
            size_t pos = s.find(sep, start);
            if (pos == std::string::npos)
            {
                out.push_back(s.substr(start));
                break;
            }
            out.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        return out;
    }

    std::vector<std::string> split_list(const std::string &s, char sep)
    {
        std::vector<std::string> out;
        for (const auto &piece : split(s, sep))
        {
            std::string t = trim(piece);
            if (!t.empty())
                out.push_back(t);
        }
        return out;
    }

    std::string join(const std::vector<std::string> &parts, const std::string &sep)
    {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i)
        {
            if (i)
                out += sep;
            out += parts[i];
        }
        return out;
    }

    std::string html_escape(const std::string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s)
        {
            switch (c)
            {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
            }
        }
        return out;
    }
} // namespace wanwatch
