// ===================== include/string_utils.hpp =====================
#pragma once
#include <string>
#include <vector>

namespace wanwatch
{
    std::string trim(const std::string &s);
    std::string to_lower(std::string s);
    std::string to_upper(std::string s);
    bool iequals(const std::string &a, const std::string &b);
    bool starts_with(const std::string &s, const std::string &prefix);
    std::vector<std::string> split(const std::string &s, char sep);
    // Splits on sep, trims each piece and drops empty pieces.
    std::vector<std::string> split_list(const std::string &s, char sep = ',');
    std::string join(const std::vector<std::string> &parts, const std::string &sep);
    // &, <, >, " escaped for HTML bodies and Telegram HTML parse mode.
    std::string html_escape(const std::string &s);
} // namespace wanwatch
