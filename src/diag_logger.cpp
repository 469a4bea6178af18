// ===================== File: src/diag_logger.cpp =====================
#include "diag_logger.hpp"
#include "string_utils.hpp"
#include "time_utils.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace wanwatch {

const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARNING";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& text) {
    const std::string t = to_upper(trim(text));
    if (t == "DEBUG") return LogLevel::Debug;
    if (t == "WARN" || t == "WARNING") return LogLevel::Warn;
    if (t == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

static void ensure_parent_dir(const std::string& path) {
    const auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
}

DiagLogger::DiagLogger(const std::string& path, LogLevel min_level, bool echo)
    : path_(path), min_level_(min_level), echo_(echo) {
    if (!path_.empty()) {
        ensure_parent_dir(path_);
        out_.open(path_, std::ios::app);
    }
    if (out_.is_open()) out_ << "=== wanwatch log start " << local_timestamp_ms() << " ===\n";
}

DiagLogger::~DiagLogger() {
    if (out_.is_open()) out_ << "=== wanwatch log end " << local_timestamp_ms() << " ===\n";
}

void DiagLogger::log(LogLevel level, const std::string& line) {
    if (level < min_level_) return;
    const std::string text = local_timestamp_ms() + " | " + to_string(level) + " | " + line;
    if (out_.is_open()) {
        out_ << text << '\n';
        out_.flush();
    }
    if (echo_) {
        std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
        os << text << std::endl;
    }
}

} // namespace wanwatch
