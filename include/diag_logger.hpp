// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <fstream>
#include <string>

namespace wanwatch {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* to_string(LogLevel level);
// Accepts DEBUG/INFO/WARN/WARNING/ERROR in any case; unknown text maps to Info.
LogLevel parse_log_level(const std::string& text);

class DiagLogger {
public:
    // An empty path logs to the console only. The parent directory of
    // path is created when missing.
    explicit DiagLogger(const std::string& path, LogLevel min_level = LogLevel::Info, bool echo = true);
    ~DiagLogger();

    bool ok() const { return path_.empty() || out_.is_open(); }
    const std::string& path() const { return path_; }
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

    void log(LogLevel level, const std::string& line);
    void debug(const std::string& line) { log(LogLevel::Debug, line); }
    void info(const std::string& line)  { log(LogLevel::Info, line); }
    void warn(const std::string& line)  { log(LogLevel::Warn, line); }
    void error(const std::string& line) { log(LogLevel::Error, line); }

private:
    std::string path_;
    std::ofstream out_;
    LogLevel min_level_;
    bool echo_;
};

} // namespace wanwatch
