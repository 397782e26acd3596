// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace geoip {

enum class LogLevel { Debug, Info, Warn, Error };

const char* log_level_name(LogLevel lvl);
std::optional<LogLevel> parse_log_level(const std::string& s);

// Timestamped line log shared by the five lookup branches, hence the mutex.
// An empty path logs to stderr.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path = "", LogLevel min_level = LogLevel::Info);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return to_stderr_ || out_.is_open(); }

    void log(LogLevel lvl, const std::string& scope, const std::string& line);
    void debug(const std::string& scope, const std::string& line) { log(LogLevel::Debug, scope, line); }
    void info(const std::string& scope, const std::string& line)  { log(LogLevel::Info, scope, line); }
    void warn(const std::string& scope, const std::string& line)  { log(LogLevel::Warn, scope, line); }
    void error(const std::string& scope, const std::string& line) { log(LogLevel::Error, scope, line); }

    // Absorbed failure: logged at ERROR and counted under `scope`.
    void notice_error(const std::string& scope, const std::string& what);
    long error_count(const std::string& scope) const;

private:
    bool to_stderr_;
    LogLevel min_level_;
    std::ofstream out_;
    mutable std::mutex mu_;
    std::map<std::string, long> error_counts_;
};

} // namespace geoip
