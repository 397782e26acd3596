// ===================== File: src/diag_logger.cpp =====================
#include "diag_logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace geoip {

static std::string now_ts() {
    using namespace std::chrono;
    auto t  = system_clock::now();
    auto tt = system_clock::to_time_t(t);
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info")  return LogLevel::Info;
    if (s == "warn")  return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return std::nullopt;
}

DiagLogger::DiagLogger(const std::string& path, LogLevel min_level)
    : to_stderr_(path.empty()), min_level_(min_level) {
    if (!to_stderr_) out_.open(path, std::ios::app);
    if (out_.is_open()) out_ << "=== geoip diag start " << now_ts() << " ===\n";
}

DiagLogger::~DiagLogger() {
    if (out_.is_open()) out_ << "=== geoip diag end " << now_ts() << " ===\n";
}

void DiagLogger::log(LogLevel lvl, const std::string& scope, const std::string& line) {
    std::lock_guard<std::mutex> lock(mu_);
    if (lvl < min_level_) return;
    std::ostream* os = nullptr;
    if (out_.is_open()) os = &out_;
    else if (to_stderr_) os = &std::cerr;
    if (!os) return;
    *os << now_ts() << " | " << log_level_name(lvl) << " | " << scope << " | " << line << '\n';
    os->flush();
}

void DiagLogger::notice_error(const std::string& scope, const std::string& what) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        ++error_counts_[scope];
    }
    log(LogLevel::Error, scope, what);
}

long DiagLogger::error_count(const std::string& scope) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = error_counts_.find(scope);
    return it == error_counts_.end() ? 0 : it->second;
}

} // namespace geoip
