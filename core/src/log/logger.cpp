#include "mbt/log/logger.h"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mbt {

static std::string now_iso() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return LogLevel::Info;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const std::string& path, LogLevel level) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        path_ = path;
        level_ = level;
    }
    info("logger initialized");
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = level;
}

void Logger::write(LogLevel level, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mu_);
    if (level < level_) return;
    if (path_.empty()) {
        std::clog << now_iso() << " [" << tag << "] " << msg << "\n";
        return;
    }
    std::ofstream f(path_, std::ios::app);
    f << now_iso() << " [" << tag << "] " << msg << "\n";
}

void Logger::debug(const std::string& msg) { write(LogLevel::Debug, "DEBUG", msg); }
void Logger::info(const std::string& msg) { write(LogLevel::Info, "INFO", msg); }
void Logger::warn(const std::string& msg) { write(LogLevel::Warn, "WARN", msg); }
void Logger::error(const std::string& msg) { write(LogLevel::Error, "ERROR", msg); }

} // namespace mbt
