#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace spendguard {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    static void enableFile(bool enable);
    
    static void log(LogLevel level, const std::string& category, const std::string& msg);
    
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    
    // Wallet addresses pass through logs shortened unless
    // SPENDGUARD_ALLOW_SENSITIVE_LOGS is set.
    static std::string redactAddress(const std::string& address);
};

#define LOG_TRACE(cat, msg) do { if (spendguard::utils::Logger::getLevel() <= spendguard::utils::LogLevel::TRACE) spendguard::utils::Logger::log(spendguard::utils::LogLevel::TRACE, cat, msg); } while(0)
#define LOG_DEBUG(cat, msg) do { if (spendguard::utils::Logger::getLevel() <= spendguard::utils::LogLevel::DEBUG) spendguard::utils::Logger::log(spendguard::utils::LogLevel::DEBUG, cat, msg); } while(0)
#define LOG_INFO(cat, msg) spendguard::utils::Logger::log(spendguard::utils::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg) spendguard::utils::Logger::log(spendguard::utils::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) spendguard::utils::Logger::log(spendguard::utils::LogLevel::ERROR, cat, msg)
#define LOG_FATAL(cat, msg) spendguard::utils::Logger::log(spendguard::utils::LogLevel::FATAL, cat, msg)

}
}
