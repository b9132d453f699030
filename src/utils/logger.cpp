#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <deque>
#include <functional>

namespace spendguard {
namespace utils {

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::ofstream logFile;
static std::string logPath;
static std::mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static std::atomic<bool> fileEnabled{true};
static const uint64_t maxFileSize = 10 * 1024 * 1024;
static const uint32_t maxFiles = 5;
static std::deque<LogEntry> recentLogs;
static size_t maxRecentLogs = 1000;
static bool sensitiveFromEnv() {
    const char* env = std::getenv("SPENDGUARD_ALLOW_SENSITIVE_LOGS");
    if (!env || !*env) return false;
    std::string v(env);
    return v == "1" || v == "true" || v == "TRUE";
}

static std::atomic<bool> allowSensitive{sensitiveFromEnv()};

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static uint64_t getThreadId() {
    std::hash<std::thread::id> hasher;
    return hasher(std::this_thread::get_id());
}

static std::string sanitize(const std::string& in) {
    std::string s = in;
    const std::vector<std::string> keys = {"password", "secret", "private_key", "privkey", "mnemonic", "seed_phrase"};
    for (const auto& k : keys) {
        size_t pos = 0;
        while ((pos = s.find(k, pos)) != std::string::npos) {
            size_t i = pos + k.size();
            while (i < s.size() && (s[i] == ' ' || s[i] == '"' || s[i] == '\'' || s[i] == ':' || s[i] == '=')) i++;
            size_t sep = i;
            size_t end = sep;
            while (end < s.size() && s[end] != '"' && s[end] != '\'' && s[end] != ' ' && s[end] != ',' && s[end] != ')' && s[end] != ';' && s[end] != '\n') end++;
            if (sep < end) {
                s.replace(sep, end - sep, "[REDACTED]");
                pos = sep + 10;
            } else {
                pos += k.size();
            }
        }
    }
    return s;
}

static void rotateLocked() {
    if (logPath.empty()) return;
    
    if (logFile.is_open()) {
        logFile.close();
    }
    
    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        std::string newPath = logPath + "." + std::to_string(i + 1);
        if (std::filesystem::exists(oldPath, ec)) {
            if (i == static_cast<int>(maxFiles) - 1) {
                std::filesystem::remove(oldPath, ec);
            } else {
                std::filesystem::rename(oldPath, newPath, ec);
            }
        }
    }
    
    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }
    
    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load()) return;
    
    std::lock_guard<std::mutex> lock(logMutex);
    
    time_t now = std::time(nullptr);
    std::tm tmNow{};
    localtime_r(&now, &tmNow);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    
    std::string outMsg = allowSensitive ? msg : sanitize(msg);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << outMsg << "\n";

    std::string line = oss.str();
    
    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }
    
    if (fileEnabled && logFile.is_open()) {
        logFile << line;
        logFile.flush();
        
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateLocked();
        }
    }
    
    LogEntry entry;
    entry.level = level;
    entry.message = outMsg;
    entry.category = category;
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = getThreadId();
    
    recentLogs.push_back(entry);
    while (recentLogs.size() > maxRecentLogs) {
        recentLogs.pop_front();
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;
    
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    
    logFile.open(path, std::ios::app);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error") out = LogLevel::ERROR;
    else if (v == "fatal") out = LogLevel::FATAL;
    else if (v == "off") out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::enableFile(bool enable) {
    fileEnabled = enable;
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::vector<LogEntry> result;
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    for (size_t i = start; i < recentLogs.size(); i++) {
        result.push_back(recentLogs[i]);
    }
    return result;
}

std::string Logger::redactAddress(const std::string& address) {
    if (!allowSensitive) {
        if (address.length() > 8) {
            return address.substr(0, 4) + "..." + address.substr(address.length() - 4);
        }
        return "[REDACTED_ADDR]";
    }
    return address;
}

}
}
