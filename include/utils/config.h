#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <cstdint>

namespace spendguard {
namespace utils {

struct SpendConfig {
    std::string wallet;
    std::string token;
    uint64_t totalAmount = 0;
    uint64_t maxTransactions = 0;
    uint64_t amountPerTransaction = 0;
    uint64_t feeMin = 0;
    uint64_t feeMax = 0;
    uint32_t requestedWorkers = 1;
    uint32_t workers = 1;
    std::optional<uint64_t> feeSeed;
    uint32_t retryPauseMs = 0;
    double failureRate = 0.1;
    uint32_t latencyMs = 0;
    std::string journalPath;
    std::string logLevel = "info";
    std::string logFile;
};

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    // Reads a dotenv file (optional) and then the process environment,
    // mapping the bot's variables onto config keys. The process environment
    // wins. Returns the number of keys set.
    size_t loadEnvironment(const std::string& dotenvPath = ".env");
    
    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;
    
    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, uint64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);
    
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;
    
    Result<SpendConfig> getSpendConfig() const;
    
    void onChange(std::function<void(const std::string&)> callback);
    std::string getConfigPath() const;
    void clear();
    
    std::string toJson() const;
    size_t size() const;
    
private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Strict parsing: the whole value must be a decimal unsigned integer.
bool parseUnsigned(const std::string& text, uint64_t& out);

}
}
