#include "utils/config.h"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace spendguard {
namespace utils {

namespace {

struct EnvBinding {
    const char* variable;
    const char* key;
};

const EnvBinding ENV_BINDINGS[] = {
    {"WALLET", "spend.wallet"},
    {"TOKEN", "spend.token"},
    {"TOTAL_AMOUNT", "spend.total_amount"},
    {"MAX_TRANSACTIONS", "spend.max_transactions"},
    {"MAX_THREADS", "spend.workers"},
    {"PRICE", "spend.amount_per_transaction"},
    {"COMMISSION", "fee.commission"},
    {"COMMISSION_CHANGE", "fee.commission_change"},
    {"FEE_MIN", "fee.min"},
    {"FEE_MAX", "fee.max"},
    {"FEE_SEED", "fee.seed"},
    {"FAILURE_RATE", "submitter.failure_rate"},
    {"LOG_LEVEL", "log.level"},
};

std::string trimmed(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

}

bool parseUnsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text.size() > 20) return false;
    if (!std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(text, &pos);
        if (pos != text.size()) return false;
        out = static_cast<uint64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;
    
    void notifyChange(const std::string& key) {
        std::function<void(const std::string&)> callback;
        {
            std::lock_guard<std::mutex> lock(mtx);
            callback = changeCallback;
        }
        if (callback) callback(key);
    }

    void store(const std::string& key, const std::string& value) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            data[key] = value;
        }
        notifyChange(key);
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("spend.workers", 1);
    set("spend.cap_workers_to_cpus", true);
    set("spend.retry_pause_ms", 100);
    
    set("submitter.failure_rate", 0.1);
    set("submitter.latency_ms", 0);
    
    set("log.level", "info");
    set("journal.path", "");
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;
    
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        
        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trimmed(line.substr(0, pos));
            std::string value = trimmed(line.substr(pos + 1));
            if (!key.empty()) impl_->data[key] = value;
        }
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;
    
    std::ofstream file(savePath);
    if (!file.is_open()) return false;
    
    file << "# SpendGuard Configuration\n\n";
    
    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());
    
    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return true;
}

size_t Config::loadEnvironment(const std::string& dotenvPath) {
    std::unordered_map<std::string, std::string> dotenv;
    if (!dotenvPath.empty()) {
        std::ifstream file(dotenvPath);
        std::string line;
        while (file.is_open() && std::getline(file, line)) {
            line = trimmed(line);
            if (line.empty() || line[0] == '#') continue;
            if (line.compare(0, 7, "export ") == 0) line = trimmed(line.substr(7));
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;
            dotenv[trimmed(line.substr(0, pos))] = unquote(trimmed(line.substr(pos + 1)));
        }
    }

    size_t applied = 0;
    for (const auto& binding : ENV_BINDINGS) {
        const char* fromProcess = std::getenv(binding.variable);
        if (fromProcess) {
            set(binding.key, std::string(fromProcess));
            applied++;
            continue;
        }
        auto it = dotenv.find(binding.variable);
        if (it != dotenv.end()) {
            set(binding.key, it->second);
            applied++;
        }
    }
    return applied;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stod(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;
    
    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trimmed(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->store(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->store(key, value ? value : "");
}

void Config::set(const std::string& key, int value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, uint64_t value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    impl_->store(key, oss.str());
}

void Config::set(const std::string& key, bool value) {
    impl_->store(key, value ? "true" : "false");
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.erase(key);
    }
    impl_->notifyChange(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

Result<SpendConfig> Config::getSpendConfig() const {
    auto requireUnsigned = [this](const std::string& key, uint64_t& out) -> Result<void> {
        if (!has(key) || getString(key).empty()) {
            return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, key + " not set"));
        }
        if (!parseUnsigned(getString(key), out)) {
            return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, key + " should be an unsigned integer"));
        }
        return Result<void>();
    };
    auto optionalUnsigned = [this](const std::string& key, uint64_t def, uint64_t& out) -> Result<void> {
        std::string text = getString(key);
        if (text.empty()) {
            out = def;
            return Result<void>();
        }
        if (!parseUnsigned(text, out)) {
            return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, key + " should be an unsigned integer"));
        }
        return Result<void>();
    };

    SpendConfig cfg;
    cfg.wallet = getString("spend.wallet");
    cfg.token = getString("spend.token");
    cfg.journalPath = getString("journal.path");
    cfg.logLevel = getString("log.level", "info");
    cfg.logFile = getString("log.file");

    Result<void> r;
    if ((r = requireUnsigned("spend.total_amount", cfg.totalAmount)).failed()) return r.error();
    if ((r = requireUnsigned("spend.max_transactions", cfg.maxTransactions)).failed()) return r.error();
    if ((r = requireUnsigned("spend.amount_per_transaction", cfg.amountPerTransaction)).failed()) return r.error();

    if (has("fee.min") || has("fee.max")) {
        if ((r = requireUnsigned("fee.min", cfg.feeMin)).failed()) return r.error();
        if ((r = requireUnsigned("fee.max", cfg.feeMax)).failed()) return r.error();
        if (cfg.feeMin > cfg.feeMax) {
            return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, "fee.min must not exceed fee.max"));
        }
    } else if (has("fee.commission")) {
        uint64_t commission = 0;
        uint64_t change = 0;
        if ((r = requireUnsigned("fee.commission", commission)).failed()) return r.error();
        if ((r = optionalUnsigned("fee.commission_change", 0, change)).failed()) return r.error();
        cfg.feeMin = commission > change ? commission - change : 0;
        cfg.feeMax = commission + change;
        if (cfg.feeMax < commission) {
            return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, "fee.commission_change is too large"));
        }
    } else {
        return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR,
                                      "fee not set (fee.min and fee.max, or fee.commission)"));
    }

    uint64_t workers = 0;
    if ((r = optionalUnsigned("spend.workers", 1, workers)).failed()) return r.error();
    if (workers == 0 || workers > 4096) {
        return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, "spend.workers should be between 1 and 4096"));
    }
    cfg.requestedWorkers = static_cast<uint32_t>(workers);
    cfg.workers = cfg.requestedWorkers;
    unsigned cpus = std::thread::hardware_concurrency();
    if (getBool("spend.cap_workers_to_cpus", true) && cpus > 0 && cfg.workers > cpus) {
        cfg.workers = cpus;
    }

    if (!getString("fee.seed").empty()) {
        uint64_t seed = 0;
        if ((r = requireUnsigned("fee.seed", seed)).failed()) return r.error();
        cfg.feeSeed = seed;
    }

    uint64_t pause = 0;
    if ((r = optionalUnsigned("spend.retry_pause_ms", 100, pause)).failed()) return r.error();
    cfg.retryPauseMs = static_cast<uint32_t>(std::min<uint64_t>(pause, 60000));

    uint64_t latency = 0;
    if ((r = optionalUnsigned("submitter.latency_ms", 0, latency)).failed()) return r.error();
    cfg.latencyMs = static_cast<uint32_t>(std::min<uint64_t>(latency, 60000));

    std::string rate = getString("submitter.failure_rate", "0.1");
    try {
        size_t pos = 0;
        cfg.failureRate = std::stod(rate, &pos);
        if (pos != rate.size()) throw std::invalid_argument(rate);
    } catch (const std::exception&) {
        return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, "submitter.failure_rate should be a number"));
    }
    if (cfg.failureRate < 0.0 || cfg.failureRate > 1.0) {
        return Error(SPENDGUARD_ERROR(ErrorCode::CONFIG_ERROR, "submitter.failure_rate should be within [0, 1]"));
    }

    return cfg;
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.clear();
}

std::string Config::toJson() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [k, v] : impl_->data) {
        j[k] = v;
    }
    return j.dump(2);
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

}
}
