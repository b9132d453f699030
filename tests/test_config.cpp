#include <gtest/gtest.h>
#include "utils/config.h"
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace spendguard;
using namespace spendguard::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "spendguard_test_config";
        std::filesystem::create_directories(testDir);
        clearEnvironment();
        Config::instance().reset();
    }

    void TearDown() override {
        clearEnvironment();
        Config::instance().reset();
        if (std::filesystem::exists(testDir)) {
            std::filesystem::remove_all(testDir);
        }
    }

    void clearEnvironment() {
        for (const char* name : {"WALLET", "TOKEN", "TOTAL_AMOUNT", "MAX_TRANSACTIONS", "MAX_THREADS", "PRICE",
                                 "COMMISSION", "COMMISSION_CHANGE", "FEE_MIN", "FEE_MAX", "FEE_SEED",
                                 "FAILURE_RATE", "LOG_LEVEL"}) {
            unsetenv(name);
        }
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = testDir / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    void setRequired(Config& config) {
        config.set("spend.total_amount", "1000");
        config.set("spend.max_transactions", "10");
        config.set("spend.amount_per_transaction", "50");
        config.set("fee.min", "1");
        config.set("fee.max", "4");
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigTest, DefaultsArePresent) {
    auto& config = Config::instance();
    EXPECT_EQ(config.getString("log.level"), "info");
    EXPECT_EQ(config.getInt("spend.workers"), 1);
    EXPECT_TRUE(config.getBool("spend.cap_workers_to_cpus"));
    EXPECT_DOUBLE_EQ(config.getDouble("submitter.failure_rate"), 0.1);
    EXPECT_TRUE(config.has("journal.path"));
    EXPECT_FALSE(config.has("spend.total_amount"));
}

TEST_F(ConfigTest, LoadKeyValueFile) {
    std::string path = writeFile("spendguard.conf",
        "# budget\n"
        "spend.total_amount = 500\n"
        "spend.max_transactions=3\n"
        "\n"
        "log.level = debug\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getConfigPath(), path);
    EXPECT_EQ(config.getInt64("spend.total_amount"), 500);
    EXPECT_EQ(config.getInt("spend.max_transactions"), 3);
    EXPECT_EQ(config.getString("log.level"), "debug");
    EXPECT_FALSE(config.load((testDir / "missing.conf").string()));
}

TEST_F(ConfigTest, SaveAndReload) {
    auto& config = Config::instance();
    setRequired(config);
    std::string path = (testDir / "saved.conf").string();
    ASSERT_TRUE(config.save(path));

    config.reset();
    EXPECT_FALSE(config.has("spend.total_amount"));
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getString("spend.total_amount"), "1000");
    EXPECT_EQ(config.getString("fee.max"), "4");
}

TEST_F(ConfigTest, TypedGettersFallBack) {
    auto& config = Config::instance();
    config.set("x.number", "abc");
    EXPECT_EQ(config.getInt("x.number", 9), 9);
    EXPECT_EQ(config.getInt64("x.missing", -1), -1);
    config.set("x.flag", "yes");
    EXPECT_TRUE(config.getBool("x.flag"));
    config.set("x.list", "a, b,,c");
    auto list = config.getList("x.list");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[1], "b");
}

TEST_F(ConfigTest, KeysWithPrefix) {
    auto& config = Config::instance();
    setRequired(config);
    auto feeKeys = config.keys("fee.");
    ASSERT_EQ(feeKeys.size(), 2u);
    EXPECT_EQ(feeKeys[0], "fee.max");
    EXPECT_EQ(feeKeys[1], "fee.min");
    config.remove("fee.max");
    EXPECT_FALSE(config.has("fee.max"));
}

TEST_F(ConfigTest, ChangeCallbackFires) {
    auto& config = Config::instance();
    std::string changed;
    config.onChange([&changed](const std::string& key) { changed = key; });
    config.set("spend.token", "ABC");
    EXPECT_EQ(changed, "spend.token");
    config.onChange(nullptr);
}

TEST_F(ConfigTest, ChangeCallbackSwappedWhileSetting) {
    auto& config = Config::instance();
    std::atomic<int> fired{0};
    std::function<void(const std::string&)> counter = [&fired](const std::string&) { fired++; };
    config.onChange(counter);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; t++) {
        writers.emplace_back([&config, t] {
            for (int i = 0; i < 200; i++) {
                config.set("spend.key_" + std::to_string(t), i);
            }
        });
    }
    for (int i = 0; i < 200; i++) {
        config.onChange(i % 2 == 0 ? counter : nullptr);
    }
    for (auto& w : writers) w.join();
    config.onChange(counter);
    config.set("spend.key_0", 1);
    EXPECT_GT(fired.load(), 0);

    // A callback may register a new callback without deadlocking.
    std::string reentered;
    config.onChange([&config, &reentered](const std::string& key) {
        config.onChange([&reentered](const std::string& k) { reentered = k; });
        reentered = "first:" + key;
    });
    config.set("spend.token", "ABC");
    EXPECT_EQ(reentered, "first:spend.token");
    config.set("spend.wallet", "W");
    EXPECT_EQ(reentered, "spend.wallet");
    config.onChange(nullptr);
}

TEST_F(ConfigTest, DotenvIsMapped) {
    std::string path = writeFile(".env",
        "WALLET=wallet-address\n"
        "TOKEN=\"token-mint\"\n"
        "TOTAL_AMOUNT=1000\n"
        "MAX_TRANSACTIONS=5\n"
        "export PRICE=100\n"
        "COMMISSION=10\n"
        "COMMISSION_CHANGE=3\n"
        "UNRELATED=1\n");

    auto& config = Config::instance();
    EXPECT_EQ(config.loadEnvironment(path), 7u);
    EXPECT_EQ(config.getString("spend.wallet"), "wallet-address");
    EXPECT_EQ(config.getString("spend.token"), "token-mint");
    EXPECT_EQ(config.getString("spend.amount_per_transaction"), "100");
    EXPECT_FALSE(config.has("UNRELATED"));

    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.ok()) << spend.error().message;
    EXPECT_EQ(spend.value().totalAmount, 1000u);
    EXPECT_EQ(spend.value().maxTransactions, 5u);
    EXPECT_EQ(spend.value().amountPerTransaction, 100u);
    EXPECT_EQ(spend.value().feeMin, 7u);
    EXPECT_EQ(spend.value().feeMax, 13u);
}

TEST_F(ConfigTest, ProcessEnvironmentWins) {
    std::string path = writeFile(".env", "TOTAL_AMOUNT=1000\nPRICE=100\n");
    setenv("TOTAL_AMOUNT", "2500", 1);

    auto& config = Config::instance();
    config.loadEnvironment(path);
    EXPECT_EQ(config.getString("spend.total_amount"), "2500");
    EXPECT_EQ(config.getString("spend.amount_per_transaction"), "100");
}

TEST_F(ConfigTest, MissingDotenvIsNotAnError) {
    auto& config = Config::instance();
    EXPECT_EQ(config.loadEnvironment((testDir / "absent.env").string()), 0u);
}

TEST_F(ConfigTest, MissingRequiredValueIsNamed) {
    auto& config = Config::instance();
    setRequired(config);
    config.remove("spend.total_amount");

    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.failed());
    EXPECT_EQ(spend.error().code, ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(spend.error().message, "spend.total_amount not set");
}

TEST_F(ConfigTest, NonNumericValueIsRejected) {
    auto& config = Config::instance();
    setRequired(config);
    config.set("spend.max_transactions", "not_a_number");

    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.failed());
    EXPECT_EQ(spend.error().message, "spend.max_transactions should be an unsigned integer");

    config.set("spend.max_transactions", "-5");
    EXPECT_TRUE(config.getSpendConfig().failed());
    config.set("spend.max_transactions", "12abc");
    EXPECT_TRUE(config.getSpendConfig().failed());
}

TEST_F(ConfigTest, FeeMustBeGiven) {
    auto& config = Config::instance();
    setRequired(config);
    config.remove("fee.min");
    config.remove("fee.max");
    EXPECT_TRUE(config.getSpendConfig().failed());

    config.set("fee.commission", "2");
    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.ok());
    EXPECT_EQ(spend.value().feeMin, 2u);
    EXPECT_EQ(spend.value().feeMax, 2u);
}

TEST_F(ConfigTest, InvertedFeeRangeIsRejected) {
    auto& config = Config::instance();
    setRequired(config);
    config.set("fee.min", "9");
    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.failed());
    EXPECT_EQ(spend.error().message, "fee.min must not exceed fee.max");
}

TEST_F(ConfigTest, CommissionLowerBoundClampsAtZero) {
    auto& config = Config::instance();
    setRequired(config);
    config.remove("fee.min");
    config.remove("fee.max");
    config.set("fee.commission", "2");
    config.set("fee.commission_change", "5");

    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.ok());
    EXPECT_EQ(spend.value().feeMin, 0u);
    EXPECT_EQ(spend.value().feeMax, 7u);
}

TEST_F(ConfigTest, WorkersAreCappedToCpus) {
    auto& config = Config::instance();
    setRequired(config);
    config.set("spend.workers", "4096");

    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.ok());
    EXPECT_EQ(spend.value().requestedWorkers, 4096u);
    unsigned cpus = std::thread::hardware_concurrency();
    if (cpus > 0 && cpus < 4096) {
        EXPECT_EQ(spend.value().workers, cpus);
    }

    config.set("spend.cap_workers_to_cpus", false);
    spend = config.getSpendConfig();
    ASSERT_TRUE(spend.ok());
    EXPECT_EQ(spend.value().workers, 4096u);
}

TEST_F(ConfigTest, ZeroWorkersIsRejected) {
    auto& config = Config::instance();
    setRequired(config);
    config.set("spend.workers", "0");
    EXPECT_TRUE(config.getSpendConfig().failed());
}

TEST_F(ConfigTest, OptionalValues) {
    auto& config = Config::instance();
    setRequired(config);

    auto spend = config.getSpendConfig();
    ASSERT_TRUE(spend.ok());
    EXPECT_FALSE(spend.value().feeSeed.has_value());
    EXPECT_EQ(spend.value().retryPauseMs, 100u);
    EXPECT_DOUBLE_EQ(spend.value().failureRate, 0.1);

    config.set("fee.seed", "42");
    config.set("submitter.failure_rate", "0.25");
    config.set("journal.path", "/tmp/receipts.db");
    spend = config.getSpendConfig();
    ASSERT_TRUE(spend.ok());
    ASSERT_TRUE(spend.value().feeSeed.has_value());
    EXPECT_EQ(*spend.value().feeSeed, 42u);
    EXPECT_DOUBLE_EQ(spend.value().failureRate, 0.25);
    EXPECT_EQ(spend.value().journalPath, "/tmp/receipts.db");

    config.set("submitter.failure_rate", "1.5");
    EXPECT_TRUE(config.getSpendConfig().failed());
    config.set("submitter.failure_rate", "often");
    EXPECT_TRUE(config.getSpendConfig().failed());
}

TEST_F(ConfigTest, ToJsonContainsKeys) {
    auto& config = Config::instance();
    config.set("spend.token", "T\"K");
    std::string json = config.toJson();
    EXPECT_NE(json.find("\"spend.token\""), std::string::npos);
    EXPECT_NE(json.find("T\\\"K"), std::string::npos);
}

TEST(ParseUnsignedTest, StrictDecimal) {
    uint64_t v = 0;
    EXPECT_TRUE(parseUnsigned("0", v));
    EXPECT_EQ(v, 0u);
    EXPECT_TRUE(parseUnsigned("18446744073709551615", v));
    EXPECT_EQ(v, UINT64_MAX);
    EXPECT_FALSE(parseUnsigned("18446744073709551616", v));
    EXPECT_FALSE(parseUnsigned("", v));
    EXPECT_FALSE(parseUnsigned(" 1", v));
    EXPECT_FALSE(parseUnsigned("+1", v));
    EXPECT_FALSE(parseUnsigned("1.5", v));
}
