#include <gtest/gtest.h>
#include "config/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

using namespace hedge;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        std::random_device rd;
        path_ = (std::filesystem::temp_directory_path() /
                 ("hedgepair_config_" + std::to_string(rd()) + ".json")).string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        unsetenv("HEDGEPAIR_MODE");
        unsetenv("HEDGEPAIR_TRADING_ENABLED");
    }

    void write(const std::string& text) {
        std::ofstream(path_) << text;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.mode, TradingMode::PAPER);
    EXPECT_DOUBLE_EQ(config.strategy.max_pair_cost, 1.0);
    EXPECT_DOUBLE_EQ(config.strategy.max_window_spend, 15.0);
    EXPECT_EQ(config.strategy.cooldown_ms, 15000);
    EXPECT_DOUBLE_EQ(config.risk.pnl_floor, -8.0);
    EXPECT_EQ(config.risk.loss_streak_pause, 3);
    EXPECT_DOUBLE_EQ(config.execution.slippage, 0.003);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    write(R"({"mode": "dry-run", "strategy": {"base_order_dollars": 2.0}, "risk": {"pause_minutes": 10}})");
    Config config = Config::load(path_);

    EXPECT_EQ(config.mode, TradingMode::DRY_RUN);
    EXPECT_DOUBLE_EQ(config.strategy.base_order_dollars, 2.0);
    EXPECT_DOUBLE_EQ(config.strategy.tier1_max_price, 0.35);
    EXPECT_EQ(config.risk.pause_minutes, 10);
    EXPECT_EQ(config.risk.stale_after_minutes, 5);
}

TEST_F(ConfigTest, SaveThenLoad) {
    Config original;
    original.mode = TradingMode::DRY_RUN;
    original.strategy.max_window_spend = 12.0;
    original.risk.max_open_exposure = 30.0;
    original.feed.feed_path = "data/ticks.jsonl";
    original.save(path_);

    Config loaded = Config::load(path_);
    EXPECT_EQ(loaded.mode, TradingMode::DRY_RUN);
    EXPECT_DOUBLE_EQ(loaded.strategy.max_window_spend, 12.0);
    EXPECT_DOUBLE_EQ(loaded.risk.max_open_exposure, 30.0);
    EXPECT_EQ(loaded.feed.feed_path, "data/ticks.jsonl");
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::load(path_ + ".missing"), std::runtime_error);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    write("{ \"mode\": ");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, UnknownModeThrows) {
    write(R"({"mode": "yolo"})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, InvalidValuesFailValidation) {
    write(R"({"strategy": {"max_pair_cost": 1.2}})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);

    Config config;
    config.strategy.tier2_max_price = 0.30;  // tighter than tier 1
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.execution.max_limit_price = 1.0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.risk.recent_outcomes_capacity = 2;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ModeStrings) {
    EXPECT_EQ(mode_from_string("paper"), TradingMode::PAPER);
    EXPECT_EQ(mode_from_string("dry-run"), TradingMode::DRY_RUN);
    EXPECT_EQ(mode_from_string("live"), TradingMode::LIVE);
    EXPECT_FALSE(mode_from_string("sim").has_value());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("HEDGEPAIR_MODE", "dry-run", 1);
    setenv("HEDGEPAIR_TRADING_ENABLED", "false", 1);

    Config config;
    config.apply_env_overrides();
    EXPECT_EQ(config.mode, TradingMode::DRY_RUN);
    EXPECT_FALSE(config.strategy.trading_enabled);
}

TEST_F(ConfigTest, UnknownEnvModeIgnored) {
    setenv("HEDGEPAIR_MODE", "turbo", 1);
    Config config;
    config.apply_env_overrides();
    EXPECT_EQ(config.mode, TradingMode::PAPER);
}

TEST_F(ConfigTest, ShippedExampleConfigLoads) {
    // Tests run from the build directory; the example lives at the source root
    for (const char* candidate : {"configs/hedgepair.json", "../configs/hedgepair.json"}) {
        if (std::filesystem::exists(candidate)) {
            Config config = Config::load(candidate);
            EXPECT_EQ(config.mode, TradingMode::PAPER);
            return;
        }
    }
    GTEST_SKIP() << "example config not found from working directory";
}
