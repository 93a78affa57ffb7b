#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace hedge {

struct StrategyConfig {
    bool trading_enabled{true};

    // Timing (minutes into the 15m cycle)
    double min_elapsed_minutes{1.0};          // Quotes are immature before this
    double new_position_cutoff_minutes{9.0};  // No fresh pairs after this
    double late_hedge_minute{10.0};           // Worse hedge prices accepted from here
    int64_t cooldown_ms{15000};               // 15s between buys

    // Time-scaled cheap-price threshold
    double tier1_until_minute{5.0};
    double tier2_until_minute{10.0};
    double tier1_max_price{0.35};
    double tier2_max_price{0.40};
    double tier3_max_price{0.45};

    // Entry filters
    double max_entry_sum{1.02};               // Up + Down ask ceiling for opening
    double hedge_max_opposite_price{0.65};    // Opposite side must stay hedgeable
    double min_momentum_pct{0.15};            // Underlying must move this much (percent)
    double late_hedge_max_price{0.65};
    double max_pair_cost{1.0};                // Non-late buys must stay below this

    // Sizing (dollars)
    double base_order_dollars{3.0};
    double min_order_dollars{1.0};
    double max_window_spend{15.0};

    // Streak bias
    int streak_block_wins{2};
    double streak_block_max_price{0.20};
    int loss_streak_discount_after{2};
    double loss_streak_size_factor{0.5};
};

struct RiskConfig {
    double max_open_exposure{20.0};           // Circuit breaker on open cost
    int loss_streak_pause{3};                 // Consecutive losses before pause
    int pause_minutes{30};
    double pnl_floor{-8.0};                   // Halt below this cumulative P&L
    double min_win_rate{0.30};
    int min_trades_for_win_rate{6};
    int stale_after_minutes{5};
    double stop_loss_pct{0.20};               // Advisory only
    int recent_outcomes_capacity{20};
};

struct ExecutionConfig {
    double slippage{0.003};                   // Added to the quoted ask
    double max_limit_price{0.95};             // Hard ceiling for any limit price
    int min_shares{5};
    int max_attempts{3};
    int retry_backoff_ms{2000};
};

struct FeedConfig {
    int poll_interval_ms{1000};
    std::string feed_path{"-"};               // "-" = stdin
    int max_quote_age_ms{10000};              // Quotes older than this are ignored
};

struct PersistenceConfig {
    std::string state_path{"./logs/state.json"};
    std::string trades_csv_path{"./logs/trades.csv"};
    std::string journal_path{"./logs/journal.jsonl"};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    TradingMode mode{TradingMode::PAPER};

    StrategyConfig strategy;
    RiskConfig risk;
    ExecutionConfig execution;
    FeedConfig feed;
    PersistenceConfig persistence;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Apply HEDGEPAIR_* environment overrides
    void apply_env_overrides();

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

std::optional<TradingMode> mode_from_string(const std::string& s);

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace hedge
