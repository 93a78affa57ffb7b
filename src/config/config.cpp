#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace hedge {

void to_json(nlohmann::json& j, const StrategyConfig& c) {
    j = nlohmann::json{
        {"trading_enabled", c.trading_enabled},
        {"min_elapsed_minutes", c.min_elapsed_minutes},
        {"new_position_cutoff_minutes", c.new_position_cutoff_minutes},
        {"late_hedge_minute", c.late_hedge_minute},
        {"cooldown_ms", c.cooldown_ms},
        {"tier1_until_minute", c.tier1_until_minute},
        {"tier2_until_minute", c.tier2_until_minute},
        {"tier1_max_price", c.tier1_max_price},
        {"tier2_max_price", c.tier2_max_price},
        {"tier3_max_price", c.tier3_max_price},
        {"max_entry_sum", c.max_entry_sum},
        {"hedge_max_opposite_price", c.hedge_max_opposite_price},
        {"min_momentum_pct", c.min_momentum_pct},
        {"late_hedge_max_price", c.late_hedge_max_price},
        {"max_pair_cost", c.max_pair_cost},
        {"base_order_dollars", c.base_order_dollars},
        {"min_order_dollars", c.min_order_dollars},
        {"max_window_spend", c.max_window_spend},
        {"streak_block_wins", c.streak_block_wins},
        {"streak_block_max_price", c.streak_block_max_price},
        {"loss_streak_discount_after", c.loss_streak_discount_after},
        {"loss_streak_size_factor", c.loss_streak_size_factor}
    };
}

void from_json(const nlohmann::json& j, StrategyConfig& c) {
    if (j.contains("trading_enabled")) j.at("trading_enabled").get_to(c.trading_enabled);
    if (j.contains("min_elapsed_minutes")) j.at("min_elapsed_minutes").get_to(c.min_elapsed_minutes);
    if (j.contains("new_position_cutoff_minutes")) j.at("new_position_cutoff_minutes").get_to(c.new_position_cutoff_minutes);
    if (j.contains("late_hedge_minute")) j.at("late_hedge_minute").get_to(c.late_hedge_minute);
    if (j.contains("cooldown_ms")) j.at("cooldown_ms").get_to(c.cooldown_ms);
    if (j.contains("tier1_until_minute")) j.at("tier1_until_minute").get_to(c.tier1_until_minute);
    if (j.contains("tier2_until_minute")) j.at("tier2_until_minute").get_to(c.tier2_until_minute);
    if (j.contains("tier1_max_price")) j.at("tier1_max_price").get_to(c.tier1_max_price);
    if (j.contains("tier2_max_price")) j.at("tier2_max_price").get_to(c.tier2_max_price);
    if (j.contains("tier3_max_price")) j.at("tier3_max_price").get_to(c.tier3_max_price);
    if (j.contains("max_entry_sum")) j.at("max_entry_sum").get_to(c.max_entry_sum);
    if (j.contains("hedge_max_opposite_price")) j.at("hedge_max_opposite_price").get_to(c.hedge_max_opposite_price);
    if (j.contains("min_momentum_pct")) j.at("min_momentum_pct").get_to(c.min_momentum_pct);
    if (j.contains("late_hedge_max_price")) j.at("late_hedge_max_price").get_to(c.late_hedge_max_price);
    if (j.contains("max_pair_cost")) j.at("max_pair_cost").get_to(c.max_pair_cost);
    if (j.contains("base_order_dollars")) j.at("base_order_dollars").get_to(c.base_order_dollars);
    if (j.contains("min_order_dollars")) j.at("min_order_dollars").get_to(c.min_order_dollars);
    if (j.contains("max_window_spend")) j.at("max_window_spend").get_to(c.max_window_spend);
    if (j.contains("streak_block_wins")) j.at("streak_block_wins").get_to(c.streak_block_wins);
    if (j.contains("streak_block_max_price")) j.at("streak_block_max_price").get_to(c.streak_block_max_price);
    if (j.contains("loss_streak_discount_after")) j.at("loss_streak_discount_after").get_to(c.loss_streak_discount_after);
    if (j.contains("loss_streak_size_factor")) j.at("loss_streak_size_factor").get_to(c.loss_streak_size_factor);
}

void to_json(nlohmann::json& j, const RiskConfig& c) {
    j = nlohmann::json{
        {"max_open_exposure", c.max_open_exposure},
        {"loss_streak_pause", c.loss_streak_pause},
        {"pause_minutes", c.pause_minutes},
        {"pnl_floor", c.pnl_floor},
        {"min_win_rate", c.min_win_rate},
        {"min_trades_for_win_rate", c.min_trades_for_win_rate},
        {"stale_after_minutes", c.stale_after_minutes},
        {"stop_loss_pct", c.stop_loss_pct},
        {"recent_outcomes_capacity", c.recent_outcomes_capacity}
    };
}

void from_json(const nlohmann::json& j, RiskConfig& c) {
    if (j.contains("max_open_exposure")) j.at("max_open_exposure").get_to(c.max_open_exposure);
    if (j.contains("loss_streak_pause")) j.at("loss_streak_pause").get_to(c.loss_streak_pause);
    if (j.contains("pause_minutes")) j.at("pause_minutes").get_to(c.pause_minutes);
    if (j.contains("pnl_floor")) j.at("pnl_floor").get_to(c.pnl_floor);
    if (j.contains("min_win_rate")) j.at("min_win_rate").get_to(c.min_win_rate);
    if (j.contains("min_trades_for_win_rate")) j.at("min_trades_for_win_rate").get_to(c.min_trades_for_win_rate);
    if (j.contains("stale_after_minutes")) j.at("stale_after_minutes").get_to(c.stale_after_minutes);
    if (j.contains("stop_loss_pct")) j.at("stop_loss_pct").get_to(c.stop_loss_pct);
    if (j.contains("recent_outcomes_capacity")) j.at("recent_outcomes_capacity").get_to(c.recent_outcomes_capacity);
}

void to_json(nlohmann::json& j, const ExecutionConfig& c) {
    j = nlohmann::json{
        {"slippage", c.slippage},
        {"max_limit_price", c.max_limit_price},
        {"min_shares", c.min_shares},
        {"max_attempts", c.max_attempts},
        {"retry_backoff_ms", c.retry_backoff_ms}
    };
}

void from_json(const nlohmann::json& j, ExecutionConfig& c) {
    if (j.contains("slippage")) j.at("slippage").get_to(c.slippage);
    if (j.contains("max_limit_price")) j.at("max_limit_price").get_to(c.max_limit_price);
    if (j.contains("min_shares")) j.at("min_shares").get_to(c.min_shares);
    if (j.contains("max_attempts")) j.at("max_attempts").get_to(c.max_attempts);
    if (j.contains("retry_backoff_ms")) j.at("retry_backoff_ms").get_to(c.retry_backoff_ms);
}

void to_json(nlohmann::json& j, const FeedConfig& c) {
    j = nlohmann::json{
        {"poll_interval_ms", c.poll_interval_ms},
        {"feed_path", c.feed_path},
        {"max_quote_age_ms", c.max_quote_age_ms}
    };
}

void from_json(const nlohmann::json& j, FeedConfig& c) {
    if (j.contains("poll_interval_ms")) j.at("poll_interval_ms").get_to(c.poll_interval_ms);
    if (j.contains("feed_path")) j.at("feed_path").get_to(c.feed_path);
    if (j.contains("max_quote_age_ms")) j.at("max_quote_age_ms").get_to(c.max_quote_age_ms);
}

void to_json(nlohmann::json& j, const PersistenceConfig& c) {
    j = nlohmann::json{
        {"state_path", c.state_path},
        {"trades_csv_path", c.trades_csv_path},
        {"journal_path", c.journal_path}
    };
}

void from_json(const nlohmann::json& j, PersistenceConfig& c) {
    if (j.contains("state_path")) j.at("state_path").get_to(c.state_path);
    if (j.contains("trades_csv_path")) j.at("trades_csv_path").get_to(c.trades_csv_path);
    if (j.contains("journal_path")) j.at("journal_path").get_to(c.journal_path);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

std::optional<TradingMode> mode_from_string(const std::string& s) {
    if (s == "dry-run" || s == "dry_run") return TradingMode::DRY_RUN;
    if (s == "paper") return TradingMode::PAPER;
    if (s == "live") return TradingMode::LIVE;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Config& c) {
    std::string mode_str;
    switch (c.mode) {
        case TradingMode::DRY_RUN: mode_str = "dry-run"; break;
        case TradingMode::PAPER: mode_str = "paper"; break;
        case TradingMode::LIVE: mode_str = "live"; break;
    }

    j = nlohmann::json{
        {"mode", mode_str},
        {"strategy", c.strategy},
        {"risk", c.risk},
        {"execution", c.execution},
        {"feed", c.feed},
        {"persistence", c.persistence},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("mode")) {
        std::string mode_str = j.at("mode").get<std::string>();
        auto mode = mode_from_string(mode_str);
        if (!mode) {
            throw std::runtime_error("Unknown trading mode: " + mode_str);
        }
        c.mode = *mode;
    }
    if (j.contains("strategy")) j.at("strategy").get_to(c.strategy);
    if (j.contains("risk")) j.at("risk").get_to(c.risk);
    if (j.contains("execution")) j.at("execution").get_to(c.execution);
    if (j.contains("feed")) j.at("feed").get_to(c.feed);
    if (j.contains("persistence")) j.at("persistence").get_to(c.persistence);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    const auto& s = strategy;

    if (s.base_order_dollars <= 0) {
        spdlog::error("base_order_dollars must be positive");
        return false;
    }

    if (s.min_order_dollars <= 0 || s.min_order_dollars > s.base_order_dollars) {
        spdlog::error("min_order_dollars must be positive and <= base_order_dollars");
        return false;
    }

    if (s.tier1_until_minute >= s.tier2_until_minute) {
        spdlog::error("tier1_until_minute must be before tier2_until_minute");
        return false;
    }

    if (s.tier1_max_price > s.tier2_max_price || s.tier2_max_price > s.tier3_max_price) {
        spdlog::error("cheap-price tiers must relax over time");
        return false;
    }

    if (s.max_pair_cost <= 0 || s.max_pair_cost > 1.0) {
        spdlog::error("max_pair_cost must be in (0, 1]");
        return false;
    }

    if (s.max_window_spend < s.base_order_dollars) {
        spdlog::error("max_window_spend must cover at least one base order");
        return false;
    }

    if (s.loss_streak_size_factor <= 0 || s.loss_streak_size_factor > 1.0) {
        spdlog::error("loss_streak_size_factor must be in (0, 1]");
        return false;
    }

    if (risk.max_open_exposure <= 0) {
        spdlog::error("max_open_exposure must be positive");
        return false;
    }

    if (risk.recent_outcomes_capacity < risk.loss_streak_pause) {
        spdlog::error("recent_outcomes_capacity must hold a full loss streak");
        return false;
    }

    if (execution.max_limit_price <= 0 || execution.max_limit_price >= 1.0) {
        spdlog::error("max_limit_price must be in (0, 1)");
        return false;
    }

    if (execution.min_shares < 1 || execution.max_attempts < 1) {
        spdlog::error("min_shares and max_attempts must be at least 1");
        return false;
    }

    if (feed.poll_interval_ms <= 0) {
        spdlog::error("poll_interval_ms must be positive");
        return false;
    }

    if (s.late_hedge_max_price > execution.max_limit_price) {
        spdlog::warn("late_hedge_max_price is above max_limit_price, late hedges will be capped");
    }

    return true;
}

void Config::apply_env_overrides() {
    std::string enabled = get_env("HEDGEPAIR_TRADING_ENABLED");
    if (!enabled.empty()) {
        strategy.trading_enabled = (enabled == "true" || enabled == "1");
    }

    std::string mode_str = get_env("HEDGEPAIR_MODE");
    if (!mode_str.empty()) {
        auto parsed = mode_from_string(mode_str);
        if (parsed) {
            mode = *parsed;
        } else {
            spdlog::warn("Ignoring unknown HEDGEPAIR_MODE={}", mode_str);
        }
    }
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace hedge
