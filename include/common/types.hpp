#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace hedge {

// Time types
using WallClock = std::chrono::time_point<std::chrono::system_clock>;

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Share prices are dollars per share, 1.0 = $1.00 payout
using Price = double;
using Size = double;
using Notional = double;

constexpr int64_t MS_PER_MINUTE = 60'000;
constexpr double MARKET_CYCLE_MINUTES = 15.0;

// Only buys are placed; positions are held to resolution
enum class Side {
    BUY
};

inline std::string side_to_string(Side) {
    return "BUY";
}

// Order types
enum class OrderType {
    GTC   // Good Till Cancel
};

// Binary market outcome
enum class Outcome {
    UP,
    DOWN
};

inline std::string outcome_to_string(Outcome o) {
    return o == Outcome::UP ? "Up" : "Down";
}

inline std::optional<Outcome> outcome_from_string(const std::string& s) {
    if (s == "Up" || s == "UP" || s == "up") return Outcome::UP;
    if (s == "Down" || s == "DOWN" || s == "down") return Outcome::DOWN;
    return std::nullopt;
}

inline Outcome opposite(Outcome o) {
    return o == Outcome::UP ? Outcome::DOWN : Outcome::UP;
}

// Position direction relative to the underlying
enum class Direction {
    LONG,   // Holds Up
    SHORT   // Holds Down
};

inline std::string direction_to_string(Direction d) {
    return d == Direction::LONG ? "LONG" : "SHORT";
}

inline Direction direction_for(Outcome o) {
    return o == Outcome::UP ? Direction::LONG : Direction::SHORT;
}

// Trading mode
enum class TradingMode {
    DRY_RUN,  // Compute decisions only, no orders
    PAPER,    // Simulated execution
    LIVE      // Real orders
};

inline std::string mode_to_string(TradingMode m) {
    switch (m) {
        case TradingMode::DRY_RUN: return "DRY_RUN";
        case TradingMode::PAPER: return "PAPER";
        case TradingMode::LIVE: return "LIVE";
    }
    return "UNKNOWN";
}

/**
 * Snapshot of the paired Up/Down market.
 * price_to_beat is latched once per market and never changes afterwards.
 */
struct Quote {
    std::string market_id;
    Price up_price{0.0};
    Price down_price{0.0};
    std::optional<int64_t> market_end_ms;
    std::optional<int64_t> market_start_ms;
    std::optional<double> price_to_beat;
    std::optional<std::string> up_token_id;
    std::optional<std::string> down_token_id;

    Price price_of(Outcome o) const { return o == Outcome::UP ? up_price : down_price; }

    std::optional<std::string> token_for(Outcome o) const {
        return o == Outcome::UP ? up_token_id : down_token_id;
    }

    bool has_valid_prices() const { return up_price > 0.0 && down_price > 0.0; }
};

/**
 * Recent move of the underlying, in percent of the older sample.
 */
struct MomentumHint {
    std::optional<double> delta1m;
    std::optional<double> delta3m;

    bool empty() const { return !delta1m && !delta3m; }
};

} // namespace hedge
