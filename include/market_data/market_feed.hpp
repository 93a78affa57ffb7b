#pragma once

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"

namespace hedge {

/**
 * Single-slot mailbox: producers replace the value, readers copy it.
 */
template <typename T>
class LatestValue {
public:
    void publish(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
    }

    std::optional<T> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<T> value_;
};

enum class TickType {
    QUOTE,
    SPOT
};

struct SpotSample {
    double price{0.0};
    int64_t ts_ms{0};
};

struct QuoteSample {
    Quote quote;
    int64_t ts_ms{0};
};

struct Tick {
    TickType type{TickType::QUOTE};
    std::optional<int64_t> ts_ms;
    Quote quote;         // QUOTE only
    double price{0.0};   // SPOT only
};

/**
 * Parse one tick object. Unknown types and missing or mistyped required
 * fields return nullopt with a logged warning.
 */
std::optional<Tick> parse_tick(const nlohmann::json& j);
std::optional<Tick> parse_tick_line(const std::string& line);

/**
 * Captures the reference spot price for each market once, at or after the
 * market's start, and never changes it afterwards.
 */
class PriceToBeatLatch {
public:
    static constexpr size_t MAX_MARKETS = 64;

    // Returns the latched value for market_id, latching spot if eligible
    std::optional<double> observe(const std::string& market_id, int64_t market_start_ms,
                                  const SpotSample& spot);

    std::optional<double> get(const std::string& market_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> latched_;
    std::deque<std::string> order_;
};

/**
 * Keeps a short history of spot samples and derives percent moves over
 * one and three minutes.
 */
class MomentumTracker {
public:
    static constexpr int64_t HISTORY_MS = 5 * MS_PER_MINUTE;

    void add(const SpotSample& sample);
    MomentumHint hint(int64_t now_ms) const;

private:
    mutable std::mutex mutex_;
    std::deque<SpotSample> samples_;

    std::optional<double> delta_locked(int64_t now_ms, int64_t lookback_ms) const;
};

/**
 * Latest market state as seen by one engine tick.
 */
struct MarketSnapshot {
    std::optional<Quote> quote;      // price_to_beat filled from the latch
    std::optional<SpotSample> spot;
    MomentumHint momentum;
};

/**
 * Fan-in point for all feeds. Producers call on_tick from any thread;
 * the engine loop calls snapshot.
 */
class MarketDataHub {
public:
    explicit MarketDataHub(const FeedConfig& config);

    void on_tick(const Tick& tick, int64_t received_ms);
    MarketSnapshot snapshot(int64_t now_ms);

    int64_t ticks_received() const { return ticks_received_.load(); }

private:
    FeedConfig config_;
    LatestValue<QuoteSample> quote_;
    LatestValue<SpotSample> spot_;
    MomentumTracker momentum_;
    PriceToBeatLatch latch_;
    std::atomic<int64_t> ticks_received_{0};
};

/**
 * Reads JSON-lines ticks from a file (or stdin for "-") on its own thread.
 * When paced, sleeps between ticks to reproduce their recorded spacing.
 */
class JsonlFeedReader {
public:
    JsonlFeedReader(const std::string& path, MarketDataHub& hub, bool paced);
    ~JsonlFeedReader();

    JsonlFeedReader(const JsonlFeedReader&) = delete;
    JsonlFeedReader& operator=(const JsonlFeedReader&) = delete;

    bool start();
    void stop();

    bool finished() const { return finished_.load(); }
    int64_t lines_read() const { return lines_read_.load(); }
    int64_t lines_rejected() const { return lines_rejected_.load(); }

private:
    std::string path_;
    MarketDataHub& hub_;
    bool paced_;

    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
    std::atomic<int64_t> lines_read_{0};
    std::atomic<int64_t> lines_rejected_{0};
    std::thread thread_;

    void run();
    void read_stdin(std::optional<int64_t>& last_ts);
    void handle_line(const std::string& line, std::optional<int64_t>& last_ts);
};

} // namespace hedge
