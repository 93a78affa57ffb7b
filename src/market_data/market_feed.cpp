#include "market_data/market_feed.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <poll.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace hedge {

namespace {

bool is_number(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j.at(key).is_number();
}

bool is_string(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j.at(key).is_string();
}

// Epoch ms from either "<prefix>_ms" (number) or "<prefix>_time" (ISO 8601)
std::optional<int64_t> read_time(const nlohmann::json& j, const std::string& prefix) {
    std::string ms_key = prefix + "_ms";
    std::string iso_key = prefix + "_time";
    if (j.contains(ms_key) && j.at(ms_key).is_number()) {
        return j.at(ms_key).get<int64_t>();
    }
    if (j.contains(iso_key) && j.at(iso_key).is_string()) {
        try {
            return time_utils::epoch_ms_from_iso8601(j.at(iso_key).get<std::string>());
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring unparseable {}: {}", iso_key, e.what());
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<Tick> parse_tick(const nlohmann::json& j) {
    if (!j.is_object() || !is_string(j, "type")) {
        spdlog::warn("Rejected tick without a type");
        return std::nullopt;
    }

    Tick tick;
    std::string type = j.at("type").get<std::string>();
    if (is_number(j, "ts_ms")) {
        tick.ts_ms = j.at("ts_ms").get<int64_t>();
    }

    if (type == "quote") {
        if (!is_string(j, "market_id") || !is_number(j, "up") || !is_number(j, "down")) {
            spdlog::warn("Rejected quote tick: market_id, up and down are required");
            return std::nullopt;
        }
        tick.type = TickType::QUOTE;
        tick.quote.market_id = j.at("market_id").get<std::string>();
        tick.quote.up_price = j.at("up").get<double>();
        tick.quote.down_price = j.at("down").get<double>();
        tick.quote.market_end_ms = read_time(j, "end");
        tick.quote.market_start_ms = read_time(j, "start");
        if (!tick.quote.market_end_ms) {
            spdlog::warn("Rejected quote tick for {}: missing end time", tick.quote.market_id);
            return std::nullopt;
        }
        if (is_string(j, "up_token")) tick.quote.up_token_id = j.at("up_token").get<std::string>();
        if (is_string(j, "down_token")) tick.quote.down_token_id = j.at("down_token").get<std::string>();
        return tick;
    }

    if (type == "spot") {
        if (!is_number(j, "price") || j.at("price").get<double>() <= 0.0) {
            spdlog::warn("Rejected spot tick: positive price required");
            return std::nullopt;
        }
        tick.type = TickType::SPOT;
        tick.price = j.at("price").get<double>();
        return tick;
    }

    spdlog::warn("Rejected tick with unknown type '{}'", type);
    return std::nullopt;
}

std::optional<Tick> parse_tick_line(const std::string& line) {
    try {
        return parse_tick(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Rejected malformed tick line: {}", e.what());
        return std::nullopt;
    }
}

// PriceToBeatLatch

std::optional<double> PriceToBeatLatch::observe(const std::string& market_id,
                                                int64_t market_start_ms,
                                                const SpotSample& spot) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = latched_.find(market_id);
    if (it != latched_.end()) {
        return it->second;
    }
    if (spot.ts_ms < market_start_ms || spot.price <= 0.0) {
        return std::nullopt;
    }

    latched_[market_id] = spot.price;
    order_.push_back(market_id);
    while (order_.size() > MAX_MARKETS) {
        latched_.erase(order_.front());
        order_.pop_front();
    }

    spdlog::info("Price to beat latched for {}: {:.2f}", market_id, spot.price);
    return spot.price;
}

std::optional<double> PriceToBeatLatch::get(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latched_.find(market_id);
    if (it == latched_.end()) return std::nullopt;
    return it->second;
}

// MomentumTracker

void MomentumTracker::add(const SpotSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!samples_.empty() && sample.ts_ms < samples_.back().ts_ms) {
        return;  // out of order
    }
    samples_.push_back(sample);
    while (!samples_.empty() && samples_.front().ts_ms < sample.ts_ms - HISTORY_MS) {
        samples_.pop_front();
    }
}

std::optional<double> MomentumTracker::delta_locked(int64_t now_ms, int64_t lookback_ms) const {
    if (samples_.empty()) return std::nullopt;

    const SpotSample& latest = samples_.back();
    int64_t cutoff = now_ms - lookback_ms;

    // Newest sample at or before the lookback point
    const SpotSample* base = nullptr;
    for (const auto& s : samples_) {
        if (s.ts_ms > cutoff) break;
        base = &s;
    }
    if (!base || base->price <= 0.0) return std::nullopt;

    return (latest.price - base->price) / base->price * 100.0;
}

MomentumHint MomentumTracker::hint(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    MomentumHint h;
    h.delta1m = delta_locked(now_ms, MS_PER_MINUTE);
    h.delta3m = delta_locked(now_ms, 3 * MS_PER_MINUTE);
    return h;
}

// MarketDataHub

MarketDataHub::MarketDataHub(const FeedConfig& config)
    : config_(config) {}

void MarketDataHub::on_tick(const Tick& tick, int64_t received_ms) {
    ticks_received_++;
    int64_t ts = tick.ts_ms.value_or(received_ms);

    if (tick.type == TickType::QUOTE) {
        quote_.publish(QuoteSample{tick.quote, ts});
    } else {
        SpotSample sample{tick.price, ts};
        spot_.publish(sample);
        momentum_.add(sample);
    }
}

MarketSnapshot MarketDataHub::snapshot(int64_t now_ms) {
    MarketSnapshot snap;
    snap.spot = spot_.get();
    snap.momentum = momentum_.hint(now_ms);

    // A dead spot feed must not keep settling markets or latching targets
    if (snap.spot && now_ms - snap.spot->ts_ms > config_.max_quote_age_ms) {
        spdlog::debug("Spot sample is {}ms old, ignoring", now_ms - snap.spot->ts_ms);
        snap.spot.reset();
    }

    auto sample = quote_.get();
    if (!sample) return snap;

    if (now_ms - sample->ts_ms > config_.max_quote_age_ms) {
        spdlog::debug("Quote for {} is {}ms old, ignoring", sample->quote.market_id,
                      now_ms - sample->ts_ms);
        return snap;
    }

    Quote quote = sample->quote;
    int64_t start = quote.market_start_ms.value_or(
        quote.market_end_ms.value_or(0) - static_cast<int64_t>(MARKET_CYCLE_MINUTES) * MS_PER_MINUTE);

    if (snap.spot) {
        quote.price_to_beat = latch_.observe(quote.market_id, start, *snap.spot);
    } else {
        quote.price_to_beat = latch_.get(quote.market_id);
    }

    snap.quote = quote;
    return snap;
}

// JsonlFeedReader

JsonlFeedReader::JsonlFeedReader(const std::string& path, MarketDataHub& hub, bool paced)
    : path_(path), hub_(hub), paced_(paced) {}

JsonlFeedReader::~JsonlFeedReader() {
    stop();
}

bool JsonlFeedReader::start() {
    if (running_) return true;

    if (path_ != "-" && !std::ifstream(path_)) {
        spdlog::error("Cannot open feed: {}", path_);
        return false;
    }

    running_ = true;
    finished_ = false;
    thread_ = std::thread(&JsonlFeedReader::run, this);
    spdlog::info("Feed reader started: {}{}", path_ == "-" ? "stdin" : path_, paced_ ? " (paced)" : "");
    return true;
}

void JsonlFeedReader::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void JsonlFeedReader::run() {
    std::optional<int64_t> last_ts;

    if (path_ == "-") {
        read_stdin(last_ts);
    } else {
        std::ifstream file(path_);
        std::string line;
        while (running_ && std::getline(file, line)) {
            handle_line(line, last_ts);
        }
    }

    finished_ = true;
    spdlog::info("Feed reader finished: {} lines, {} rejected", lines_read_.load(), lines_rejected_.load());
}

void JsonlFeedReader::read_stdin(std::optional<int64_t>& last_ts) {
    std::string buffer;
    char chunk[4096];

    while (running_) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll on stdin failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n <= 0) break;  // EOF or error
        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            handle_line(buffer.substr(0, pos), last_ts);
            buffer.erase(0, pos + 1);
        }
    }

    if (!buffer.empty()) {
        handle_line(buffer, last_ts);
    }
}

void JsonlFeedReader::handle_line(const std::string& line, std::optional<int64_t>& last_ts) {
    if (line.empty()) return;
    lines_read_++;

    auto tick = parse_tick_line(line);
    if (!tick) {
        lines_rejected_++;
        return;
    }

    if (paced_ && tick->ts_ms) {
        if (last_ts && *tick->ts_ms > *last_ts) {
            int64_t gap = *tick->ts_ms - *last_ts;
            while (running_ && gap > 0) {
                int64_t step = std::min<int64_t>(gap, 100);
                std::this_thread::sleep_for(std::chrono::milliseconds(step));
                gap -= step;
            }
        }
        last_ts = tick->ts_ms;
    }

    hub_.on_tick(*tick, now_ms());
}

} // namespace hedge
