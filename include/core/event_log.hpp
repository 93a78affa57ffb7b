#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace hedge {

enum class EventType {
    DECISION,
    ORDER,
    RESOLUTION,
    STALE_CLEANUP,
    STOP_LOSS_ADVISORY,
    TRADING_PAUSED,
    TRADING_HALTED,
    HALT_CLEARED,
    WINDOW_ROLLOVER
};

std::string event_type_to_string(EventType t);

struct EngineEvent {
    EventType type{EventType::DECISION};
    int64_t ts_ms{0};
    std::string market_id;
    nlohmann::json data;
};

void to_json(nlohmann::json& j, const EngineEvent& e);

/**
 * In-process event bus. Subscribers are called synchronously on the
 * publishing thread; keep them cheap. A bounded tail is kept for stats.
 */
class EventLog {
public:
    using Subscriber = std::function<void(const EngineEvent&)>;

    explicit EventLog(size_t capacity = 500);

    void publish(EngineEvent event);
    void subscribe(Subscriber subscriber);

    std::vector<EngineEvent> recent(size_t max_count) const;
    std::vector<EngineEvent> recent_of_type(EventType type, size_t max_count) const;
    int64_t published() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<EngineEvent> events_;
    std::vector<Subscriber> subscribers_;
    int64_t published_{0};
};

} // namespace hedge
