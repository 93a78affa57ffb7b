#include "core/event_log.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace hedge {

std::string event_type_to_string(EventType t) {
    switch (t) {
        case EventType::DECISION: return "decision";
        case EventType::ORDER: return "order";
        case EventType::RESOLUTION: return "resolution";
        case EventType::STALE_CLEANUP: return "stale_cleanup";
        case EventType::STOP_LOSS_ADVISORY: return "stop_loss_advisory";
        case EventType::TRADING_PAUSED: return "trading_paused";
        case EventType::TRADING_HALTED: return "trading_halted";
        case EventType::HALT_CLEARED: return "halt_cleared";
        case EventType::WINDOW_ROLLOVER: return "window_rollover";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const EngineEvent& e) {
    j = nlohmann::json{
        {"type", event_type_to_string(e.type)},
        {"ts_ms", e.ts_ms},
        {"timestamp", time_utils::to_iso8601(e.ts_ms)},
        {"market_id", e.market_id},
        {"data", e.data}
    };
}

EventLog::EventLog(size_t capacity)
    : capacity_(capacity) {}

void EventLog::publish(EngineEvent event) {
    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        while (events_.size() > capacity_) {
            events_.pop_front();
        }
        published_++;
        subscribers = subscribers_;
    }

    for (const auto& subscriber : subscribers) {
        try {
            subscriber(event);
        } catch (const std::exception& e) {
            spdlog::error("Event subscriber failed on {}: {}", event_type_to_string(event.type), e.what());
        }
    }
}

void EventLog::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(subscriber));
}

std::vector<EngineEvent> EventLog::recent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(max_count, events_.size());
    return std::vector<EngineEvent>(events_.end() - static_cast<std::ptrdiff_t>(n), events_.end());
}

std::vector<EngineEvent> EventLog::recent_of_type(EventType type, size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EngineEvent> out;
    for (auto it = events_.rbegin(); it != events_.rend() && out.size() < max_count; ++it) {
        if (it->type == type) out.push_back(*it);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

int64_t EventLog::published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace hedge
