#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace hedge {

/**
 * Durable snapshot store for the tracker state.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    // nullopt when nothing has been saved yet or the snapshot is unreadable
    virtual std::optional<nlohmann::json> load() = 0;

    // Returns false on failure; never throws
    virtual bool save(const nlohmann::json& state) = 0;
};

/**
 * One JSON document on disk. Writes go to <path>.tmp, are flushed, then
 * renamed over the target so a crash never leaves a partial file.
 */
class JsonStateStore : public StateStore {
public:
    explicit JsonStateStore(const std::string& path);

    std::optional<nlohmann::json> load() override;
    bool save(const nlohmann::json& state) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace hedge
