#include "persistence/state_store.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <spdlog/spdlog.h>

namespace hedge {

JsonStateStore::JsonStateStore(const std::string& path)
    : path_(path) {}

std::optional<nlohmann::json> JsonStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!std::filesystem::exists(path_)) {
        spdlog::info("No saved state at {}, starting fresh", path_);
        return std::nullopt;
    }

    try {
        std::ifstream file(path_);
        if (!file) {
            spdlog::error("Failed to open state file: {}", path_);
            return std::nullopt;
        }
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const std::exception& e) {
        spdlog::error("Failed to read state from {}: {}", path_, e.what());
        return std::nullopt;
    }
}

bool JsonStateStore::save(const nlohmann::json& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        std::filesystem::path p(path_);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        std::string temp = path_ + ".tmp";
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to open temp file: {}", temp);
            return false;
        }

        file << std::setw(2) << state;
        file.flush();
        file.close();

        if (!file) {
            spdlog::error("Failed to write to temp file: {}", temp);
            return false;
        }

        // Atomic rename
        std::filesystem::rename(temp, path_);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("State write failed: {}", e.what());
        return false;
    }
}

} // namespace hedge
