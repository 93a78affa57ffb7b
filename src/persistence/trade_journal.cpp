#include "persistence/trade_journal.hpp"
#include "utils/time_utils.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>

namespace hedge {

namespace {

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) {
        return s;
    }
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string csv_number(const std::optional<double>& v, int precision) {
    return v ? fmt::format("{:.{}f}", *v, precision) : std::string();
}

} // namespace

void to_json(nlohmann::json& j, const JournalRow& r) {
    j = nlohmann::json{
        {"timestamp", time_utils::to_iso8601(r.timestamp_ms)},
        {"market_id", r.market_id},
        {"direction", direction_to_string(r.direction)},
        {"outcome", outcome_to_string(r.outcome)},
        {"result", r.win ? "WIN" : "LOSS"},
        {"status", r.status},
        {"strategy", r.strategy},
        {"entry_price", r.entry_price},
        {"opposite_price", r.opposite_price},
        {"combined_price", r.combined_price},
        {"cost", r.cost},
        {"pnl", r.pnl},
        {"price_to_beat", r.price_to_beat ? nlohmann::json(*r.price_to_beat) : nlohmann::json(nullptr)},
        {"resolved_price", r.resolved_price ? nlohmann::json(*r.resolved_price) : nlohmann::json(nullptr)},
        {"move_pct", r.move_pct ? nlohmann::json(*r.move_pct) : nlohmann::json(nullptr)},
        {"overreaction", r.overreaction},
        {"streak", r.streak}
    };
}

FileTradeJournal::FileTradeJournal(const std::string& csv_path, const std::string& events_path)
    : csv_path_(csv_path)
    , events_path_(events_path)
{
    std::error_code ec;
    auto existing = std::filesystem::file_size(csv_path_, ec);
    bool write_header = ec || existing == 0;

    open_append(csv_, csv_path_);
    open_append(events_, events_path_);

    if (write_header && csv_.is_open()) {
        csv_ << csv_header() << "\n";
        csv_.flush();
    }
}

FileTradeJournal::~FileTradeJournal() {
    flush();
}

void FileTradeJournal::open_append(std::ofstream& file, const std::string& path) {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create journal directory for {}: {}", path, e.what());
    }

    file.open(path, std::ios::app);
    if (!file.is_open()) {
        spdlog::error("Failed to open journal file: {}", path);
    } else {
        spdlog::info("Journal opened: {}", path);
    }
}

std::string FileTradeJournal::csv_header() {
    return "timestamp,market_id,direction,outcome,result,strategy,entry_price,"
           "opposite_price,combined_price,cost,pnl,price_to_beat,resolved_price,"
           "move_pct,overreaction,streak";
}

std::string FileTradeJournal::to_csv_line(const JournalRow& row) {
    return fmt::format("{},{},{},{},{},{},{:.3f},{:.3f},{:.3f},{:.4f},{:.4f},{},{},{},{},{}",
        time_utils::to_iso8601(row.timestamp_ms),
        csv_field(row.market_id),
        direction_to_string(row.direction),
        outcome_to_string(row.outcome),
        row.win ? "WIN" : "LOSS",
        csv_field(row.strategy),
        row.entry_price,
        row.opposite_price,
        row.combined_price,
        row.cost,
        row.pnl,
        csv_number(row.price_to_beat, 2),
        csv_number(row.resolved_price, 2),
        csv_number(row.move_pct, 4),
        row.overreaction ? "true" : "false",
        row.streak);
}

bool FileTradeJournal::append_trade(const JournalRow& row) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!csv_.is_open()) {
            spdlog::error("Trade journal not open, dropping row for {}", row.market_id);
            return false;
        }
        csv_ << to_csv_line(row) << "\n";
        csv_.flush();
        if (!csv_) {
            spdlog::error("Failed to write trade row to {}", csv_path_);
            return false;
        }
    }

    nlohmann::json data = row;
    return append_event("trade_resolved", data);
}

bool FileTradeJournal::append_event(const std::string& event_type, const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!events_.is_open()) {
        return false;
    }

    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = data;
    events_ << j.dump() << "\n";
    events_.flush();

    if (!events_) {
        spdlog::error("Failed to write event to {}", events_path_);
        return false;
    }
    return true;
}

void FileTradeJournal::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (csv_.is_open()) csv_.flush();
    if (events_.is_open()) events_.flush();
}

} // namespace hedge
