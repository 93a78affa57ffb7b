#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace hedge {

/**
 * One resolved position as written to the trade journal.
 */
struct JournalRow {
    int64_t timestamp_ms{0};
    std::string market_id;
    Direction direction{Direction::LONG};
    Outcome outcome{Outcome::UP};
    bool win{false};
    std::string status;           // RESOLVED_WIN, RESOLVED_LOSS, RESOLVED_STALE
    std::string strategy;
    Price entry_price{0.0};
    Price opposite_price{0.0};
    Price combined_price{0.0};
    Notional cost{0.0};
    Notional pnl{0.0};
    std::optional<double> price_to_beat;
    std::optional<double> resolved_price;
    std::optional<double> move_pct;
    bool overreaction{false};
    std::string streak;           // e.g. "W3", "L1"
};

void to_json(nlohmann::json& j, const JournalRow& r);

/**
 * Append-only record of resolved trades plus structured engine events.
 */
class TradeJournal {
public:
    virtual ~TradeJournal() = default;

    virtual bool append_trade(const JournalRow& row) = 0;
    virtual bool append_event(const std::string& event_type, const nlohmann::json& data) = 0;
};

/**
 * CSV of resolved trades and a JSON-lines event file.
 * Write failures are logged and reported via the return value.
 */
class FileTradeJournal : public TradeJournal {
public:
    FileTradeJournal(const std::string& csv_path, const std::string& events_path);
    ~FileTradeJournal() override;

    bool append_trade(const JournalRow& row) override;
    bool append_event(const std::string& event_type, const nlohmann::json& data) override;

    void flush();

    static std::string csv_header();
    static std::string to_csv_line(const JournalRow& row);

private:
    std::string csv_path_;
    std::string events_path_;
    std::ofstream csv_;
    std::ofstream events_;
    std::mutex mutex_;

    static void open_append(std::ofstream& file, const std::string& path);
};

} // namespace hedge
