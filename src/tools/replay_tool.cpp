#include <iostream>
#include <iomanip>
#include <fstream>
#include <algorithm>
#include <map>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "core/trading_engine.hpp"
#include "execution/order_gateway.hpp"
#include "market_data/market_feed.hpp"
#include "persistence/trade_journal.hpp"
#include "utils/time_utils.hpp"

using namespace hedge;

/**
 * Deterministic replay of a recorded tick file through the full engine.
 * The ticks' own timestamps drive the clock; no state is loaded or saved.
 *
 * Usage:
 *   ./hedgepair_replay --input data/ticks.jsonl --out logs/replay
 */

struct ReplayStats {
    int lines{0};
    int rejected{0};
    int ticks{0};
    int decisions{0};
    int trades{0};
    int failed_orders{0};
    std::map<std::string, int> reasons;
};

int main(int argc, char* argv[]) {
    CLI::App app{"hedgepair replay - run recorded ticks through the engine"};

    std::string input_file;
    std::string config_path;
    std::string out_dir = "logs/replay";
    bool dry_run = false;
    bool settle = false;
    bool verbose = false;

    app.add_option("-i,--input", input_file, "Recorded JSON-lines ticks")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "Path to configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-o,--out", out_dir, "Directory for the replay journal");
    app.add_flag("--dry-run", dry_run, "Report instructions without simulated fills");
    app.add_flag("--settle", settle, "After the last tick, advance the clock until open positions go stale");
    app.add_flag("-v,--verbose", verbose, "Print every decision");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    Config config;
    try {
        if (!config_path.empty()) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }
    config.mode = dry_run ? TradingMode::DRY_RUN : TradingMode::PAPER;

    auto journal = std::make_shared<FileTradeJournal>(
        out_dir + "/trades.csv", out_dir + "/journal.jsonl");
    auto gateway = std::make_shared<PaperGateway>();
    TradingEngine engine(config, gateway, nullptr, journal);
    MarketDataHub hub(config.feed);

    ReplayStats stats;
    engine.events().subscribe([&](const EngineEvent& e) {
        if (e.type != EventType::DECISION) return;
        stats.decisions++;
        std::string reason = e.data.value("reason", "");
        stats.reasons[reason.empty() ? "TRADE" : reason]++;
    });

    std::ifstream file(input_file);
    if (!file.is_open()) {
        spdlog::error("Failed to open input file: {}", input_file);
        return 1;
    }

    spdlog::info("Starting replay from: {}", input_file);

    int64_t clock = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        stats.lines++;

        auto tick = parse_tick_line(line);
        if (!tick) {
            stats.rejected++;
            continue;
        }
        if (!tick->ts_ms) {
            spdlog::warn("Line {}: tick without ts_ms skipped", stats.lines);
            stats.rejected++;
            continue;
        }

        // Never run the clock backwards
        clock = std::max(clock, *tick->ts_ms);
        hub.on_tick(*tick, clock);

        // Decisions run on quote ticks; spot ticks only update state
        if (tick->type != TickType::QUOTE) {
            continue;
        }

        stats.ticks++;
        auto report = engine.on_tick(hub.snapshot(clock), clock);
        if (report.execution) {
            if (report.execution->success) {
                stats.trades++;
            } else {
                stats.failed_orders++;
            }
        }

        if (verbose) {
            std::cout << time_utils::to_iso8601(clock) << " "
                      << (report.decision.trade ? "TRADE " + report.decision.detail
                                                : report.decision.reason) << "\n";
        }
    }

    if (settle && clock > 0) {
        int64_t settle_at = clock + (config.risk.stale_after_minutes + 1) * MS_PER_MINUTE;
        spdlog::info("Settling open positions at {}", time_utils::to_iso8601(settle_at));
        engine.on_tick(hub.snapshot(settle_at), settle_at);
    }

    journal->flush();
    auto summary = engine.get_stats(clock);

    std::cout << "\n";
    std::cout << "════════════════════════════════════════════════════════\n";
    std::cout << "                    REPLAY RESULTS                       \n";
    std::cout << "════════════════════════════════════════════════════════\n";
    std::cout << "Lines read:         " << stats.lines << " (" << stats.rejected << " rejected)\n";
    std::cout << "Quote ticks:        " << stats.ticks << "\n";
    std::cout << "Orders filled:      " << stats.trades << " (" << stats.failed_orders << " failed)\n";
    std::cout << "────────────────────────────────────────────────────────\n";
    std::cout << "Resolved trades:    " << summary.value("total_trades", 0)
              << " (" << summary.value("wins", 0) << "W/" << summary.value("losses", 0) << "L)\n";
    std::cout << "Open positions:     " << summary.value("open_positions", 0) << "\n";
    std::cout << "Total P&L:          $" << std::fixed << std::setprecision(2)
              << summary.value("total_pnl", 0.0) << "\n";
    std::cout << "ROI:                " << summary.value("roi", 0.0) << "%\n";
    std::cout << "────────────────────────────────────────────────────────\n";
    std::cout << "Decision reasons:\n";
    for (const auto& [reason, count] : stats.reasons) {
        std::cout << "  " << std::left << std::setw(28) << reason << count << "\n";
    }
    std::cout << "════════════════════════════════════════════════════════\n";

    return 0;
}
