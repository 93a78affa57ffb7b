#include <iostream>
#include <csignal>
#include <atomic>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <thread>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "core/trading_engine.hpp"
#include "execution/order_gateway.hpp"
#include "market_data/market_feed.hpp"
#include "persistence/state_store.hpp"
#include "persistence/trade_journal.hpp"

using namespace hedge;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

// Parse duration string like "1.5h", "30m", "90s", "2h30m"
// Returns duration in seconds, or 0 if empty
int64_t parse_duration_string(const std::string& input) {
    if (input.empty()) return 0;

    std::string s = input;
    s.erase(std::remove(s.begin(), s.end(), ' '), s.end());
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);

    int64_t total_seconds = 0;
    std::string number_buf;

    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            number_buf += c;
        } else if (c == 'h' || c == 'm' || c == 's') {
            if (number_buf.empty()) continue;

            double value = std::stod(number_buf);
            if (c == 'h') {
                total_seconds += static_cast<int64_t>(value * 3600);
            } else if (c == 'm') {
                total_seconds += static_cast<int64_t>(value * 60);
            } else {
                total_seconds += static_cast<int64_t>(value);
            }
            number_buf.clear();
        } else {
            throw std::invalid_argument("bad duration: " + input);
        }
    }

    // Bare number means minutes
    if (!number_buf.empty() && total_seconds == 0) {
        total_seconds = static_cast<int64_t>(std::stod(number_buf) * 60);
    }

    return total_seconds;
}

void setup_logging(const LoggingConfig& config, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/hedgepair.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("hedgepair", sinks.begin(), sinks.end());

    if (verbose || config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(2));
}

void print_startup_banner(const Config& config) {
    std::cout << "\n";
    std::cout << "┌─────────────────────────────────────────────────────────────────────────────┐\n";
    std::cout << "│ HEDGEPAIR - 15m Up/Down hedged pair accumulator                             │\n";
    std::cout << "├─────────────────────────────────────────────────────────────────────────────┤\n";
    std::cout << "│ Max window spend:  $" << std::fixed << std::setprecision(2) << config.strategy.max_window_spend << "\n";
    std::cout << "│ Max pair cost:     " << config.strategy.max_pair_cost << "\n";
    std::cout << "│ Max open exposure: $" << config.risk.max_open_exposure << "\n";
    std::cout << "│ P&L floor:         $" << config.risk.pnl_floor << "\n";
    std::cout << "└─────────────────────────────────────────────────────────────────────────────┘\n";

    if (config.mode == TradingMode::PAPER) {
        std::cout << "[PAPER MODE] Simulated execution, no network.\n\n";
    } else {
        std::cout << "[DRY-RUN MODE] Decisions computed, no orders placed.\n\n";
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"hedgepair - hedged pair accumulation for 15m Up/Down markets"};

    std::string config_path = "configs/hedgepair.json";
    std::string feed_path;
    std::string duration;
    bool dry_run = false;
    bool verbose = false;
    bool paced = false;
    bool clear_halt = false;

    auto* config_opt = app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-f,--feed", feed_path, "JSON-lines tick feed (\"-\" for stdin)");
    app.add_option("-d,--duration", duration, "Session length, e.g. 30m, 1.5h, 2h30m");
    app.add_flag("--dry-run", dry_run, "Compute decisions without placing orders");
    app.add_flag("--paced", paced, "Replay feed ticks at their recorded spacing");
    app.add_flag("--clear-halt", clear_halt, "Clear a latched risk halt and exit");
    app.add_flag("-v,--verbose", verbose, "Debug logging");

    CLI11_PARSE(app, argc, argv);

    Config config;
    try {
        if (config_opt->count() > 0 || std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
        config.apply_env_overrides();
        if (!config.validate()) {
            throw std::runtime_error("configuration failed validation");
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (dry_run) {
        config.mode = TradingMode::DRY_RUN;
    }
    if (!feed_path.empty()) {
        config.feed.feed_path = feed_path;
    }

    if (config.mode == TradingMode::LIVE) {
        std::cerr << "Live mode is not available: no signing gateway is built in. "
                     "Use \"paper\" or \"dry-run\".\n";
        return 1;
    }

    int64_t session_secs = 0;
    try {
        session_secs = parse_duration_string(duration);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    setup_logging(config.logging, verbose);

    auto store = std::make_shared<JsonStateStore>(config.persistence.state_path);
    auto journal = std::make_shared<FileTradeJournal>(
        config.persistence.trades_csv_path, config.persistence.journal_path);
    auto gateway = std::make_shared<RetryingGateway>(
        std::make_shared<PaperGateway>(fmt::format("paper-{}-", now_ms())), config.execution);

    std::unique_ptr<TradingEngine> engine;
    try {
        engine = std::make_unique<TradingEngine>(config, gateway, store, journal);
    } catch (const std::exception& e) {
        spdlog::error("Engine startup failed: {}", e.what());
        return 1;
    }

    if (clear_halt) {
        engine->clear_halt(now_ms());
        spdlog::info("Risk halt cleared");
        return 0;
    }

    print_startup_banner(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    MarketDataHub hub(config.feed);
    JsonlFeedReader reader(config.feed.feed_path, hub, paced);
    if (!reader.start()) {
        return 1;
    }

    auto started = std::chrono::steady_clock::now();
    auto last_stats = started;
    spdlog::info("hedgepair started. Mode: {}", mode_to_string(config.mode));

    while (!g_shutdown.load()) {
        if (session_secs > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - started);
            if (elapsed.count() >= session_secs) {
                spdlog::info("Session time limit reached. Shutting down...");
                break;
            }
        }

        int64_t t = now_ms();
        engine->on_tick(hub.snapshot(t), t);

        if (std::chrono::steady_clock::now() - last_stats >= std::chrono::seconds(60)) {
            spdlog::info("Stats: {}", engine->get_stats(t).dump());
            last_stats = std::chrono::steady_clock::now();
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(config.feed.poll_interval_ms));
    }

    reader.stop();
    journal->flush();

    auto stats = engine->get_stats(now_ms());
    spdlog::info("Final stats: {}", stats.dump(2));
    spdlog::info("Shutdown complete");
    return 0;
}
