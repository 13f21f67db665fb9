#include "common/Logger.h"
#include "common/Config.h"
#include "engine/AnalyticsService.h"
#include "feed/TradeCsvReader.h"
#include "storage/RecordCodec.h"
#include "storage/RecordJournalJsonl.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace quantpulse;

namespace {

std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string replay_path;
    std::string export_symbol;
    long long export_since_ms = 0;
    bool show_help = false;
};

void printUsage() {
    std::cout << "Usage: QuantPulse [--config <file>] [--replay <trades.csv>]\n"
              << "                  [--export-metrics <SYMBOL> [--since <timestamp_ms>]]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            out.show_help = true;
        } else if (arg == "--config" && i + 1 < argc) {
            out.config_path = argv[++i];
        } else if (arg == "--replay" && i + 1 < argc) {
            out.replay_path = argv[++i];
        } else if (arg == "--export-metrics" && i + 1 < argc) {
            out.export_symbol = argv[++i];
            std::transform(out.export_symbol.begin(), out.export_symbol.end(), out.export_symbol.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        } else if (arg == "--since" && i + 1 < argc) {
            try {
                out.export_since_ms = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --since value: " << argv[i] << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::shared_ptr<alerts::AlertRuleStoreJson> makeRuleStore(const engine::EngineConfig& config) {
    if (config.storage.rules_file.empty()) {
        return nullptr;
    }
    return std::make_shared<alerts::AlertRuleStoreJson>(config.storage.rules_file);
}

nlohmann::json backtestToJson(const backtest::BacktestResult& result) {
    return {
        {"total_trades", result.trade_count},
        {"wins", result.wins},
        {"losses", result.losses},
        {"win_rate", result.win_rate},
        {"total_pnl", result.total_pnl},
        {"avg_pnl", result.avg_pnl}
    };
}

int runExport(const engine::EngineConfig& config, const CliOptions& options) {
    storage::RecordJournalJsonl journal(config.storage.directory);
    const size_t rows = journal.exportMetricsCsv(options.export_symbol, options.export_since_ms, std::cout);
    LOG_INFO("Exported {} metric rows for {}", rows, options.export_symbol);
    return 0;
}

// Event time drives the flush clock so windows match the recording
int runReplay(engine::EngineConfig config, const CliOptions& options) {
    const auto trades = feed::TradeCsvReader::load(options.replay_path);
    if (trades.empty()) {
        std::cerr << "No trades to replay in " << options.replay_path << "\n";
        return 1;
    }

    std::vector<std::string> symbols;
    for (const auto& trade : trades) {
        if (std::find(symbols.begin(), symbols.end(), trade.instrument_id) == symbols.end()) {
            symbols.push_back(trade.instrument_id);
        }
    }
    config.feed.instruments = symbols;

    auto event_clock = std::make_shared<std::atomic<long long>>(trades.front().timestamp);
    engine::AnalyticsService service(config, nullptr, makeRuleStore(config),
                                     [event_clock]() { return event_clock->load(); });

    size_t window_count = 0;
    nlohmann::json alerts_json = nlohmann::json::array();
    auto collect = [&](const engine::FlushReport& report) {
        window_count += report.windows.size();
        for (const auto& event : report.alerts) {
            alerts_json.push_back(storage::toJson(event));
        }
    };

    for (const auto& trade : trades) {
        event_clock->store(trade.timestamp);
        if (auto report = service.flushIfDue()) {
            collect(*report);
        }
        service.ingest(trade);
    }
    collect(service.flushNow());

    nlohmann::json out;
    out["trades"] = trades.size();
    out["windows"] = window_count;
    out["metrics"] = nlohmann::json::object();
    for (const auto& entry : service.getAllMetrics()) {
        out["metrics"][entry.first] = storage::toJson(entry.second);
    }
    out["correlations"] = service.getCorrelationMatrix();
    out["clusters"] = service.getClusters();
    out["backtests"] = nlohmann::json::object();
    out["anomalies"] = nlohmann::json::object();
    for (const auto& symbol : service.getInstruments()) {
        out["backtests"][symbol] = backtestToJson(service.runBacktest(symbol));
        out["anomalies"][symbol] = service.detectAnomalies(symbol);
    }
    out["alerts"] = alerts_json;

    std::cout << out.dump(2) << std::endl;
    return 0;
}

int runLive(const engine::EngineConfig& config) {
    std::shared_ptr<storage::IRecordSink> sink;
    if (config.storage.enabled) {
        sink = std::make_shared<storage::RecordJournalJsonl>(config.storage.directory);
    }

    engine::AnalyticsService service(config, sink, makeRuleStore(config));

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "\n";
    std::cout << "=============================================\n";
    std::cout << "       QuantPulse trade analytics\n";
    std::cout << "=============================================\n\n";
    std::cout << "Streaming " << config.feed.instruments.size() << " instruments from "
              << config.feed.host << ". Press Ctrl+C to stop.\n\n";

    if (!service.start()) {
        LOG_ERROR("Service failed to start");
        return 1;
    }

    int exit_code = 0;
    while (!g_stop_requested && service.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        if (service.getFeedStatus().state == network::FeedState::FAILED) {
            LOG_ERROR("Feed connection failed permanently; shutting down");
            exit_code = 2;
            break;
        }
    }

    if (g_stop_requested) {
        LOG_INFO("Shutdown signal received");
    }
    service.stop();
    service.logStatus();
    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions options;
        if (!parseArgs(argc, argv, options)) {
            printUsage();
            return 1;
        }
        if (options.show_help) {
            printUsage();
            return 0;
        }

        auto& config = Config::getInstance();
        config.load(options.config_path);
        const auto engine_config = config.getEngineConfig();

        Logger::getInstance().initialize(engine_config.logging.directory, engine_config.logging.level);

        if (!options.export_symbol.empty()) {
            return runExport(engine_config, options);
        }
        if (!options.replay_path.empty()) {
            return runReplay(engine_config, options);
        }

        const int code = runLive(engine_config);
        LOG_INFO("Program terminated");
        return code;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\nFatal error: " << e.what() << std::endl;
        return 1;
    }
}
