#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace quantpulse {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

std::vector<std::string> readInstrumentList(const nlohmann::json& value,
                                            const std::vector<std::string>& fallback) {
    if (!value.is_array()) {
        return fallback;
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) {
            continue;
        }
        auto symbol = toUpperCopy(trimCopy(item.get<std::string>()));
        if (!symbol.empty() && std::find(out.begin(), out.end(), symbol) == out.end()) {
            out.push_back(symbol);
        }
    }
    return out.empty() ? fallback : out;
}

// port may be given as "443" or 443
std::string readPort(const nlohmann::json& section, const std::string& fallback) {
    if (!section.contains("port")) {
        return fallback;
    }
    const auto& port = section["port"];
    if (port.is_number_integer()) {
        return std::to_string(port.get<long long>());
    }
    if (port.is_string()) {
        return port.get<std::string>();
    }
    return fallback;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    engine_config_ = engine::EngineConfig();
    bool applied = false;

    try {
        std::filesystem::path config_path(path);
        if (!config_path.is_absolute() && !std::filesystem::exists(config_path)) {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config file: " << config_path.string() << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found, using defaults" << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cout << "Warning: config file could not be opened, using defaults" << std::endl;
            } else {
                nlohmann::json j;
                file >> j;
                apply(j);
                applied = true;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        engine_config_ = engine::EngineConfig();
        applied = false;
    }

    const std::string host_override = readEnvVar("QUANTPULSE_FEED_HOST");
    if (!host_override.empty()) {
        engine_config_.feed.host = host_override;
    }

    std::cout << "Config loaded: host=" << engine_config_.feed.host
              << ", instruments=" << engine_config_.feed.instruments.size()
              << ", flush=" << engine_config_.flush_interval_ms << "ms" << std::endl;
    return applied;
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("feed")) {
        auto& f = j["feed"];
        auto& feed = engine_config_.feed;
        feed.host = f.value("host", feed.host);
        feed.port = readPort(f, feed.port);
        feed.path_prefix = f.value("path_prefix", feed.path_prefix);
        feed.stream_suffix = f.value("stream_suffix", feed.stream_suffix);
        if (f.contains("instruments")) {
            feed.instruments = readInstrumentList(f["instruments"], feed.instruments);
        }
        feed.backoff_base_seconds = f.value("backoff_base_seconds", feed.backoff_base_seconds);
        feed.backoff_max_seconds = f.value("backoff_max_seconds", feed.backoff_max_seconds);
        feed.max_reconnect_attempts = f.value("max_reconnect_attempts", feed.max_reconnect_attempts);
        feed.channel_capacity = f.value("channel_capacity", feed.channel_capacity);
        feed.handshake_timeout_seconds = f.value("handshake_timeout_seconds", feed.handshake_timeout_seconds);
        feed.idle_timeout_seconds = f.value("idle_timeout_seconds", feed.idle_timeout_seconds);
    }

    if (j.contains("aggregation")) {
        engine_config_.flush_interval_ms =
            j["aggregation"].value("flush_interval_ms", engine_config_.flush_interval_ms);
    }

    if (j.contains("analytics")) {
        auto& a = j["analytics"];
        auto& analytics = engine_config_.analytics;
        analytics.history_capacity = a.value("history_capacity", analytics.history_capacity);
        analytics.zscore_window = a.value("zscore_window", analytics.zscore_window);
        analytics.sma_period = a.value("sma_period", analytics.sma_period);
        analytics.ema_period = a.value("ema_period", analytics.ema_period);
        analytics.rsi_period = a.value("rsi_period", analytics.rsi_period);
        analytics.stationarity_min_points = a.value("stationarity_min_points", analytics.stationarity_min_points);
        analytics.garch_min_returns = a.value("garch_min_returns", analytics.garch_min_returns);
        analytics.garch_alpha = a.value("garch_alpha", analytics.garch_alpha);
        analytics.garch_beta = a.value("garch_beta", analytics.garch_beta);
        analytics.anomaly_z_threshold = a.value("anomaly_z_threshold", analytics.anomaly_z_threshold);
        analytics.anomaly_min_points = a.value("anomaly_min_points", analytics.anomaly_min_points);

        if (a.contains("correlation_pairs") && a["correlation_pairs"].is_array()) {
            analytics.correlation_pairs.clear();
            for (const auto& pair : a["correlation_pairs"]) {
                if (pair.is_array() && pair.size() == 2 && pair[0].is_string() && pair[1].is_string()) {
                    analytics.correlation_pairs.emplace_back(toUpperCopy(pair[0].get<std::string>()),
                                                             toUpperCopy(pair[1].get<std::string>()));
                }
            }
        }
    }

    if (j.contains("clustering")) {
        engine_config_.clustering.min_correlation =
            j["clustering"].value("min_correlation", engine_config_.clustering.min_correlation);
    }

    if (j.contains("alerts")) {
        auto& a = j["alerts"];
        auto& alerts = engine_config_.alerts;
        alerts.log_capacity = a.value("log_capacity", alerts.log_capacity);
        alerts.equality_epsilon = a.value("equality_epsilon", alerts.equality_epsilon);
    }

    if (j.contains("backtest")) {
        auto& b = j["backtest"];
        auto& backtest = engine_config_.backtest;
        backtest.period = b.value("period", backtest.period);
        backtest.entry_threshold = b.value("entry_threshold", backtest.entry_threshold);
        backtest.exit_threshold = b.value("exit_threshold", backtest.exit_threshold);
    }

    if (j.contains("storage")) {
        auto& s = j["storage"];
        engine_config_.storage.enabled = s.value("enabled", engine_config_.storage.enabled);
        engine_config_.storage.directory = s.value("directory", engine_config_.storage.directory);
        engine_config_.storage.rules_file = s.value("rules_file", engine_config_.storage.rules_file);
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        engine_config_.logging.directory = l.value("directory", engine_config_.logging.directory);
        engine_config_.logging.level = l.value("level", engine_config_.logging.level);
    }

    if (j.contains("status")) {
        engine_config_.status_report_interval_seconds =
            j["status"].value("report_interval_seconds", engine_config_.status_report_interval_seconds);
    }
}

} // namespace quantpulse
