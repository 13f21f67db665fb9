#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace quantpulse {

class Config {
public:
    static Config& getInstance();

    // Missing file or keys keep defaults; a malformed file is reported and
    // leaves the defaults in place. Returns true when a file was applied.
    bool load(const std::string& config_path);

    // Applies an already parsed document on top of the defaults
    void apply(const nlohmann::json& j);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getLogLevel() const { return engine_config_.logging.level; }
    std::string getLogDirectory() const { return engine_config_.logging.directory; }

private:
    Config() = default;
    engine::EngineConfig engine_config_;
};

} // namespace quantpulse
