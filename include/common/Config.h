#pragma once

#include <string>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace regimegate {

class Config {
public:
    static Config& getInstance();

    // A missing file keeps the defaults. A file that cannot be parsed, or
    // values that fail validation, throw ConfigurationError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // Back to defaults (env overrides not applied).
    void reset();

    engine::EngineConfig getEngineConfig() const;
    engine::TradingMode getMode() const;
    std::vector<std::string> getSymbols() const;
    double getInitialCapital() const;
    std::string getStateDir() const;
    std::string getLogDir() const;
    std::string getLogLevel() const;
    std::string getLoadedPath() const;

    // CLI overrides
    void setMode(engine::TradingMode mode);
    void setInitialCapital(double v);
    void setSymbols(const std::vector<std::string>& v);

private:
    Config() = default;
    void applyEnvOverrides(engine::EngineConfig& cfg) const;

    mutable std::mutex mutex_;
    engine::EngineConfig engine_config_;
    std::string loaded_path_;
};

} // namespace regimegate
