#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace candlebot {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    // Applies an already parsed document (used by load and by tests)
    void apply(const nlohmann::json& j);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    void setInitialQuote(double v) { engine_config_.initial_quote = v; }
    void setInitialBase(double v) { engine_config_.initial_base = v; }
    void setStrategy(const std::string& name) { engine_config_.strategy = name; }
    void setStateFile(const std::string& path) { engine_config_.state_file = path; }

    double getFeeLimitOrder() const { return engine_config_.fee_limit_order; }
    double getFeeMarketOrder() const { return engine_config_.fee_market_order; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    // Strategy Configs
    strategy::RsiStrategyConfig getRsiConfig() const { return rsi_config_; }
    strategy::GridTradingStrategyConfig getGridTradingConfig() const { return grid_trading_config_; }

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    engine::EngineConfig engine_config_;
    strategy::RsiStrategyConfig rsi_config_;
    strategy::GridTradingStrategyConfig grid_trading_config_;
};

} // namespace candlebot
