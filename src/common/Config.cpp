#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace candlebot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);

    // Backward compatibility alias
    if (name == "grid") {
        return "grid_trading";
    }
    return name;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cerr << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Warning: config file not found: " << config_path << std::endl;
            std::cerr << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Warning: config file could not be opened." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cerr << "Config Loaded: base=" << engine_config_.base
                  << ", fee_limit=" << engine_config_.fee_limit_order
                  << ", fee_market=" << engine_config_.fee_market_order << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("trading")) {
        auto& t = j["trading"];

        std::string mode_str = t.value("mode", "BACKTEST");
        engine_config_.mode = (mode_str == "LIVE") ? engine::TradingMode::LIVE : engine::TradingMode::BACKTEST;
        engine_config_.base = trimCopy(t.value("base", engine_config_.base));
        engine_config_.fee_limit_order = t.value("fee_limit_order", 0.0015);
        engine_config_.fee_market_order = t.value("fee_market_order", 0.0025);
        engine_config_.initial_quote = t.value("initial_quote", 1000.0);
        engine_config_.initial_base = t.value("initial_base", 0.0);
        engine_config_.strategy = normalizeStrategyName(t.value("strategy", std::string("rsi")));
        engine_config_.state_file = t.value("state_file", std::string());
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("level", "info");
        log_dir_ = l.value("dir", "logs");
    }

    if (j.contains("strategies") && j["strategies"].contains("rsi")) {
        auto& s = j["strategies"]["rsi"];
        rsi_config_.lower_threshold = s.value("lower_threshold", 35.0);
        rsi_config_.upper_threshold = s.value("upper_threshold", 65.0);
        rsi_config_.period = s.value("period", 14);
        rsi_config_.window_minutes = s.value("window_minutes", 60 * 24 * 30);
    }

    if (j.contains("strategies") && j["strategies"].contains("grid_trading")) {
        auto& s = j["strategies"]["grid_trading"];
        grid_trading_config_.levels = s.value("levels", 3);
        grid_trading_config_.spacing_pct = s.value("spacing_pct", 0.01);
        grid_trading_config_.order_size_quote = s.value("order_size_quote", 100.0);
        grid_trading_config_.window_minutes = s.value("window_minutes", 60);
    }
}

} // namespace candlebot
