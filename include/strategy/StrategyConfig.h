#pragma once

namespace candlebot {
namespace strategy {

struct RsiStrategyConfig {
    // RSI Thresholds
    double lower_threshold = 35.0;
    double upper_threshold = 65.0;
    int period = 14;

    int window_minutes = 60 * 24 * 30;  // 30 days
};

struct GridTradingStrategyConfig {
    int levels = 3;
    double spacing_pct = 0.01;          // 1% between grid lines
    double order_size_quote = 100.0;
    int window_minutes = 60;
};

} // namespace strategy
} // namespace candlebot
