#pragma once

#include <string>

namespace candlebot {
namespace engine {

// 거래 모드
enum class TradingMode {
    LIVE,           // 실전 거래
    BACKTEST        // 백테스트
};

// 엔진 설정
struct EngineConfig {
    TradingMode mode;
    std::string base;

    // Fees applied to the acquired asset
    double fee_limit_order;
    double fee_market_order;

    // Starting balances for a fresh ledger
    double initial_quote;
    double initial_base;

    std::string strategy;
    std::string state_file;     // empty => no ledger persistence

    EngineConfig()
        : mode(TradingMode::BACKTEST)
        , base("BTC")
        , fee_limit_order(0.0015)
        , fee_market_order(0.0025)
        , initial_quote(1000.0)
        , initial_base(0.0)
        , strategy("rsi")
    {}
};

} // namespace engine
} // namespace candlebot
