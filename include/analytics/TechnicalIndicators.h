#pragma once

#include <vector>
#include "common/Types.h"

namespace candlebot {
namespace analytics {

class TechnicalIndicators {
public:
    // RSI (Relative Strength Index), Wilder's smoothing
    // 70 이상: 과매수, 30 이하: 과매도. Returns 50 when there is not enough data.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // Helper: 가격 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace candlebot
