#pragma once

#include <stdexcept>
#include <string>

namespace candlebot {

class CandleBotError : public std::runtime_error {
public:
    explicit CandleBotError(const std::string& what) : std::runtime_error(what) {}
};

// Placement or seeding exceeds the available balance (or has a non-positive amount/price)
class InsufficientBalanceError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class OrderNotCancellableError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class OrderNotFoundError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class InvalidTransitionError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class NoCurrentCandleError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class ExchangeGatewayError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

// Backtest input validation
class InvalidExecutorError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class InsufficientHistoryError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class MissingColumnError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

class InvalidColumnTypeError : public CandleBotError {
public:
    using CandleBotError::CandleBotError;
};

} // namespace candlebot
