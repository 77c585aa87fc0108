#pragma once

#include "common/Types.h"
#include "core/state/Ledger.h"
#include "execution/IExecutionClient.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace candlebot {
namespace strategy {

// 전략 기본 정보
struct StrategyInfo {
    std::string name;           // 전략 이름
    std::string description;    // 설명
    int analysis_window_minutes;

    StrategyInfo() : analysis_window_minutes(0) {}
};

// Base class of every strategy. The decision logic (execute) only ever talks to
// the execution client; balances are read through state().
class Strategy {
public:
    explicit Strategy(std::shared_ptr<execution::IExecutionClient> executor);
    virtual ~Strategy() = default;

    // Reconcile open orders, then decide. Exceptions from execute() propagate.
    void run(const std::vector<Candle>& window);

    // Minimum span of history (minutes) the decision logic looks back over
    virtual int analysisWindowMinutes() const = 0;

    virtual std::string name() const = 0;

    // Strategy-specific parameters, e.g. for persisting alongside the ledger
    virtual nlohmann::json paramsToJson() const = 0;

    StrategyInfo getInfo() const;

    const core::Ledger& state() const { return executor_->state(); }
    execution::IExecutionClient& executor() { return *executor_; }
    const execution::IExecutionClient& executor() const { return *executor_; }

    // Swap in a freshly built client on resume. It must wrap the same ledger.
    void setExecutor(std::shared_ptr<execution::IExecutionClient> executor);

protected:
    virtual void execute(const std::vector<Candle>& window) = 0;

private:
    std::shared_ptr<execution::IExecutionClient> executor_;
};

} // namespace strategy
} // namespace candlebot
