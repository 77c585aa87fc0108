#pragma once

#include <string>

#include "common/Types.h"

namespace candlebot {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::OPEN;
    bool terminal = false;
    bool changed = false;
};

// open -> filled, open -> cancelled. Everything else is either a no-op
// (re-reporting the current status) or an InvalidTransitionError.
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        OrderStatus current,
        const std::string& event
    );

    static bool isTerminal(OrderStatus status);
};

} // namespace execution
} // namespace core
} // namespace candlebot
