#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/OrderSchema.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace candlebot {
namespace core {
namespace execution {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return event;
}

OrderStatus targetStatus(const std::string& event) {
    if (event == "filled" || event == "fill" || event == "done") {
        return OrderStatus::FILLED;
    }
    if (event == "cancel" || event == "cancelled" || event == "canceled" || event == "expired") {
        return OrderStatus::CANCELLED;
    }
    if (event == "open" || event == "new" || event == "wait" || event == "submitted") {
        return OrderStatus::OPEN;
    }
    throw InvalidTransitionError("Unknown order event: " + event);
}
} // namespace

bool OrderLifecycleStateMachine::isTerminal(OrderStatus status) {
    return status == OrderStatus::FILLED || status == OrderStatus::CANCELLED;
}

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    OrderStatus current,
    const std::string& event
) {
    const OrderStatus target = targetStatus(normalizeEvent(event));

    OrderLifecycleTransitionResult result;
    result.status = current;
    result.terminal = isTerminal(current);

    if (target == current) {
        return result;
    }

    if (current != OrderStatus::OPEN) {
        throw InvalidTransitionError(
            std::string("Illegal order transition: ") + orderStatusToString(current) +
            " -> " + orderStatusToString(target)
        );
    }

    result.status = target;
    result.terminal = isTerminal(target);
    result.changed = true;
    return result;
}

} // namespace execution
} // namespace core
} // namespace candlebot
