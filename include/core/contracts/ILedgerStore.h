#pragma once

#include <optional>

#include "core/state/Ledger.h"

namespace candlebot {
namespace core {

// Persists Ledger + Order data only; execution clients are rebuilt on load.
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual std::optional<Ledger> load() = 0;
    virtual bool save(const Ledger& ledger) = 0;
};

} // namespace core
} // namespace candlebot
