#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/ILedgerStore.h"

namespace candlebot {
namespace core {

class LedgerStoreJson : public ILedgerStore {
public:
    explicit LedgerStoreJson(std::filesystem::path file_path);

    std::optional<Ledger> load() override;
    bool save(const Ledger& ledger) override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace candlebot
