#include "core/state/LedgerStoreJson.h"
#include "common/Logger.h"

#include <chrono>
#include <fstream>
#include <system_error>

namespace candlebot {
namespace core {

namespace {
long long getCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
}

LedgerStoreJson::LedgerStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<Ledger> LedgerStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    // A corrupt file is an error, not a fresh start: parse errors propagate.
    nlohmann::json raw;
    in >> raw;

    Ledger ledger = Ledger::fromJson(raw.at("ledger"));
    LOG_INFO("Ledger loaded from {} (saved_at_ms={}, orders={})",
             file_path_.string(), raw.value("saved_at_ms", 0LL), ledger.orders().size());
    return ledger;
}

bool LedgerStoreJson::save(const Ledger& ledger) {
    nlohmann::json raw;
    raw["saved_at_ms"] = getCurrentTimeMs();
    raw["ledger"] = ledger.toJson();

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // rename can fail across filesystems; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        LOG_ERROR("Ledger save failed for {}: {}", file_path_.string(), ec.message());
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace candlebot
