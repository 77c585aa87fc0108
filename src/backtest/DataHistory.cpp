#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <map>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace candlebot {
namespace backtest {

namespace {
// Anything below this is treated as epoch seconds (year 5138 in seconds)
constexpr long long kSecondsThreshold = 100000000000LL;

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> row;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    // "a,b," has an empty trailing cell that getline drops
    if (!line.empty() && line.back() == ',') {
        row.emplace_back();
    }
    return row;
}

bool parseNumber(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        out = std::stod(text, &consumed);
        return consumed == text.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

bool parseIso8601(const std::string& text, long long& out_ms) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    double second = 0.0;
    char sep = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d%n", &year, &month, &day, &sep, &hour, &minute, &consumed) != 6) {
        // Date only
        if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3 ||
            static_cast<size_t>(consumed) != text.size()) {
            return false;
        }
    } else if (sep != 'T' && sep != ' ') {
        return false;
    }

    std::string rest = text.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest[0] == ':') {
        size_t pos = 1;
        while (pos < rest.size() && (std::isdigit(static_cast<unsigned char>(rest[pos])) || rest[pos] == '.')) {
            ++pos;
        }
        if (!parseNumber(rest.substr(1, pos - 1), second)) {
            return false;
        }
        rest = rest.substr(pos);
    }

    long long offset_minutes = 0;
    if (rest == "Z" || rest.empty()) {
        // UTC
    } else if ((rest[0] == '+' || rest[0] == '-') && rest.size() == 6 && rest[3] == ':') {
        int off_h = 0, off_m = 0;
        if (std::sscanf(rest.c_str() + 1, "%2d:%2d", &off_h, &off_m) != 2) {
            return false;
        }
        offset_minutes = (rest[0] == '+' ? 1 : -1) * (off_h * 60LL + off_m);
    } else {
        return false;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second >= 61.0) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
    const long long epoch_s = static_cast<long long>(timegm(&tm));

    out_ms = (epoch_s - offset_minutes * 60LL) * 1000LL + static_cast<long long>(std::llround(second * 1000.0));
    return true;
}

double numberField(const nlohmann::json& item, const char* key, size_t index) {
    const auto& value = item.at(key);
    if (value.is_number()) {
        return value.get<double>();
    }
    double parsed = 0.0;
    if (value.is_string() && parseNumber(trim(value.get<std::string>()), parsed)) {
        return parsed;
    }
    throw InvalidColumnTypeError(
        std::string("Column '") + key + "' is not numeric at record " + std::to_string(index)
    );
}

const char* findKey(const nlohmann::json& item, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (item.contains(key)) {
            return key;
        }
    }
    return nullptr;
}
}

long long DataHistory::toMsTimestamp(long long ts) {
    if (ts > -kSecondsThreshold && ts < kSecondsThreshold) {
        return ts * 1000LL;
    }
    return ts;
}

long long DataHistory::parseTimestamp(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty()) {
        throw InvalidColumnTypeError("Empty timestamp");
    }

    double numeric = 0.0;
    if (parseNumber(text, numeric)) {
        if (numeric != std::floor(numeric) && std::abs(numeric) < static_cast<double>(kSecondsThreshold)) {
            // Fractional epoch seconds
            return static_cast<long long>(std::llround(numeric * 1000.0));
        }
        return toMsTimestamp(static_cast<long long>(std::llround(numeric)));
    }

    long long ms = 0;
    if (parseIso8601(text, ms)) {
        return ms;
    }
    throw InvalidColumnTypeError("Unrecognized timestamp: " + text);
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        throw std::runtime_error("Failed to open CSV file: " + file_path);
    }

    std::string line;
    std::vector<std::string> header;
    while (header.empty() && std::getline(file, line)) {
        if (!trim(line).empty()) {
            header = splitRow(line);
        }
    }
    if (header.empty()) {
        throw MissingColumnError("CSV file has no header row: " + file_path);
    }

    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns.emplace(toLower(header[i]), i);
    }

    auto requireColumn = [&](std::initializer_list<const char*> names) -> size_t {
        for (const char* name : names) {
            auto it = columns.find(name);
            if (it != columns.end()) {
                return it->second;
            }
        }
        throw MissingColumnError(std::string("CSV file is missing column '") + *names.begin() + "': " + file_path);
    };

    const size_t time_col = requireColumn({"time", "timestamp"});
    const size_t open_col = requireColumn({"open"});
    const size_t high_col = requireColumn({"high"});
    const size_t low_col = requireColumn({"low"});
    const size_t close_col = requireColumn({"close"});
    const size_t volume_col = requireColumn({"volume"});

    std::vector<Candle> candles;
    size_t line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty()) {
            continue;
        }
        const auto row = splitRow(line);

        auto numeric = [&](size_t col, const char* name) {
            double value = 0.0;
            if (col >= row.size() || !parseNumber(row[col], value)) {
                throw InvalidColumnTypeError(
                    std::string("Column '") + name + "' is not numeric at line " + std::to_string(line_no)
                );
            }
            return value;
        };

        if (time_col >= row.size()) {
            throw InvalidColumnTypeError("Missing timestamp at line " + std::to_string(line_no));
        }

        Candle candle;
        candle.timestamp = parseTimestamp(row[time_col]);
        candle.open = numeric(open_col, "open");
        candle.high = numeric(high_col, "high");
        candle.low = numeric(low_col, "low");
        candle.close = numeric(close_col, "close");
        candle.volume = numeric(volume_col, "volume");
        candles.push_back(candle);
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        throw std::runtime_error("Failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        throw InvalidColumnTypeError("Malformed JSON in " + file_path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw InvalidColumnTypeError("JSON candle file must hold an array: " + file_path);
    }

    std::vector<Candle> candles;
    candles.reserve(j.size());
    size_t index = 0;
    for (const auto& item : j) {
        if (!item.is_object()) {
            throw InvalidColumnTypeError("JSON record " + std::to_string(index) + " is not an object");
        }

        auto require = [&](std::initializer_list<const char*> keys) {
            const char* key = findKey(item, keys);
            if (key == nullptr) {
                throw MissingColumnError(
                    std::string("JSON record ") + std::to_string(index) + " is missing '" + *keys.begin() + "'"
                );
            }
            return key;
        };

        Candle candle;
        const auto& ts = item.at(require({"time", "timestamp", "t"}));
        if (ts.is_number_integer()) {
            candle.timestamp = toMsTimestamp(ts.get<long long>());
        } else if (ts.is_number()) {
            candle.timestamp = parseTimestamp(std::to_string(ts.get<double>()));
        } else if (ts.is_string()) {
            candle.timestamp = parseTimestamp(ts.get<std::string>());
        } else {
            throw InvalidColumnTypeError("JSON record " + std::to_string(index) + " has an invalid timestamp");
        }

        candle.open = numberField(item, require({"open", "o"}), index);
        candle.high = numberField(item, require({"high", "h"}), index);
        candle.low = numberField(item, require({"low", "l"}), index);
        candle.close = numberField(item, require({"close", "c"}), index);
        candle.volume = numberField(item, require({"volume", "v"}), index);
        candles.push_back(candle);
        ++index;
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path) {
    if (file_path.size() >= 5 && toLower(file_path.substr(file_path.size() - 5)) == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

} // namespace backtest
} // namespace candlebot
