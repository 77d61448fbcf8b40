#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/Logger.h"

namespace regimegate {
namespace backtest {

namespace {
bool barLess(const Bar& a, const Bar& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.symbol < b.symbol;
}

bool looksNumeric(const std::string& s) {
    return !s.empty() && (std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == '-' || s[0] == '.');
}
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path, const std::string& symbol) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (!looksNumeric(row[0])) {
            // Header or malformed row.
            continue;
        }

        const bool has_symbol = row.size() >= 7 && !looksNumeric(row[1]);
        const size_t base = has_symbol ? 2 : 1;

        try {
            Bar bar;
            bar.timestamp = std::stoll(row[0]);
            bar.symbol = has_symbol ? row[1] : symbol;
            bar.open = std::stod(row[base]);
            bar.high = std::stod(row[base + 1]);
            bar.low = std::stod(row[base + 2]);
            bar.close = std::stod(row[base + 3]);
            bar.volume = std::stod(row[base + 4]);
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    normalizeTimestampsToMs(bars);
    std::stable_sort(bars.begin(), bars.end(), barLess);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path, const std::string& symbol) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    nlohmann::json j;
    try {
        file >> j;
        for (const auto& item : j) {
            Bar bar;
            bar.symbol = item.value("symbol", symbol);

            if (item.contains("timestamp")) bar.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) bar.timestamp = item["t"].get<long long>();

            if (item.contains("open")) bar.open = item["open"].get<double>();
            else if (item.contains("o")) bar.open = item["o"].get<double>();

            if (item.contains("high")) bar.high = item["high"].get<double>();
            else if (item.contains("h")) bar.high = item["h"].get<double>();

            if (item.contains("low")) bar.low = item["low"].get<double>();
            else if (item.contains("l")) bar.low = item["l"].get<double>();

            if (item.contains("close")) bar.close = item["close"].get<double>();
            else if (item.contains("c")) bar.close = item["c"].get<double>();

            if (item.contains("volume")) bar.volume = item["volume"].get<double>();
            else if (item.contains("v")) bar.volume = item["v"].get<double>();

            bars.push_back(bar);
        }
        normalizeTimestampsToMs(bars);
        std::stable_sort(bars.begin(), bars.end(), barLess);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        bars.clear();
    }

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::merge(const std::map<std::string, std::vector<Bar>>& by_symbol) {
    std::vector<Bar> out;
    for (const auto& [symbol, bars] : by_symbol) {
        for (const auto& bar : bars) {
            out.push_back(bar);
            if (out.back().symbol.empty()) {
                out.back().symbol = symbol;
            }
        }
    }
    std::stable_sort(out.begin(), out.end(), barLess);
    return out;
}

void DataHistory::normalizeTimestampsToMs(std::vector<Bar>& bars) {
    for (auto& bar : bars) {
        if (bar.timestamp > 0 && bar.timestamp < 100000000000LL) {
            bar.timestamp *= 1000;
        }
    }
}

} // namespace backtest
} // namespace regimegate
