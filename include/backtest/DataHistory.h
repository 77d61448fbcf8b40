#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/Types.h"

namespace regimegate {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // or timestamp,symbol,open,high,low,close,volume (symbol column wins over `symbol`)
    static std::vector<Bar> loadCSV(const std::string& file_path, const std::string& symbol);

    // Load bars from a JSON array of {timestamp|t, open|o, high|h, low|l, close|c, volume|v}
    static std::vector<Bar> loadJSON(const std::string& file_path, const std::string& symbol);

    // Merges per-symbol series into one stream ordered by (timestamp, symbol).
    static std::vector<Bar> merge(const std::map<std::string, std::vector<Bar>>& by_symbol);

    // Seconds timestamps (< 1e11) are converted to milliseconds.
    static void normalizeTimestampsToMs(std::vector<Bar>& bars);
};

} // namespace backtest
} // namespace regimegate
