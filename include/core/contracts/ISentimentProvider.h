#pragma once

#include <optional>
#include <string>

namespace regimegate {
namespace core {

class ISentimentProvider {
public:
    virtual ~ISentimentProvider() = default;

    // Score in [-1, 1], already deduplicated and decayed upstream.
    virtual std::optional<double> getScore(const std::string& symbol) = 0;
};

} // namespace core
} // namespace regimegate
