#include "signals/SignalFusion.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>

namespace regimegate {
namespace signals {

namespace {
constexpr SignalSource kSources[] = {SignalSource::TECHNICAL, SignalSource::ML, SignalSource::SENTIMENT};
}

double RegimeWeights::of(SignalSource source) const {
    switch (source) {
        case SignalSource::TECHNICAL: return technical;
        case SignalSource::ML: return ml;
        case SignalSource::SENTIMENT: return sentiment;
    }
    return 0.0;
}

void SignalFusionConfig::validate() const {
    for (Regime regime : {Regime::TRENDING, Regime::MEAN_REVERTING, Regime::CHOPPY}) {
        auto it = weights.find(regime);
        if (it == weights.end()) {
            throw ConfigurationError(std::string("fusion weights missing for ") + regimeToString(regime));
        }
        const auto& w = it->second;
        for (SignalSource source : kSources) {
            const double value = w.of(source);
            if (!std::isfinite(value) || value < 0.0) {
                throw ConfigurationError(std::string("fusion weight ") + signalSourceToString(source) +
                                         " for " + regimeToString(regime) + " must be >= 0");
            }
        }
        if (std::abs(w.sum() - 1.0) > 1e-6) {
            throw ConfigurationError(std::string("fusion weights for ") + regimeToString(regime) +
                                     " sum to " + std::to_string(w.sum()) + ", expected 1.0");
        }
    }
    if (!std::isfinite(choppy_scale) || choppy_scale < 0.0 || choppy_scale > 1.0) {
        throw ConfigurationError("fusion.choppy_scale must be in [0, 1]");
    }
    if (!std::isfinite(direction_threshold) || direction_threshold < 0.0 || direction_threshold >= 1.0) {
        throw ConfigurationError("fusion.direction_threshold must be in [0, 1)");
    }
}

SignalFusion::SignalFusion(SignalFusionConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

Direction SignalFusion::directionFor(double strength, double threshold) {
    if (strength > threshold) return Direction::LONG;
    if (strength < -threshold) return Direction::SHORT;
    return Direction::FLAT;
}

FusedSignal SignalFusion::fuse(
    const std::string& symbol,
    const std::vector<ComponentSignal>& components,
    Regime regime,
    double confidence,
    TimestampMs timestamp
) const {
    FusedSignal out;
    out.symbol = symbol;
    out.regime = regime;
    out.timestamp = timestamp;
    out.confidence = std::isfinite(confidence) ? std::clamp(confidence, 0.0, 1.0) : 0.0;

    // latest score per source
    std::map<SignalSource, ComponentSignal> present;
    for (const auto& component : components) {
        if (!std::isfinite(component.score)) {
            continue;
        }
        auto it = present.find(component.source);
        if (it == present.end() || component.timestamp >= it->second.timestamp) {
            present[component.source] = component;
        }
    }

    const RegimeWeights& table = config_.weights.at(regime);
    double present_weight = 0.0;
    for (const auto& [source, component] : present) {
        present_weight += table.of(source);
    }

    double raw = 0.0;
    for (SignalSource source : kSources) {
        auto it = present.find(source);
        const double score = (it != present.end()) ? std::clamp(it->second.score, -1.0, 1.0) : 0.0;
        double weight = 0.0;
        if (it != present.end() && present_weight > 0.0) {
            weight = table.of(source) / present_weight;
        }
        out.components[source] = score;
        out.weights[source] = weight;
        raw += weight * score;
    }

    if (regime == Regime::CHOPPY) {
        raw *= config_.choppy_scale;
    }

    out.strength = std::clamp(raw * out.confidence, -1.0, 1.0);
    out.direction = directionFor(out.strength, config_.direction_threshold);
    return out;
}

} // namespace signals
} // namespace regimegate
