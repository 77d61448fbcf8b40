#include "risk/KillSwitch.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>
#include <stdexcept>

namespace regimegate {
namespace risk {

KillSwitch::KillSwitch(std::shared_ptr<core::IKillSwitchStore> store, double max_drawdown_pct)
    : store_(std::move(store))
    , max_drawdown_pct_(max_drawdown_pct) {
    if (!store_) {
        throw ConfigurationError("kill switch requires a state store");
    }
    if (!(max_drawdown_pct_ > 0.0) || max_drawdown_pct_ > 1.0) {
        throw ConfigurationError("risk.max_drawdown_pct must be in (0, 1]");
    }

    try {
        auto loaded = store_->load();
        if (loaded) {
            record_ = *loaded;
        }
    } catch (const PersistenceError& e) {
        record_ = core::KillSwitchRecord();
        record_.state = core::KillSwitchState::TRIPPED;
        record_.reason = std::string("state_unreadable: ") + e.what();
        record_.actor = "system";
        LOG_CRITICAL("Kill switch state unreadable, starting TRIPPED: {}", e.what());
    }

    if (record_.state == core::KillSwitchState::TRIPPED) {
        LOG_CRITICAL("Kill switch is TRIPPED ({}), trading halted until manual reset", record_.reason);
    } else {
        LOG_INFO("Kill switch ARMED (max drawdown {:.1f}%)", max_drawdown_pct_ * 100.0);
    }
}

bool KillSwitch::isTripped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.state == core::KillSwitchState::TRIPPED;
}

core::KillSwitchState KillSwitch::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.state;
}

core::KillSwitchRecord KillSwitch::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

bool KillSwitch::evaluate(double current_drawdown_pct, TimestampMs timestamp) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_.state == core::KillSwitchState::TRIPPED) {
            return true;
        }
        // a non-finite drawdown trips as well
        if (std::isfinite(current_drawdown_pct) && current_drawdown_pct < max_drawdown_pct_) {
            return false;
        }
    }
    trip("max_drawdown", current_drawdown_pct, timestamp);
    return true;
}

void KillSwitch::trip(const std::string& reason, double drawdown_pct, TimestampMs timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (record_.state == core::KillSwitchState::TRIPPED) {
        return;
    }

    core::KillSwitchRecord next = record_;
    next.state = core::KillSwitchState::TRIPPED;
    next.changed_at = timestamp;
    next.reason = reason;
    next.actor = "system";
    next.note.clear();
    next.trip_drawdown_pct = drawdown_pct;

    // The in-memory state trips even if the write fails.
    record_ = next;
    LOG_CRITICAL("KILL SWITCH TRIPPED: reason={}, drawdown={:.2f}% (limit {:.2f}%)",
                 reason, drawdown_pct * 100.0, max_drawdown_pct_ * 100.0);
    persistLocked(next);
}

void KillSwitch::reset(const std::string& operator_name, const std::string& note, TimestampMs timestamp) {
    if (operator_name.empty()) {
        throw std::invalid_argument("kill switch reset requires an operator name");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (record_.state == core::KillSwitchState::ARMED) {
        LOG_WARN("Kill switch reset requested by {} but it is already ARMED", operator_name);
        return;
    }

    core::KillSwitchRecord next = record_;
    next.state = core::KillSwitchState::ARMED;
    next.changed_at = timestamp;
    next.reason = "manual_reset";
    next.actor = operator_name;
    next.note = note;
    next.last_reset_at = timestamp;

    persistLocked(next);
    record_ = next;
    LOG_WARN("Kill switch reset to ARMED by {} ({})", operator_name, note);
}

void KillSwitch::persistLocked(const core::KillSwitchRecord& next) {
    if (!store_->save(next)) {
        LOG_CRITICAL("Failed to persist kill switch state {}", core::killSwitchStateToString(next.state));
        throw PersistenceError(std::string("kill switch state not persisted: ") +
                               core::killSwitchStateToString(next.state));
    }
}

} // namespace risk
} // namespace regimegate
