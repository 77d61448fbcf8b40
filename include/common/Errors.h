#pragma once

#include <stdexcept>
#include <string>

namespace regimegate {

class TradingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad weight tables, wrong HMM state count, unparsable config. Fatal at startup.
class ConfigurationError : public TradingError {
public:
    using TradingError::TradingError;
};

// Not enough history to fit or classify. Callers skip the cycle.
class InsufficientDataError : public TradingError {
public:
    using TradingError::TradingError;
};

class InvalidWindowError : public TradingError {
public:
    using TradingError::TradingError;
};

// A fill replayed with different content, or one that overfills its order.
class IdempotencyViolation : public TradingError {
public:
    using TradingError::TradingError;
};

// equity != cash + positions_value after a mutation.
class AccountingInvariantError : public TradingError {
public:
    using TradingError::TradingError;
};

class KillSwitchTripped : public TradingError {
public:
    using TradingError::TradingError;
};

class PersistenceError : public TradingError {
public:
    using TradingError::TradingError;
};

} // namespace regimegate
