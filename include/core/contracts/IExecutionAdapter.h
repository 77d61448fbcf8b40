#pragma once

#include <optional>
#include <string>

#include "common/Types.h"
#include "core/model/CollaboratorTypes.h"

namespace regimegate {
namespace core {

// Reports facts only; the order state machine lives in OrderManager.
class IExecutionAdapter {
public:
    virtual ~IExecutionAdapter() = default;

    virtual ExecutionAck submit(const Order& order) = 0;
    virtual std::optional<ExecutionReport> poll(const std::string& order_id) = 0;
    virtual bool cancel(const std::string& order_id) = 0;
};

} // namespace core
} // namespace regimegate
