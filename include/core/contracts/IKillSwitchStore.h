#pragma once

#include <optional>

#include "core/model/CollaboratorTypes.h"

namespace regimegate {
namespace core {

class IKillSwitchStore {
public:
    virtual ~IKillSwitchStore() = default;

    // nullopt when nothing was ever saved. Throws PersistenceError when a
    // stored record exists but cannot be trusted.
    virtual std::optional<KillSwitchRecord> load() = 0;
    // Returns only after the record is durable.
    virtual bool save(const KillSwitchRecord& record) = 0;
};

} // namespace core
} // namespace regimegate
