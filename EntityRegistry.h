// EntityRegistry.h
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "EntityRecord.h"

enum class UpsertResult {
    ADDED,
    UPDATED
};

// --- EntityRegistry ---
// Latest record per entity_id plus its last-seen time. Owned by the receiver and
// only touched from its io_context, so there is no locking here.
class EntityRegistry {
public:
    // Replaces any previous record wholesale. last_updated never moves backwards for an id.
    UpsertResult Upsert(EntityRecord record);

    std::optional<EntityRecord> Get(const std::string& entity_id) const;

    // Copy of the whole map.
    std::map<std::string, EntityRecord> ListAll() const;

    // Removes every entity last seen before (now - stale_after) and returns their ids.
    std::vector<std::string> Sweep(TimePoint now, Clock::duration stale_after);

    bool Contains(const std::string& entity_id) const { return m_entities.count(entity_id) > 0; }
    size_t Size() const { return m_entities.size(); }

private:
    std::map<std::string, EntityRecord> m_entities;
    std::map<std::string, TimePoint> m_last_seen;
};
