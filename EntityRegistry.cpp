#include "EntityRegistry.h"

UpsertResult EntityRegistry::Upsert(EntityRecord record) {
    auto seen_it = m_last_seen.find(record.entity_id);
    UpsertResult result = UpsertResult::ADDED;
    if (seen_it != m_last_seen.end()) {
        result = UpsertResult::UPDATED;
        if (record.last_updated < seen_it->second) {
            record.last_updated = seen_it->second;
        }
    }

    const std::string id = record.entity_id;
    m_last_seen[id] = record.last_updated;
    m_entities[id] = std::move(record);
    return result;
}

std::optional<EntityRecord> EntityRegistry::Get(const std::string& entity_id) const {
    auto it = m_entities.find(entity_id);
    if (it == m_entities.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, EntityRecord> EntityRegistry::ListAll() const {
    return m_entities;
}

std::vector<std::string> EntityRegistry::Sweep(TimePoint now, Clock::duration stale_after) {
    std::vector<std::string> removed;
    const TimePoint cutoff = now - stale_after;
    for (auto it = m_last_seen.begin(); it != m_last_seen.end(); ) {
        if (it->second < cutoff) {
            removed.push_back(it->first);
            m_entities.erase(it->first);
            it = m_last_seen.erase(it);
        }
        else {
            ++it;
        }
    }
    return removed;
}
