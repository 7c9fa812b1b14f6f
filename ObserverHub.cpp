#include "ObserverHub.h"

#include <algorithm>
#include <exception>

#include "ReceiverLog.h"

std::string EventKindName(EventKind kind) {
    switch (kind) {
    case EventKind::ADDED: return "added";
    case EventKind::UPDATED: return "updated";
    case EventKind::REMOVED: return "removed";
    case EventKind::STATUS_CHANGED: return "status_changed";
    }
    return "unknown";
}

bool ObserverHub::Subscribe(EventKind kind, ObserverPtr observer) {
    if (!observer) return false;
    auto& list = m_subscribers[static_cast<size_t>(kind)];
    if (std::find(list.begin(), list.end(), observer) != list.end()) {
        return false;
    }
    list.push_back(std::move(observer));
    return true;
}

bool ObserverHub::Unsubscribe(EventKind kind, const ObserverPtr& observer) {
    auto& list = m_subscribers[static_cast<size_t>(kind)];
    auto it = std::find(list.begin(), list.end(), observer);
    if (it == list.end()) return false;
    list.erase(it);
    return true;
}

void ObserverHub::Publish(const ReceiverEvent& event) {
    std::vector<ObserverPtr> snapshot = m_subscribers[static_cast<size_t>(event.kind)];

    for (const auto& observer : snapshot) {
        try {
            observer->OnReceiverEvent(event);
        }
        catch (const std::exception& e) {
            std::string target = event.entity_id.empty() ? "" : " for " + event.entity_id;
            AddLog("Error in " + EventKindName(event.kind) + " observer" + target + ": " + e.what(),
                LogType::SYSTEM, LogLevel::Error);
        }
        catch (...) {
            std::string target = event.entity_id.empty() ? "" : " for " + event.entity_id;
            AddLog("Unknown error in " + EventKindName(event.kind) + " observer" + target,
                LogType::SYSTEM, LogLevel::Error);
        }
    }
}

size_t ObserverHub::SubscriberCount(EventKind kind) const {
    return m_subscribers[static_cast<size_t>(kind)].size();
}
