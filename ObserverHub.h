// ObserverHub.h
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class EventKind {
    ADDED = 0,
    UPDATED,
    REMOVED,
    STATUS_CHANGED
};

constexpr size_t kEventKindCount = 4;

std::string EventKindName(EventKind kind);

struct ReceiverEvent {
    EventKind kind;
    std::string entity_id; // empty for STATUS_CHANGED
    bool listening = false;
    bool enabled = false;
};

// --- IReceiverObserver Interface ---
class IReceiverObserver {
public:
    virtual ~IReceiverObserver() = default;
    virtual void OnReceiverEvent(const ReceiverEvent& event) = 0;
};

// Adapts a plain callable to IReceiverObserver.
class CallbackObserver : public IReceiverObserver {
public:
    using Callback = std::function<void(const ReceiverEvent&)>;

    explicit CallbackObserver(Callback cb) : m_callback(std::move(cb)) {}

    void OnReceiverEvent(const ReceiverEvent& event) override {
        if (m_callback) m_callback(event);
    }

private:
    Callback m_callback;
};

using ObserverPtr = std::shared_ptr<IReceiverObserver>;

// --- ObserverHub ---
// One ordered subscriber list per EventKind. Publish() runs every handler inline,
// in subscription order, over a copy of the list taken before the first call.
// Not locked: like the registry, it is only used from the receiver's io_context.
class ObserverHub {
public:
    // Returns false if the observer is null or already subscribed to this kind.
    bool Subscribe(EventKind kind, ObserverPtr observer);
    // Returns false if the observer was not subscribed to this kind.
    bool Unsubscribe(EventKind kind, const ObserverPtr& observer);

    // Handler exceptions are logged and never reach the caller.
    void Publish(const ReceiverEvent& event);

    size_t SubscriberCount(EventKind kind) const;

private:
    std::array<std::vector<ObserverPtr>, kEventKindCount> m_subscribers;
};
