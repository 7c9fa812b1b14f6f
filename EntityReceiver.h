// EntityReceiver.h
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "EntityRecord.h"
#include "EntityRegistry.h"
#include "EvictionSweeper.h"
#include "MessageDecoder.h"
#include "ObserverHub.h"
#include "ReceiverConfig.h"
#include "UdpListener.h"

struct ReceiverStats {
    uint64_t datagrams_received = 0;
    uint64_t decode_errors = 0;
    uint64_t validation_errors = 0;
    uint64_t receive_errors = 0;
    uint64_t entities_added = 0;
    uint64_t entities_updated = 0;
    uint64_t entities_removed = 0;
};

/*
 * EntityReceiver
 *
 * One ingestion core per configuration. Owns the registry, the observer hub,
 * the UDP listener and the eviction sweeper, and runs all of them on the
 * io_context passed in. Every method must be called from that io_context's
 * thread (or while it is not running).
 *
 * States:
 *   Disabled          - nothing runs, Start() is a no-op.
 *   Enabled-Stopped   - initial state when start_enabled is set.
 *   Enabled-Running   - socket bound, receive loop and sweeper active.
 *
 * Registry contents survive Stop/Start and Disable/Enable; only the sweeper
 * removes entries.
 */
class EntityReceiver {
public:
    EntityReceiver(boost::asio::io_context& io_ctx, ReceiverConfig config);
    ~EntityReceiver();

    EntityReceiver(const EntityReceiver&) = delete;
    EntityReceiver& operator=(const EntityReceiver&) = delete;

    // --- Lifecycle ---
    void Enable();  // Rethrows StartError after publishing the status change
    void Disable();
    void SetEnabled(bool enabled);
    void Start();   // Throws StartError on bind failure; no-op when disabled or running
    void Stop();    // Idempotent

    bool IsListening() const;
    bool IsEnabled() const { return m_enabled; }

    // --- Registry surface ---
    std::map<std::string, EntityRecord> ListAll() const { return m_registry.ListAll(); }
    std::optional<EntityRecord> Get(const std::string& entity_id) const { return m_registry.Get(entity_id); }
    size_t EntityCount() const { return m_registry.Size(); }

    // --- Observers ---
    bool Subscribe(EventKind kind, ObserverPtr observer) { return m_hub.Subscribe(kind, std::move(observer)); }
    bool Unsubscribe(EventKind kind, const ObserverPtr& observer) { return m_hub.Unsubscribe(kind, observer); }

    // Decode one datagram and apply it. Bad datagrams are logged and dropped.
    void HandleDatagram(const std::string& payload, const std::string& source_ip);

    // Evicts entities older than the configured staleness relative to 'now'.
    std::vector<std::string> SweepStale(TimePoint now) { return m_sweeper->SweepOnce(now); }

    ReceiverStats GetStats() const;
    uint16_t LocalPort() const { return m_listener->LocalPort(); }
    const ReceiverConfig& Config() const { return m_config; }

private:
    void StartListening();
    void StopListening();
    void PublishStatusChanged();

    ReceiverConfig m_config;
    EntityRegistry m_registry;
    ObserverHub m_hub;
    std::shared_ptr<UdpListener> m_listener;
    std::shared_ptr<EvictionSweeper> m_sweeper;
    bool m_enabled;
    ReceiverStats m_stats;
};
