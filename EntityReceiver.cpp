#include "EntityReceiver.h"

#include "ReceiverLog.h"

EntityReceiver::EntityReceiver(boost::asio::io_context& io_ctx, ReceiverConfig config)
    : m_config(std::move(config)),
    m_enabled(m_config.start_enabled)
{
    UdpListener::Options options;
    options.mode = m_config.listener_mode;
    options.buffer_size = m_config.buffer_size;
    options.poll_interval = m_config.poll_interval;
    options.retry_delay = m_config.receive_retry_delay;

    m_listener = std::make_shared<UdpListener>(io_ctx,
        [this](const std::string& payload, const std::string& source_ip) {
            HandleDatagram(payload, source_ip);
        },
        options);
    m_sweeper = std::make_shared<EvictionSweeper>(io_ctx, m_registry, m_hub,
        m_config.cleanup_interval, m_config.stale_after);

    AddLog("EntityReceiver constructed for port " + std::to_string(m_config.udp_port) +
        " (" + m_config.broadcaster_name + ").");
}

EntityReceiver::~EntityReceiver() {
    StopListening();
}

// --- Lifecycle ---

bool EntityReceiver::IsListening() const {
    return m_enabled && m_listener->IsRunning();
}

void EntityReceiver::Enable() {
    const bool was_enabled = m_enabled;
    const bool was_listening = IsListening();

    if (!m_enabled) {
        m_enabled = true;
        AddLog("Receiver enabled.", LogType::LIFECYCLE);
        try {
            StartListening();
        }
        catch (const StartError&) {
            PublishStatusChanged();
            throw;
        }
    }

    if (m_enabled != was_enabled || IsListening() != was_listening) {
        PublishStatusChanged();
    }
}

void EntityReceiver::Disable() {
    if (!m_enabled) return;

    StopListening();
    m_enabled = false;
    AddLog("Receiver disabled.", LogType::LIFECYCLE);
    PublishStatusChanged();
}

void EntityReceiver::SetEnabled(bool enabled) {
    if (enabled && !m_enabled) Enable();
    else if (!enabled && m_enabled) Disable();
}

void EntityReceiver::Start() {
    if (!m_enabled) {
        AddLog("Receiver is disabled, not starting UDP listener.", LogType::LIFECYCLE, LogLevel::Debug);
        return;
    }
    const bool was_listening = IsListening();
    StartListening();
    if (IsListening() != was_listening) {
        PublishStatusChanged();
    }
}

void EntityReceiver::Stop() {
    const bool was_listening = IsListening();
    StopListening();
    if (IsListening() != was_listening) {
        PublishStatusChanged();
    }
}

void EntityReceiver::StartListening() {
    if (m_listener->IsRunning()) return;

    try {
        m_listener->Start(m_config.udp_port);
    }
    catch (const StartError& e) {
        AddLog("Failed to start UDP listener: " + std::string(e.what()), LogType::LIFECYCLE, LogLevel::Error);
        throw;
    }
    m_sweeper->Start();
    AddLog("Started UDP listener on port " + std::to_string(m_listener->LocalPort()), LogType::LIFECYCLE);
}

void EntityReceiver::StopListening() {
    const bool was_running = m_listener->IsSocketOpen() || m_sweeper->IsRunning();
    m_sweeper->Stop();
    m_listener->Stop();
    if (was_running) {
        AddLog("Stopped UDP listener", LogType::LIFECYCLE);
    }
}

void EntityReceiver::PublishStatusChanged() {
    ReceiverEvent event;
    event.kind = EventKind::STATUS_CHANGED;
    event.listening = IsListening();
    event.enabled = m_enabled;
    AddLog(std::string("Receiver status: ") + (event.enabled ? "enabled" : "disabled") + ", " +
        (event.listening ? "listening" : "stopped"), LogType::LIFECYCLE, LogLevel::Debug);
    m_hub.Publish(event);
}

// --- Ingestion ---

void EntityReceiver::HandleDatagram(const std::string& payload, const std::string& source_ip) {
    ++m_stats.datagrams_received;

    EntityRecord record;
    try {
        record = MessageDecoder::Decode(payload, source_ip, Clock::now());
    }
    catch (const DecodeError& e) {
        ++m_stats.decode_errors;
        AddLog("Failed to decode JSON from " + source_ip + ": " + e.what(), LogType::INGRESS, LogLevel::Warning);
        return;
    }
    catch (const ValidationError& e) {
        ++m_stats.validation_errors;
        AddLog("Received message with invalid entity_id from " + source_ip + ": " + e.what(),
            LogType::INGRESS, LogLevel::Warning);
        return;
    }

    const std::string entity_id = record.entity_id;
    if (IsLogEnabled(LogType::INGRESS, LogLevel::Debug)) {
        AddLog("Received entity update: " + entity_id + " = " + record.state.dump() + " from " + source_ip,
            LogType::INGRESS, LogLevel::Debug);
    }
    UpsertResult result = m_registry.Upsert(std::move(record));

    ReceiverEvent event;
    event.entity_id = entity_id;
    if (result == UpsertResult::ADDED) {
        ++m_stats.entities_added;
        event.kind = EventKind::ADDED;
    }
    else {
        ++m_stats.entities_updated;
        event.kind = EventKind::UPDATED;
    }

    m_hub.Publish(event);
}

ReceiverStats EntityReceiver::GetStats() const {
    ReceiverStats stats = m_stats;
    stats.receive_errors = m_listener->ReceiveErrorCount();
    stats.entities_removed = m_sweeper->RemovedCount();
    return stats;
}
