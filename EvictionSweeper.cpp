#include "EvictionSweeper.h"

#include "EntityRegistry.h"
#include "ObserverHub.h"
#include "ReceiverLog.h"

EvictionSweeper::EvictionSweeper(boost::asio::io_context& io_ctx, EntityRegistry& registry, ObserverHub& hub,
    std::chrono::milliseconds interval, std::chrono::milliseconds stale_after)
    : m_registry(registry),
    m_hub(hub),
    m_timer(io_ctx),
    m_interval(interval),
    m_stale_after(stale_after),
    m_running(false),
    m_generation(0),
    m_removed_total(0)
{
}

EvictionSweeper::~EvictionSweeper() {
    Stop();
}

void EvictionSweeper::Start() {
    if (m_running) return;
    m_running = true;
    ++m_generation;
    ScheduleTick();
    AddLog("Sweeper: started (every " + std::to_string(m_interval.count()) + " ms, stale after " +
        std::to_string(m_stale_after.count()) + " ms)", LogType::LIFECYCLE, LogLevel::Debug);
}

void EvictionSweeper::Stop() {
    if (!m_running) return;
    m_running = false;
    ++m_generation;
    m_timer.cancel();
    AddLog("Sweeper: stopped.", LogType::LIFECYCLE, LogLevel::Debug);
}

std::vector<std::string> EvictionSweeper::SweepOnce(TimePoint now) {
    std::vector<std::string> removed = m_registry.Sweep(now, m_stale_after);
    for (const auto& entity_id : removed) {
        ++m_removed_total;
        AddLog("Removed stale entity: " + entity_id, LogType::INGRESS, LogLevel::Debug);

        ReceiverEvent event;
        event.kind = EventKind::REMOVED;
        event.entity_id = entity_id;
        m_hub.Publish(event);
    }
    return removed;
}

void EvictionSweeper::ScheduleTick() {
    uint64_t generation = m_generation;
    m_timer.expires_after(m_interval);
    m_timer.async_wait(
        [self = shared_from_this(), generation](const boost::system::error_code& ec) {
            self->OnTick(generation, ec);
        });
}

void EvictionSweeper::OnTick(uint64_t generation, const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || generation != m_generation || !m_running) {
        return;
    }
    if (ec) {
        AddLog("Sweeper: timer error: " + ec.message(), LogType::SYSTEM, LogLevel::Error);
    }
    else {
        SweepOnce(Clock::now());
    }
    if (generation == m_generation && m_running) {
        ScheduleTick();
    }
}
