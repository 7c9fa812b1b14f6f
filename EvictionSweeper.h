// EvictionSweeper.h
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "EntityRecord.h"

class EntityRegistry;
class ObserverHub;

// --- EvictionSweeper ---
// Fixed-interval timer that evicts entities not seen within stale_after and
// publishes one REMOVED event per evicted id. Must be owned by a std::shared_ptr.
class EvictionSweeper : public std::enable_shared_from_this<EvictionSweeper> {
public:
    EvictionSweeper(boost::asio::io_context& io_ctx, EntityRegistry& registry, ObserverHub& hub,
        std::chrono::milliseconds interval, std::chrono::milliseconds stale_after);
    ~EvictionSweeper();

    EvictionSweeper(const EvictionSweeper&) = delete;
    EvictionSweeper& operator=(const EvictionSweeper&) = delete;

    void Start();
    // Cancels the pending wait; the tick handler returns without sweeping.
    void Stop();
    bool IsRunning() const { return m_running; }

    // One sweep at 'now'. Used by the timer tick and for on-demand sweeps.
    std::vector<std::string> SweepOnce(TimePoint now);

    std::chrono::milliseconds Interval() const { return m_interval; }
    std::chrono::milliseconds StaleAfter() const { return m_stale_after; }
    uint64_t RemovedCount() const { return m_removed_total.load(); }

private:
    void ScheduleTick();
    void OnTick(uint64_t generation, const boost::system::error_code& ec);

    EntityRegistry& m_registry;
    ObserverHub& m_hub;
    boost::asio::steady_timer m_timer;
    std::chrono::milliseconds m_interval;
    std::chrono::milliseconds m_stale_after;
    bool m_running;
    uint64_t m_generation;
    std::atomic<uint64_t> m_removed_total;
};
