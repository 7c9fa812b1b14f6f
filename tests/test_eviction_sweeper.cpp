#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "EntityRegistry.h"
#include "EvictionSweeper.h"
#include "ObserverHub.h"
#include "TestHelpers.h"

using namespace std::chrono_literals;

namespace {

EntityRecord RecordAt(const std::string& id, TimePoint at) {
    EntityRecord r;
    r.entity_id = id;
    r.last_updated = at;
    return r;
}

class EvictionSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        recorder = std::make_shared<EventRecorder>();
        hub.Subscribe(EventKind::REMOVED, recorder);
    }

    std::shared_ptr<EvictionSweeper> MakeSweeper(std::chrono::milliseconds interval) {
        return std::make_shared<EvictionSweeper>(io, registry, hub, interval, std::chrono::milliseconds(10min));
    }

    boost::asio::io_context io;
    EntityRegistry registry;
    ObserverHub hub;
    std::shared_ptr<EventRecorder> recorder;
};

} // namespace

TEST_F(EvictionSweeperTest, SweepOncePublishesOneRemovedEventPerId) {
    TimePoint t0 = Clock::now();
    registry.Upsert(RecordAt("sensor.old", t0));
    registry.Upsert(RecordAt("sensor.older", t0 - 1min));
    registry.Upsert(RecordAt("sensor.new", t0 + 5min));
    auto sweeper = MakeSweeper(30s);

    auto removed = sweeper->SweepOnce(t0 + 11min);

    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(recorder->Count(EventKind::REMOVED), 2u);
    EXPECT_EQ(sweeper->RemovedCount(), 2u);
    EXPECT_FALSE(registry.Contains("sensor.old"));
    EXPECT_FALSE(registry.Contains("sensor.older"));
    EXPECT_TRUE(registry.Contains("sensor.new"));

    EXPECT_TRUE(sweeper->SweepOnce(t0 + 11min).empty());
    EXPECT_EQ(recorder->Count(EventKind::REMOVED), 2u);
}

TEST_F(EvictionSweeperTest, TimerTickEvictsStaleEntities) {
    registry.Upsert(RecordAt("sensor.stale", Clock::now() - 11min));
    registry.Upsert(RecordAt("sensor.live", Clock::now()));
    auto sweeper = MakeSweeper(20ms);
    sweeper->Start();
    EXPECT_TRUE(sweeper->IsRunning());

    ASSERT_TRUE(RunUntil(io, [&] { return recorder->Count(EventKind::REMOVED) == 1; }));
    EXPECT_EQ(recorder->events[0].entity_id, "sensor.stale");
    EXPECT_TRUE(registry.Contains("sensor.live"));

    sweeper->Stop();
}

TEST_F(EvictionSweeperTest, StoppedSweeperDoesNotRun) {
    registry.Upsert(RecordAt("sensor.stale", Clock::now() - 11min));
    auto sweeper = MakeSweeper(10ms);
    sweeper->Start();
    sweeper->Stop();
    EXPECT_FALSE(sweeper->IsRunning());

    RunFor(io, 100ms);

    EXPECT_TRUE(registry.Contains("sensor.stale"));
    EXPECT_EQ(recorder->Count(EventKind::REMOVED), 0u);
}

TEST_F(EvictionSweeperTest, StopInterruptsAPendingWaitPromptly) {
    auto sweeper = MakeSweeper(std::chrono::milliseconds(1h));
    sweeper->Start();
    sweeper->Stop();

    auto begin = std::chrono::steady_clock::now();
    io.restart();
    io.run(); // returns once the cancelled wait completes
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
}
