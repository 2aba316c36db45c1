#include <gtest/gtest.h>
#include "vsync/events/event_bus.hpp"
#include "vsync/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace vsync::events;

namespace {

vsync::sync::DriftRow row_for(const std::string& file) {
    vsync::sync::DriftRow row;
    row.file = file;
    row.in_sync = true;
    return row;
}

} // namespace

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string seen_file;
    std::string seen_base;

    bus.subscribe<DriftCheckedEvent>([&](const DriftCheckedEvent& e) {
        seen_file = e.row.file;
        seen_base = e.baseline;
    });

    bus.emit(DriftCheckedEvent{row_for("VERSION"), "origin/main", "HEAD"});

    EXPECT_EQ(seen_file, "VERSION");
    EXPECT_EQ(seen_base, "origin/main");
}

TEST(EventBus, DeliversOnlyMatchingType) {
    EventBus bus;

    int resolved = 0;
    int manual = 0;

    bus.subscribe<ConflictResolvedEvent>([&](const ConflictResolvedEvent&) { resolved++; });
    bus.subscribe<ConflictManualEvent>([&](const ConflictManualEvent&) { manual++; });

    bus.emit(ConflictResolvedEvent{"VERSION", 3, "higher", "ours", "2.0.0"});
    bus.emit(ConflictManualEvent{"README.md", 10});
    bus.emit(ConflictResolvedEvent{"setup.py", 7, "higher", "theirs", "2.1.0"});

    EXPECT_EQ(resolved, 2);
    EXPECT_EQ(manual, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int late = 0;
    bus.subscribe<ConflictManualEvent>([&](const ConflictManualEvent&) {
        bus.subscribe<ConflictManualEvent>([&](const ConflictManualEvent&) { late++; });
    });

    bus.emit(ConflictManualEvent{"VERSION", 1});
    EXPECT_EQ(late, 0);
    EXPECT_EQ(bus.subscriber_count<ConflictManualEvent>(), 2u);

    bus.emit(ConflictManualEvent{"VERSION", 1});
    EXPECT_EQ(late, 1);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int after = 0;
    bus.subscribe<MalformedConflictEvent>([](const MalformedConflictEvent&) {
        throw std::runtime_error("handler failed");
    });
    bus.subscribe<MalformedConflictEvent>([&](const MalformedConflictEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(MalformedConflictEvent{"VERSION", 4, "never closed"}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(CheckCompletedEvent{}));
}

TEST(EventBus, ConcurrentEmitFromWorkers) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<DriftCheckedEvent>([&count](const DriftCheckedEvent&) {
        count++;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 32; ++i) {
        threads.emplace_back([&bus, i]() {
            bus.emit(DriftCheckedEvent{row_for("file" + std::to_string(i)), "base", "head"});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 32);
}

TEST(EventBus, CountsSubscribersPerType) {
    EventBus bus;

    bus.subscribe<DriftCheckedEvent>([](const DriftCheckedEvent&) {});
    bus.subscribe<DriftCheckedEvent>([](const DriftCheckedEvent&) {});
    bus.subscribe<EntryFailedEvent>([](const EntryFailedEvent&) {});

    EXPECT_EQ(bus.subscriber_count<DriftCheckedEvent>(), 2u);
    EXPECT_EQ(bus.subscriber_count<EntryFailedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<CheckCompletedEvent>(), 0u);
}
