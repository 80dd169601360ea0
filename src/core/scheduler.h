#pragma once

#include <functional>
#include <limits>
#include <optional>
#include <vector>

#include "util/types.h"

constexpr u64 MaxCycles = std::numeric_limits<u64>::max();

// Identity of a pending event. At most one event of each identity can be pending.
struct Event {
    enum class Type : u32 {
        TimerOverflow,
    };

    Type type;
    Processor processor;
    u32 index;

    static constexpr Event TimerOverflow(Processor processor, u32 timer_index) {
        return {Type::TimerOverflow, processor, timer_index};
    }

    bool operator==(const Event& other) const = default;
};

using EventCallback = std::function<void(Event)>;

class Scheduler {
public:
    void Reset();

    // Schedules the event delay cycles from now, replacing a pending event with the same identity
    void Schedule(Event event, u64 delay, EventCallback&& callback);
    void ScheduleAt(Event event, u64 trigger_cycle, EventCallback&& callback);
    // no-op if the event is not pending
    void Remove(Event event);

    bool IsScheduled(Event event) const;
    std::optional<u64> GetTriggerCycle(Event event) const;
    u32 PendingEventCount() const { return static_cast<u32>(events.size()); }

    // Advances the global cycle counter, firing every event that becomes due on the way.
    // Each event is fired with the counter set to its own trigger cycle.
    void AddCycles(u64 cycles);

    u64 CyclesUntilNextEvent() const;
    u64 GetCycle() const { return cycle; }

private:
    struct PendingEvent {
        Event event;
        u64 trigger_cycle;
        u64 sequence;
        EventCallback callback;
    };

    void FireEventsUntil(u64 target_cycle);

    // sorted by trigger cycle, then by insertion order
    std::vector<PendingEvent> events;

    u64 cycle = 0;
    u64 next_sequence = 0;
};
