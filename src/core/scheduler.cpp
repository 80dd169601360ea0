#include "scheduler.h"

#include <algorithm>

#include "common/asserts.h"
#include "common/log.h"

LOG_CHANNEL(Scheduler);

void Scheduler::Reset() {
    events.clear();
    cycle = 0;
    next_sequence = 0;
}

void Scheduler::Schedule(Event event, u64 delay, EventCallback&& callback) {
    ScheduleAt(event, cycle + delay, std::move(callback));
}

void Scheduler::ScheduleAt(Event event, u64 trigger_cycle, EventCallback&& callback) {
    Assert(callback != nullptr);

    Remove(event);

    PendingEvent pending {event, trigger_cycle, next_sequence++, std::move(callback)};

    // insert after every event with the same or an earlier trigger cycle
    auto position = std::upper_bound(events.begin(), events.end(), trigger_cycle,
                                     [](u64 trigger, const PendingEvent& e) { return trigger < e.trigger_cycle; });
    events.insert(position, std::move(pending));
}

void Scheduler::Remove(Event event) {
    auto it = std::find_if(events.begin(), events.end(), [&](const PendingEvent& e) { return e.event == event; });
    if (it != events.end()) events.erase(it);
}

bool Scheduler::IsScheduled(Event event) const {
    return GetTriggerCycle(event).has_value();
}

std::optional<u64> Scheduler::GetTriggerCycle(Event event) const {
    for (const auto& pending : events) {
        if (pending.event == event) return pending.trigger_cycle;
    }
    return std::nullopt;
}

void Scheduler::AddCycles(u64 cycles) {
    const u64 target_cycle = cycle + cycles;

    FireEventsUntil(target_cycle);

    cycle = target_cycle;
}

void Scheduler::FireEventsUntil(u64 target_cycle) {
    while (!events.empty() && events.front().trigger_cycle <= target_cycle) {
        // the event is removed before its handler runs, handlers may reschedule it
        PendingEvent pending = std::move(events.front());
        events.erase(events.begin());

        // events scheduled in the past fire at the current cycle
        cycle = std::max(cycle, pending.trigger_cycle);

        pending.callback(pending.event);
    }
}

u64 Scheduler::CyclesUntilNextEvent() const {
    if (events.empty()) return MaxCycles;

    const u64 trigger = events.front().trigger_cycle;
    return trigger > cycle ? trigger - cycle : 0;
}
