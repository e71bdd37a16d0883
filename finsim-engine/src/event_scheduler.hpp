#ifndef FINSIM_EVENT_SCHEDULER_HPP
#define FINSIM_EVENT_SCHEDULER_HPP

#include "action.hpp"
#include "model.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace finsim {

enum class EventState : uint8_t {
    Unfired = 0,
    Fired = 1
};

std::string event_state_to_string(EventState state);

// An event with its trigger resolved to a calendar year
struct ScheduledEvent {
    std::string name;
    int year;
    std::vector<Action> actions;
    EventState state = EventState::Unfired;
};

// Per-trial table of year -> events. Each event moves Unfired -> Fired
// exactly once; firing a year twice applies nothing the second time.
class EventScheduler {
public:
    using Executor = std::function<void(const ScheduledEvent&, const Action&)>;

    EventScheduler(int start_year, int duration);

    // Resolves triggers against the start year and appends the events in
    // declaration order. Throws ConfigurationError for a trigger outside
    // [start_year, start_year + duration).
    void schedule(const std::vector<EventSpec>& events);

    // Runs `executor` on every action of each unfired event triggering in
    // `year`, in declaration order, and marks the events fired.
    // Returns the events fired by this call.
    std::vector<const ScheduledEvent*> fire(int year, const Executor& executor);

    const std::vector<ScheduledEvent>& events() const { return events_; }
    size_t pending_count() const;
    size_t fired_count() const;

private:
    int start_year_;
    int duration_;
    std::vector<ScheduledEvent> events_;
};

} // namespace finsim

#endif // FINSIM_EVENT_SCHEDULER_HPP
