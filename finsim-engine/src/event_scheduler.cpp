#include "event_scheduler.hpp"
#include "errors.hpp"
#include <algorithm>

namespace finsim {

std::string event_state_to_string(EventState state) {
    switch (state) {
        case EventState::Unfired: return "unfired";
        case EventState::Fired: return "fired";
        default: return "unknown";
    }
}

EventScheduler::EventScheduler(int start_year, int duration)
    : start_year_(start_year), duration_(duration) {
    if (duration_ < 1) {
        throw ConfigurationError("Event scheduler needs a duration of at least 1 year");
    }
}

void EventScheduler::schedule(const std::vector<EventSpec>& events) {
    const int end_year = start_year_ + duration_;

    std::vector<ScheduledEvent> resolved;
    resolved.reserve(events.size());
    for (const auto& event : events) {
        int year = event.trigger.resolve(start_year_);
        if (year < start_year_ || year >= end_year) {
            throw ConfigurationError("Event '" + event.name + "' triggers in " +
                                     std::to_string(year) + ", outside [" +
                                     std::to_string(start_year_) + ", " +
                                     std::to_string(end_year) + ")");
        }
        resolved.push_back(ScheduledEvent{event.name, year, event.actions, EventState::Unfired});
    }

    // All or nothing
    events_.insert(events_.end(),
                   std::make_move_iterator(resolved.begin()),
                   std::make_move_iterator(resolved.end()));
}

std::vector<const ScheduledEvent*> EventScheduler::fire(int year, const Executor& executor) {
    std::vector<const ScheduledEvent*> fired;
    for (auto& event : events_) {
        if (event.year != year || event.state == EventState::Fired) {
            continue;
        }
        // Marked before executing so a throwing action never re-fires
        event.state = EventState::Fired;
        for (const auto& action : event.actions) {
            executor(event, action);
        }
        fired.push_back(&event);
    }
    return fired;
}

size_t EventScheduler::pending_count() const {
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
        [](const ScheduledEvent& e) { return e.state == EventState::Unfired; }));
}

size_t EventScheduler::fired_count() const {
    return events_.size() - pending_count();
}

} // namespace finsim
