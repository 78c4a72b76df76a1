#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "time_grid.hpp"

namespace sewerflow {

enum class EventKind {
    kDischarging,
    kOffline,
    kNotDischarging,
};

std::string_view EventKindName(EventKind kind);
bool ParseEventKind(std::string_view name, EventKind &kind);

// One activity interval of one monitor. The monitor is referenced by id only.
// An event is either closed (end set) or ongoing (no end); an ongoing event
// can be closed exactly once and is otherwise immutable.
class Event {
  public:
    // Throws ValidationError if ongoing with an end, closed without one, or
    // ending before it starts.
    Event(std::string monitor_id, EventKind kind, bool ongoing, TimePoint start,
          std::optional<TimePoint> end = std::nullopt);

    static Event Closed(std::string monitor_id, EventKind kind, TimePoint start, TimePoint end);
    static Event Ongoing(std::string monitor_id, EventKind kind, TimePoint start);

    const std::string &monitor_id() const { return monitor_id_; }
    EventKind kind() const { return kind_; }
    bool ongoing() const { return ongoing_; }
    TimePoint start() const { return start_; }
    const std::optional<TimePoint> &end() const { return end_; }

    // Closed: end - start. Ongoing: now - start, never negative.
    Minutes Duration(TimePoint now) const;

    // Throws InvalidStateError if already closed, ValidationError if at
    // precedes the start. Nothing is modified on failure.
    void Close(TimePoint at);

  private:
    std::string monitor_id_;
    EventKind kind_;
    bool ongoing_;
    TimePoint start_;
    std::optional<TimePoint> end_;
};

std::string SerializeEvent(const Event &event);
// Returns nullopt when required fields are missing or unparsable. Interval
// violations still throw ValidationError.
std::optional<Event> DeserializeEvent(std::string_view json);

}  // namespace sewerflow
