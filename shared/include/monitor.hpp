#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "event.hpp"
#include "geometry.hpp"
#include "time_grid.hpp"

namespace sewerflow {

// Per-sample state of one monitor over a SampleGrid.
struct ActivityMasks {
    std::vector<bool> online;
    std::vector<bool> active;
    std::vector<bool> recent;
};

class Monitor {
  public:
    Monitor(std::string id, std::string permit_number, Coordinate location, std::string receiving_watercourse,
            std::string network_name, std::optional<bool> discharged_in_last_48h = std::nullopt);

    const std::string &id() const { return id_; }
    const std::string &permit_number() const { return permit_number_; }
    Coordinate location() const { return location_; }
    const std::string &receiving_watercourse() const { return receiving_watercourse_; }
    const std::string &network_name() const { return network_name_; }

    // Unknown when the operator feed never reported the flag.
    std::optional<bool> discharged_in_last_48h() const { return discharged_in_last_48h_; }
    void set_discharged_in_last_48h(bool value) { discharged_in_last_48h_ = value; }

    bool has_current_event() const { return current_event_.has_value(); }
    // Throws InvalidStateError when no current event is set.
    const Event &CurrentEvent() const;
    Event &CurrentEvent();
    // Throws ValidationError unless the event is ongoing and belongs to this monitor.
    void SetCurrentEvent(Event event);
    std::optional<EventKind> CurrentStatus() const;

    bool has_history() const { return history_.has_value(); }
    // Throws InvalidStateError until SetHistory has been called.
    const std::vector<Event> &history() const;
    // Installs the chronological history once. Throws InvalidStateError on a
    // second call and ValidationError for foreign, unordered or interior
    // ongoing events.
    void SetHistory(std::vector<Event> events);

    Minutes TotalDischarge(TimePoint now) const;
    Minutes TotalDischarge(TimePoint since, TimePoint now) const;
    Minutes TotalDischargeLast6Months(TimePoint now) const;
    Minutes TotalDischargeLast12Months(TimePoint now) const;
    Minutes TotalDischargeSinceStartOfYear(TimePoint now) const;

    // Last event in history order whose interval contains time, or nullptr.
    const Event *EventAt(TimePoint time) const;

    // Resamples the history onto grid. Returns nullopt when the monitor has no
    // recorded events; callers treat that as all-false masks.
    std::optional<ActivityMasks> Resample(const SampleGrid &grid, const EngineConfig &config = {}) const;

  private:
    Minutes discharge_minutes(std::optional<TimePoint> since, TimePoint now) const;

    std::string id_;
    std::string permit_number_;
    Coordinate location_;
    std::string receiving_watercourse_;
    std::string network_name_;
    std::optional<bool> discharged_in_last_48h_;
    std::optional<Event> current_event_;
    std::optional<std::vector<Event>> history_;
};

}  // namespace sewerflow
