#include "monitor.hpp"

#include <algorithm>
#include <utility>

#include "errors.hpp"

namespace sewerflow {
namespace {
void fill_range(std::vector<bool> &mask, std::size_t from, std::size_t to, bool value) {
    if (from >= to) {
        return;
    }
    std::fill(mask.begin() + static_cast<std::ptrdiff_t>(from), mask.begin() + static_cast<std::ptrdiff_t>(to),
              value);
}
}  // namespace

Monitor::Monitor(std::string id, std::string permit_number, Coordinate location, std::string receiving_watercourse,
                 std::string network_name, std::optional<bool> discharged_in_last_48h)
    : id_(std::move(id)),
      permit_number_(std::move(permit_number)),
      location_(location),
      receiving_watercourse_(std::move(receiving_watercourse)),
      network_name_(std::move(network_name)),
      discharged_in_last_48h_(discharged_in_last_48h) {}

const Event &Monitor::CurrentEvent() const {
    if (!current_event_) {
        throw InvalidStateError("current event is not set for monitor " + id_);
    }
    return *current_event_;
}

Event &Monitor::CurrentEvent() {
    if (!current_event_) {
        throw InvalidStateError("current event is not set for monitor " + id_);
    }
    return *current_event_;
}

void Monitor::SetCurrentEvent(Event event) {
    if (!event.ongoing()) {
        throw ValidationError("current event of monitor " + id_ + " must be ongoing");
    }
    if (event.monitor_id() != id_) {
        throw ValidationError("event for monitor " + event.monitor_id() + " cannot be current for " + id_);
    }
    current_event_ = std::move(event);
}

std::optional<EventKind> Monitor::CurrentStatus() const {
    if (!current_event_) {
        return std::nullopt;
    }
    return current_event_->kind();
}

const std::vector<Event> &Monitor::history() const {
    if (!history_) {
        throw InvalidStateError("history is not yet loaded for monitor " + id_);
    }
    return *history_;
}

void Monitor::SetHistory(std::vector<Event> events) {
    if (history_) {
        throw InvalidStateError("history is already loaded for monitor " + id_);
    }
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto &event = events[i];
        if (event.monitor_id() != id_) {
            throw ValidationError("history of monitor " + id_ + " contains an event of " + event.monitor_id());
        }
        if (i > 0 && event.start() < events[i - 1].start()) {
            throw ValidationError("history of monitor " + id_ + " is not in chronological order");
        }
        if (event.ongoing() && i + 1 != events.size()) {
            throw ValidationError("only the latest event of monitor " + id_ + " may be ongoing");
        }
    }
    history_ = std::move(events);
}

Minutes Monitor::discharge_minutes(std::optional<TimePoint> since, TimePoint now) const {
    Minutes total{0.0};
    for (const auto &event : history()) {
        if (event.kind() != EventKind::kDischarging) {
            continue;
        }
        const TimePoint end = event.ongoing() ? now : *event.end();
        const TimePoint start = since ? std::max(event.start(), *since) : event.start();
        if (end > start) {
            total += std::chrono::duration_cast<Minutes>(end - start);
        }
    }
    return total;
}

Minutes Monitor::TotalDischarge(TimePoint now) const { return discharge_minutes(std::nullopt, now); }

Minutes Monitor::TotalDischarge(TimePoint since, TimePoint now) const { return discharge_minutes(since, now); }

Minutes Monitor::TotalDischargeLast6Months(TimePoint now) const {
    return TotalDischarge(now - std::chrono::hours(24 * 183), now);
}

Minutes Monitor::TotalDischargeLast12Months(TimePoint now) const {
    return TotalDischarge(now - std::chrono::hours(24 * 365), now);
}

Minutes Monitor::TotalDischargeSinceStartOfYear(TimePoint now) const {
    return TotalDischarge(StartOfUtcYear(now), now);
}

const Event *Monitor::EventAt(TimePoint time) const {
    const Event *out = nullptr;
    for (const auto &event : history()) {
        if (event.ongoing()) {
            if (time > event.start()) {
                out = &event;
            }
        } else if (event.start() < time && time < *event.end()) {
            out = &event;
        }
    }
    return out;
}

std::optional<ActivityMasks> Monitor::Resample(const SampleGrid &grid, const EngineConfig &config) const {
    const auto &events = history();
    if (events.empty()) {
        return std::nullopt;
    }

    const std::size_t count = grid.size();
    ActivityMasks masks;
    masks.online.assign(count, false);
    masks.active.assign(count, false);
    masks.recent.assign(count, false);
    if (count == 0) {
        return masks;
    }

    // Monitors are counted offline until their first observed event.
    const TimePoint online_since = RoundDown15(events.front().start());
    fill_range(masks.online, grid.IndexAtOrAfter(online_since), count, true);

    std::vector<bool> offline_cover;
    const bool suppress = config.overlap_policy == OverlapPolicy::kOfflineSuppressesActivity;
    if (suppress) {
        offline_cover.assign(count, false);
    }

    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        const Event &event = *it;
        if (event.kind() == EventKind::kNotDischarging) {
            continue;
        }
        const std::size_t from = grid.IndexAtOrAfter(RoundDown15(event.start()));
        std::size_t to = count;
        std::size_t recent_to = count;
        if (!event.ongoing()) {
            const TimePoint end_round = RoundUp15(*event.end());
            to = grid.IndexAtOrAfter(end_round);
            recent_to = grid.IndexAtOrAfter(end_round + config.recent_window);
        }

        if (event.kind() == EventKind::kOffline) {
            fill_range(masks.online, from, to, false);
            if (suppress) {
                fill_range(offline_cover, from, to, true);
            }
        } else {
            fill_range(masks.active, from, to, true);
            fill_range(masks.recent, from, recent_to, true);
        }
    }

    if (suppress) {
        for (std::size_t i = 0; i < count; ++i) {
            if (offline_cover[i]) {
                masks.active[i] = false;
            }
        }
    }
    return masks;
}

}  // namespace sewerflow
