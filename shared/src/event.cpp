#include "event.hpp"

#include <sstream>
#include <string>
#include <utility>

#include "errors.hpp"
#include "json_text.hpp"

namespace sewerflow {
namespace {
void validate_interval(bool ongoing, TimePoint start, const std::optional<TimePoint> &end) {
    if (ongoing && end) {
        throw ValidationError("an ongoing event must not have an end time");
    }
    if (!ongoing && !end) {
        throw ValidationError("a closed event must have an end time");
    }
    if (end && *end < start) {
        throw ValidationError("event end time " + FormatUtcTimestamp(*end) + " precedes start time " +
                              FormatUtcTimestamp(start));
    }
}
}  // namespace

std::string_view EventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::kDischarging:
            return "Discharging";
        case EventKind::kOffline:
            return "Offline";
        case EventKind::kNotDischarging:
            return "Not Discharging";
    }
    return "Unknown";
}

bool ParseEventKind(std::string_view name, EventKind &kind) {
    if (name == "Discharging") {
        kind = EventKind::kDischarging;
    } else if (name == "Offline") {
        kind = EventKind::kOffline;
    } else if (name == "Not Discharging" || name == "NotDischarging") {
        kind = EventKind::kNotDischarging;
    } else {
        return false;
    }
    return true;
}

Event::Event(std::string monitor_id, EventKind kind, bool ongoing, TimePoint start, std::optional<TimePoint> end)
    : monitor_id_(std::move(monitor_id)), kind_(kind), ongoing_(ongoing), start_(start), end_(end) {
    validate_interval(ongoing_, start_, end_);
}

Event Event::Closed(std::string monitor_id, EventKind kind, TimePoint start, TimePoint end) {
    return Event(std::move(monitor_id), kind, false, start, end);
}

Event Event::Ongoing(std::string monitor_id, EventKind kind, TimePoint start) {
    return Event(std::move(monitor_id), kind, true, start);
}

Minutes Event::Duration(TimePoint now) const {
    if (!ongoing_) {
        return std::chrono::duration_cast<Minutes>(*end_ - start_);
    }
    if (now < start_) {
        return Minutes(0.0);
    }
    return std::chrono::duration_cast<Minutes>(now - start_);
}

void Event::Close(TimePoint at) {
    if (!ongoing_) {
        throw InvalidStateError("event for monitor " + monitor_id_ + " is already closed");
    }
    if (at < start_) {
        throw ValidationError("cannot close event for monitor " + monitor_id_ + " before its start time");
    }
    end_ = at;
    ongoing_ = false;
}

std::string SerializeEvent(const Event &event) {
    std::ostringstream oss;
    oss << '{';
    oss << "\"monitor\":\"" << JsonEscape(event.monitor_id()) << "\",";
    oss << "\"kind\":\"" << JsonEscape(EventKindName(event.kind())) << "\",";
    oss << "\"start\":\"" << FormatUtcTimestamp(event.start()) << "\",";
    if (event.end()) {
        oss << "\"end\":\"" << FormatUtcTimestamp(*event.end()) << "\",";
    }
    oss << "\"ongoing\":" << (event.ongoing() ? "true" : "false");
    oss << '}';
    return oss.str();
}

std::optional<Event> DeserializeEvent(std::string_view json) {
    std::string monitor_id;
    std::string kind_name;
    EventKind kind{};
    TimePoint start{};
    if (!JsonExtractString(json, "monitor", monitor_id) || !JsonExtractString(json, "kind", kind_name) ||
        !ParseEventKind(kind_name, kind) || !JsonExtractTimestamp(json, "start", start)) {
        return std::nullopt;
    }
    std::optional<TimePoint> end;
    TimePoint parsed_end{};
    if (JsonExtractTimestamp(json, "end", parsed_end)) {
        end = parsed_end;
    }
    bool ongoing = !end.has_value();
    JsonExtractBool(json, "ongoing", ongoing);
    return Event(std::move(monitor_id), kind, ongoing, start, end);
}

}  // namespace sewerflow
