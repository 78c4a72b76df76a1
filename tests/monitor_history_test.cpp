#include "monitor.hpp"

#include <iostream>
#include <string>
#include <vector>

#include "errors.hpp"

namespace {
int g_failures = 0;

void expect(bool condition, const std::string &what) {
    if (!condition) {
        std::cerr << "FAILED: " << what << "\n";
        ++g_failures;
    }
}

template <typename Error, typename Fn>
bool throws(Fn &&fn) {
    try {
        fn();
    } catch (const Error &) {
        return true;
    }
    return false;
}

sewerflow::Monitor make_monitor(const std::string &id) {
    return sewerflow::Monitor(id, "PERMIT-" + id, {451200.0, 207300.0}, "River Test", "Thames Water");
}

sewerflow::TimePoint at(int hour, int minute) { return sewerflow::MakeUtcTime(2024, 3, 1, hour, minute); }

bool all_equal(const std::vector<bool> &mask, std::size_t from, std::size_t to, bool value) {
    for (std::size_t i = from; i < to; ++i) {
        if (mask.at(i) != value) {
            return false;
        }
    }
    return true;
}
}  // namespace

int main() {
    using namespace sewerflow;
    using namespace std::chrono;

    // Four hours from 09:00, sixteen samples.
    const SampleGrid grid(at(9, 0), 16);

    {
        auto monitor = make_monitor("Chesham");
        expect(throws<InvalidStateError>([&] { monitor.history(); }), "history before load is a state error");
        expect(throws<InvalidStateError>([&] { monitor.Resample(grid); }), "resample before load is a state error");

        monitor.SetHistory({Event::Closed("Chesham", EventKind::kDischarging, at(9, 0), at(9, 47))});
        const auto masks = monitor.Resample(grid);
        expect(masks.has_value(), "a monitor with events resamples");
        expect(masks->active.size() == grid.size(), "masks cover the grid");
        expect(all_equal(masks->active, 0, 4, true), "09:00 to 09:45 are active");
        expect(all_equal(masks->active, 4, 16, false), "10:00 onwards is inactive");
        expect(all_equal(masks->online, 0, 16, true), "online from the first event");
        expect(all_equal(masks->recent, 0, 16, true), "recent for 48 hours after the rounded end");

        const auto again = monitor.Resample(grid);
        expect(again->active == masks->active && again->online == masks->online && again->recent == masks->recent,
               "resampling is repeatable");
        expect(throws<InvalidStateError>([&] { monitor.SetHistory({}); }), "history can only be set once");
    }

    {
        auto monitor = make_monitor("Empty");
        monitor.SetHistory({});
        expect(!monitor.Resample(grid).has_value(), "empty history has no masks");
        expect(monitor.TotalDischarge(at(12, 0)).count() == 0.0, "empty history has no discharge");
    }

    {
        // First event at 10:07: offline until 10:00, online from then.
        auto monitor = make_monitor("Late");
        monitor.SetHistory({Event::Closed("Late", EventKind::kNotDischarging, at(10, 7), at(11, 0))});
        const auto masks = monitor.Resample(grid);
        expect(all_equal(masks->online, 0, 4, false), "offline before the first event");
        expect(all_equal(masks->online, 4, 16, true), "online from the rounded first event");
        expect(all_equal(masks->active, 0, 16, false), "not discharging events never activate");
        expect(all_equal(masks->recent, 0, 16, false), "not discharging events are never recent");
    }

    {
        auto monitor = make_monitor("Mixed");
        monitor.SetHistory({
            Event::Closed("Mixed", EventKind::kNotDischarging, at(8, 0), at(10, 20)),
            Event::Closed("Mixed", EventKind::kOffline, at(10, 20), at(10, 50)),
            Event::Ongoing("Mixed", EventKind::kDischarging, at(12, 10)),
        });
        const auto masks = monitor.Resample(grid);
        expect(all_equal(masks->online, 0, 5, true), "online before the offline range");
        expect(all_equal(masks->online, 5, 8, false), "offline from 10:15 to 11:00");
        expect(all_equal(masks->online, 8, 16, true), "online again after the offline range");
        expect(all_equal(masks->active, 0, 12, false), "inactive before the ongoing discharge");
        expect(all_equal(masks->active, 12, 16, true), "ongoing discharge runs to the end of the grid");
        expect(all_equal(masks->recent, 12, 16, true), "ongoing discharge is recent");
        expect(monitor.TotalDischarge(at(13, 10)).count() == 60.0, "ongoing discharge measured to now");
    }

    {
        // Discharge starting before the window is clipped to it.
        auto monitor = make_monitor("Early");
        monitor.SetHistory({
            Event::Closed("Early", EventKind::kDischarging, MakeUtcTime(2024, 2, 28, 6, 0),
                          MakeUtcTime(2024, 2, 28, 7, 0)),
            Event::Closed("Early", EventKind::kDischarging, at(8, 0), at(9, 20)),
        });
        const auto masks = monitor.Resample(grid);
        expect(all_equal(masks->active, 0, 2, true), "straddling discharge active until 09:30");
        expect(all_equal(masks->active, 2, 16, false), "straddling discharge ends at 09:30");
        expect(all_equal(masks->recent, 0, 16, true), "recent tail continues after the straddling discharge");
    }

    {
        // Recent tail ends 48 hours after the rounded end.
        const SampleGrid long_grid(at(9, 0), 4 * 24 * 4);
        auto monitor = make_monitor("Tail");
        monitor.SetHistory({Event::Closed("Tail", EventKind::kDischarging, at(9, 0), at(9, 10))});
        const auto masks = monitor.Resample(long_grid);
        const std::size_t tail_end = long_grid.IndexAtOrAfter(at(9, 15) + hours(48));
        expect(tail_end == 193, "tail ends 48h15m after the grid start");
        expect(all_equal(masks->recent, 0, tail_end, true), "recent for 48 hours");
        expect(all_equal(masks->recent, tail_end, long_grid.size(), false), "no longer recent after 48 hours");
    }

    {
        auto monitor = make_monitor("Overlap");
        monitor.SetHistory({
            Event::Closed("Overlap", EventKind::kOffline, at(9, 0), at(10, 0)),
            Event::Closed("Overlap", EventKind::kDischarging, at(9, 30), at(9, 45)),
        });
        const auto independent = monitor.Resample(grid);
        expect(independent->active.at(2) && !independent->online.at(2), "offline and discharging coexist by default");

        EngineConfig config;
        config.overlap_policy = OverlapPolicy::kOfflineSuppressesActivity;
        const auto suppressed = monitor.Resample(grid, config);
        expect(!suppressed->active.at(2), "offline suppresses activity when configured");
        expect(suppressed->recent.at(2), "suppression leaves recent untouched");
    }

    {
        // Every sample between the rounded bounds of a discharge is active.
        for (int offset = 0; offset < 60; offset += 7) {
            auto monitor = make_monitor("Cover");
            const auto start = at(10, 0) + minutes(offset);
            const auto end = start + minutes(37);
            monitor.SetHistory({Event::Closed("Cover", EventKind::kDischarging, start, end)});
            const auto masks = monitor.Resample(grid);
            const std::size_t from = grid.IndexAtOrAfter(RoundDown15(start));
            const std::size_t to = grid.IndexAtOrAfter(RoundUp15(end));
            expect(all_equal(masks->active, from, to, true) && all_equal(masks->active, 0, from, false) &&
                       all_equal(masks->active, to, grid.size(), false),
                   "discharge at offset " + std::to_string(offset) + " covers its rounded range");
        }
    }

    {
        const auto jan1 = MakeUtcTime(2024, 1, 1);
        auto monitor = make_monitor("Totals");
        monitor.SetHistory({
            Event::Closed("Totals", EventKind::kDischarging, MakeUtcTime(2023, 12, 31, 23, 0), jan1 + hours(1)),
            Event::Closed("Totals", EventKind::kOffline, jan1 + hours(2), jan1 + hours(5)),
            Event::Closed("Totals", EventKind::kDischarging, jan1 + hours(24), jan1 + hours(24) + minutes(30)),
            Event::Ongoing("Totals", EventKind::kDischarging, jan1 + hours(48)),
        });
        const auto now = jan1 + hours(49);
        expect(monitor.TotalDischarge(now).count() == 210.0, "total discharge across all events");
        expect(monitor.TotalDischargeSinceStartOfYear(now).count() == 150.0, "discharge clipped to the year");
        expect(monitor.TotalDischarge(jan1 + hours(24) + minutes(10), now).count() == 80.0,
               "discharge clipped inside an event");
        expect(monitor.TotalDischarge(jan1 + hours(24) + minutes(30), now).count() == 60.0,
               "event ending at since contributes nothing");
        expect(monitor.TotalDischarge(jan1 + hours(48) + minutes(30), now).count() == 30.0,
               "ongoing event measured from since");
        expect(monitor.TotalDischargeLast12Months(now).count() == 210.0, "twelve months covers everything");

        double previous = monitor.TotalDischarge(now).count();
        for (int step = 0; step <= 50; ++step) {
            const double total = monitor.TotalDischarge(jan1 - hours(2) + hours(step), now).count();
            expect(total <= previous, "later since never adds discharge");
            previous = total;
        }
    }

    {
        auto monitor = make_monitor("Lookup");
        monitor.SetHistory({
            Event::Closed("Lookup", EventKind::kDischarging, at(9, 0), at(10, 0)),
            Event::Closed("Lookup", EventKind::kDischarging, at(9, 15), at(9, 45)),
            Event::Closed("Lookup", EventKind::kNotDischarging, at(10, 0), at(11, 0)),
            Event::Ongoing("Lookup", EventKind::kOffline, at(11, 0)),
        });
        expect(monitor.EventAt(at(8, 0)) == nullptr, "no event before the history");
        expect(monitor.EventAt(at(9, 10)) == &monitor.history()[0], "lookup inside the first event");
        expect(monitor.EventAt(at(9, 30)) == &monitor.history()[1], "later overlapping event wins");
        expect(monitor.EventAt(at(10, 0)) == nullptr, "boundaries are exclusive");
        expect(monitor.EventAt(at(10, 30)) == &monitor.history()[2], "lookup inside a quiet event");
        expect(monitor.EventAt(at(15, 0)) == &monitor.history()[3], "ongoing event extends forever");
    }

    {
        auto monitor = make_monitor("Checked");
        expect(throws<ValidationError>([&] {
                   monitor.SetHistory({Event::Closed("Other", EventKind::kDischarging, at(9, 0), at(9, 30))});
               }),
               "foreign events are rejected");
        expect(throws<ValidationError>([&] {
                   monitor.SetHistory({Event::Closed("Checked", EventKind::kDischarging, at(10, 0), at(10, 30)),
                                       Event::Closed("Checked", EventKind::kDischarging, at(9, 0), at(9, 30))});
               }),
               "unordered histories are rejected");
        expect(throws<ValidationError>([&] {
                   monitor.SetHistory({Event::Ongoing("Checked", EventKind::kDischarging, at(9, 0)),
                                       Event::Closed("Checked", EventKind::kDischarging, at(10, 0), at(10, 30))});
               }),
               "only the latest event may be ongoing");
        expect(!monitor.has_history(), "rejected histories leave the monitor unloaded");

        expect(throws<InvalidStateError>([&] { monitor.CurrentEvent(); }), "no current event yet");
        expect(!monitor.CurrentStatus(), "status unknown without a current event");
        expect(throws<ValidationError>([&] {
                   monitor.SetCurrentEvent(Event::Closed("Checked", EventKind::kOffline, at(9, 0), at(9, 5)));
               }),
               "closed current events are rejected");
        monitor.SetCurrentEvent(Event::Ongoing("Checked", EventKind::kOffline, at(9, 0)));
        expect(monitor.CurrentStatus() == EventKind::kOffline, "status follows the current event");
        monitor.CurrentEvent().Close(at(9, 20));
        expect(!monitor.CurrentEvent().ongoing(), "current event closes in place");
    }

    return g_failures == 0 ? 0 : 1;
}
