#include "discharge_log.hpp"

#include <algorithm>

#include "errors.hpp"

namespace sewerflow {

std::vector<DischargeLogRow> BuildDischargeLog(const MonitorNetwork &network, TimePoint now) {
    if (!network.history_refreshed_at()) {
        throw InvalidStateError("histories of network " + network.name() +
                                " are not loaded; call LoadAllHistories first");
    }
    std::vector<DischargeLogRow> rows;
    for (const auto &entry : network.monitors()) {
        const Monitor &monitor = entry.second;
        for (const auto &event : monitor.history()) {
            if (event.kind() != EventKind::kDischarging) {
                continue;
            }
            DischargeLogRow row;
            row.monitor_id = monitor.id();
            row.permit_number = monitor.permit_number();
            row.location = monitor.location();
            row.receiving_watercourse = monitor.receiving_watercourse();
            row.start = event.start();
            row.end = event.end();
            row.duration = event.Duration(now);
            row.ongoing = event.ongoing();
            rows.push_back(std::move(row));
        }
    }
    std::stable_sort(rows.begin(), rows.end(),
                     [](const DischargeLogRow &lhs, const DischargeLogRow &rhs) { return lhs.start > rhs.start; });
    return rows;
}

}  // namespace sewerflow
