#include "time_grid.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include "errors.hpp"

namespace sewerflow {
namespace {
std::tm to_utc_tm(TimePoint time) {
    auto time_t_value = Clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm);
#endif
    return tm;
}

bool from_utc_tm(std::tm &tm, TimePoint &time) {
#ifdef _WIN32
    std::time_t time_value = _mkgmtime(&tm);
#else
    std::time_t time_value = timegm(&tm);
#endif
    if (time_value == static_cast<std::time_t>(-1)) {
        return false;
    }
    time = Clock::from_time_t(time_value);
    return true;
}
}  // namespace

TimePoint RoundDown15(TimePoint time) {
    return std::chrono::time_point_cast<Clock::duration>(std::chrono::floor<QuarterHours>(time));
}

TimePoint RoundUp15(TimePoint time) {
    return std::chrono::time_point_cast<Clock::duration>(std::chrono::ceil<QuarterHours>(time));
}

SampleGrid::SampleGrid(TimePoint first, std::size_t count) : first_(first), count_(count) {}

SampleGrid SampleGrid::Covering(TimePoint since, TimePoint until) {
    if (until <= since) {
        return SampleGrid(since, 0);
    }
    const Clock::duration step = kSampleStep;
    const auto span = (until - since).count();
    const auto count = (span + step.count() - 1) / step.count();
    return SampleGrid(since, static_cast<std::size_t>(count));
}

SampleGrid SampleGrid::FromInstants(const std::vector<TimePoint> &instants) {
    if (instants.empty()) {
        return SampleGrid();
    }
    for (std::size_t i = 1; i < instants.size(); ++i) {
        if (instants[i] - instants[i - 1] != kSampleStep) {
            throw ValidationError("sample instants must be spaced exactly 15 minutes apart (index " +
                                  std::to_string(i) + ")");
        }
    }
    return SampleGrid(instants.front(), instants.size());
}

TimePoint SampleGrid::last() const {
    if (count_ == 0) {
        throw InvalidStateError("sample grid is empty");
    }
    return at(count_ - 1);
}

TimePoint SampleGrid::at(std::size_t index) const {
    return first_ + kSampleStep * static_cast<std::int64_t>(index);
}

std::vector<TimePoint> SampleGrid::Instants() const {
    std::vector<TimePoint> out;
    out.reserve(count_);
    for (std::size_t i = 0; i < count_; ++i) {
        out.push_back(at(i));
    }
    return out;
}

std::size_t SampleGrid::IndexAtOrAfter(TimePoint time) const {
    if (time <= first_) {
        return 0;
    }
    const Clock::duration step = kSampleStep;
    const auto offset = (time - first_).count();
    const auto index = static_cast<std::size_t>((offset + step.count() - 1) / step.count());
    return index < count_ ? index : count_;
}

TimePoint MakeUtcTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    TimePoint time{};
    if (!from_utc_tm(tm, time)) {
        throw ValidationError("unrepresentable calendar time");
    }
    return time;
}

TimePoint StartOfUtcYear(TimePoint time) {
    std::tm tm = to_utc_tm(time);
    return MakeUtcTime(tm.tm_year + 1900, 1, 1);
}

std::string FormatUtcTimestamp(TimePoint time) {
    using namespace std::chrono;
    std::tm tm = to_utc_tm(time);
    auto fractional = duration_cast<microseconds>(time.time_since_epoch()).count() % 1000000;
    if (fractional < 0) {
        fractional += 1000000;
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(6) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

bool ParseUtcTimestamp(std::string_view text, TimePoint &time) {
    if (text.size() < 19) {
        return false;
    }
    std::string ts(text);
    std::tm parsed{};
    std::istringstream ss(ts.substr(0, 19));
    ss >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return false;
    }
    TimePoint parsed_time{};
    if (!from_utc_tm(parsed, parsed_time)) {
        return false;
    }
    if (ts.size() > 19 && ts[19] == '.') {
        auto frac = ts.substr(20);
        if (!frac.empty() && frac.back() == 'Z') {
            frac.pop_back();
        }
        while (frac.size() < 6) {
            frac.push_back('0');
        }
        try {
            parsed_time += std::chrono::microseconds(std::stoll(frac.substr(0, 6)));
        } catch (const std::exception &) {
            return false;
        }
    }
    time = parsed_time;
    return true;
}

}  // namespace sewerflow
