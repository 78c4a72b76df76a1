#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sewerflow {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Minutes = std::chrono::duration<double, std::ratio<60>>;
using QuarterHours = std::chrono::duration<std::int64_t, std::ratio<900>>;

constexpr std::chrono::minutes kSampleStep{15};

// Floor/ceiling of an instant to the 15-minute UTC grid. Instants already on
// a grid line are returned unchanged.
TimePoint RoundDown15(TimePoint time);
TimePoint RoundUp15(TimePoint time);

// Fixed-step sequence of sample instants, first + i * 15 min.
class SampleGrid {
  public:
    SampleGrid() = default;
    SampleGrid(TimePoint first, std::size_t count);

    // Samples since, since + 15 min, ... strictly before until.
    static SampleGrid Covering(TimePoint since, TimePoint until);
    // Throws ValidationError unless instants are exactly 15 minutes apart.
    static SampleGrid FromInstants(const std::vector<TimePoint> &instants);

    std::size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    TimePoint first() const { return first_; }
    TimePoint last() const;
    TimePoint at(std::size_t index) const;
    std::vector<TimePoint> Instants() const;

    // Index of the first sample at or after time, clamped to [0, size()].
    // Used as the bound of half-open [from, to) sample ranges.
    std::size_t IndexAtOrAfter(TimePoint time) const;

  private:
    TimePoint first_{};
    std::size_t count_ = 0;
};

TimePoint MakeUtcTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
TimePoint StartOfUtcYear(TimePoint time);

std::string FormatUtcTimestamp(TimePoint time);
bool ParseUtcTimestamp(std::string_view text, TimePoint &time);

}  // namespace sewerflow
