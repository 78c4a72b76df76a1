#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "time_grid.hpp"

namespace sewerflow {

// Minimal helpers for the flat, one-object-per-line JSON used by monitor
// feeds, the diagnostic log and reports. Nested objects are not parsed.

std::string JsonEscape(std::string_view input);
std::string JsonUnescape(std::string_view input);

// Formats a finite number with enough digits to round-trip; non-finite
// values become null.
std::string JsonNumber(double value);

bool JsonExtractString(std::string_view json, std::string_view key, std::string &value);
bool JsonExtractNumber(std::string_view json, std::string_view key, double &value);
bool JsonExtractUint64(std::string_view json, std::string_view key, std::uint64_t &value);
bool JsonExtractBool(std::string_view json, std::string_view key, bool &value);
bool JsonExtractTimestamp(std::string_view json, std::string_view key, TimePoint &value);

}  // namespace sewerflow
