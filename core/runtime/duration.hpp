#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace linkerd_await {
namespace runtime {

// Parses a human-readable duration such as "500ms", "1s", "10m", "2h" or "3d".
//
// Grammar: optional surrounding whitespace, an unsigned decimal magnitude, and
// a unit suffix from {ms, s, m, h, d}. A bare "0" is accepted as zero; any
// other unit-less magnitude is rejected. Returns std::nullopt (invalid
// duration) for malformed input or when magnitude * unit does not fit.
std::optional<std::chrono::milliseconds> parse_duration(const std::string &text);

// Renders a duration in the largest unit that divides it exactly ("30s",
// "1500ms", "2h"). parse_duration(format_duration(d)) == d.
std::string format_duration(std::chrono::milliseconds duration);

}  // namespace runtime
}  // namespace linkerd_await
