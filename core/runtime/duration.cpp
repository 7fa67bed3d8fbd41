#include "duration.hpp"

#include <cctype>
#include <cstdint>
#include <limits>

namespace linkerd_await {
namespace runtime {

namespace {

constexpr int64_t kMillisPerSecond = 1000;
constexpr int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr int64_t kMillisPerDay = 24 * kMillisPerHour;

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Unit suffix -> milliseconds. The empty suffix is handled by the caller.
std::optional<int64_t> unit_multiplier(const std::string &unit) {
    if (unit == "ms") return 1;
    if (unit == "s") return kMillisPerSecond;
    if (unit == "m") return kMillisPerMinute;
    if (unit == "h") return kMillisPerHour;
    if (unit == "d") return kMillisPerDay;
    return std::nullopt;
}

}  // namespace

std::optional<std::chrono::milliseconds> parse_duration(const std::string &text) {
    const std::string s = trim(text);

    size_t digits = 0;
    while (digits < s.size() && is_digit(s[digits])) {
        ++digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }

    // Accumulate the magnitude with an explicit overflow check
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t magnitude = 0;
    for (size_t i = 0; i < digits; ++i) {
        const int64_t digit = s[i] - '0';
        if (magnitude > (kMax - digit) / 10) {
            return std::nullopt;
        }
        magnitude = magnitude * 10 + digit;
    }

    const std::string unit = s.substr(digits);
    if (unit.empty()) {
        // Unit-less zero means "no duration"; a bare positive number is ambiguous
        if (magnitude == 0) {
            return std::chrono::milliseconds(0);
        }
        return std::nullopt;
    }

    auto multiplier = unit_multiplier(unit);
    if (!multiplier) {
        return std::nullopt;
    }
    if (magnitude > kMax / *multiplier) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(magnitude * *multiplier);
}

std::string format_duration(std::chrono::milliseconds duration) {
    const int64_t ms = duration.count();
    if (ms == 0) {
        return "0s";
    }
    if (ms % kMillisPerDay == 0) return std::to_string(ms / kMillisPerDay) + "d";
    if (ms % kMillisPerHour == 0) return std::to_string(ms / kMillisPerHour) + "h";
    if (ms % kMillisPerMinute == 0) return std::to_string(ms / kMillisPerMinute) + "m";
    if (ms % kMillisPerSecond == 0) return std::to_string(ms / kMillisPerSecond) + "s";
    return std::to_string(ms) + "ms";
}

}  // namespace runtime
}  // namespace linkerd_await
