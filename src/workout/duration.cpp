#include "fitgen/workout/duration.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <new>
#include <optional>
#include <string>
#include <system_error>

namespace fitgen::workout {
namespace {

constexpr std::string_view kMinutesSuffix = "min";

[[nodiscard]] bool is_space_(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
}

[[nodiscard]] std::string_view trim_(std::string_view text) noexcept {
    while (!text.empty() && is_space_(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space_(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

// from_chars 不接受前导 '+'，这里手工去掉一个。
[[nodiscard]] std::string_view strip_plus_(std::string_view text) noexcept {
    if (text.size() > 1 && text.front() == '+') {
        text.remove_prefix(1);
    }
    return text;
}

[[nodiscard]] std::optional<double>
parse_double_(std::string_view text) noexcept {
    text = strip_plus_(trim_(text));
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value, std::chars_format::general);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<std::int64_t>
parse_int_(std::string_view text) noexcept {
    text = strip_plus_(trim_(text));
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// 秒数必须非负，且乘 1000 后仍能写入 4 字节毫秒字段。
[[nodiscard]] std::optional<std::uint32_t>
checked_seconds_(double seconds) noexcept {
    if (!std::isfinite(seconds)) {
        return std::nullopt;
    }
    const double truncated = std::trunc(seconds);
    if (truncated < 0.0 ||
        truncated > static_cast<double>(kMaxDurationSeconds)) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(truncated);
}

[[nodiscard]] std::optional<std::uint32_t>
parse_minutes_(std::string_view text) noexcept {
    // 去掉所有 "min" 子串后按浮点分钟解析（"5min" / "2.5 min"）。
    std::string rest;
    try {
        rest.reserve(text.size());
        std::size_t pos = 0;
        while (pos < text.size()) {
            if (text.compare(pos, kMinutesSuffix.size(), kMinutesSuffix) == 0) {
                pos += kMinutesSuffix.size();
                continue;
            }
            rest.push_back(text[pos++]);
        }
    } catch (const std::bad_alloc &) {
        return std::nullopt;
    }
    const auto minutes = parse_double_(rest);
    if (!minutes.has_value()) {
        return std::nullopt;
    }
    return checked_seconds_(*minutes * 60.0);
}

[[nodiscard]] std::optional<std::uint32_t>
parse_clock_(std::string_view text) noexcept {
    // "m:s"：只取前两段，第三段及之后忽略。
    const auto colon = text.find(':');
    const auto minutes = parse_int_(text.substr(0, colon));
    if (!minutes.has_value()) {
        return std::nullopt;
    }

    std::int64_t seconds = 0;
    auto rest = text.substr(colon + 1);
    const auto next = rest.find(':');
    const auto sec = parse_int_(rest.substr(0, next));
    if (!sec.has_value()) {
        return std::nullopt;
    }
    seconds = *sec;

    // 分钟数受限于字段范围，先检查再乘，避免溢出。
    constexpr auto kLimit = static_cast<std::int64_t>(kMaxDurationSeconds);
    if (*minutes < -kLimit || *minutes > kLimit || seconds < -kLimit ||
        seconds > kLimit) {
        return std::nullopt;
    }
    const auto total = *minutes * 60 + seconds;
    if (total < 0 || total > kLimit) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(total);
}

[[nodiscard]] std::optional<std::uint32_t>
parse_seconds_(std::string_view text) noexcept {
    const auto seconds = parse_double_(text);
    if (!seconds.has_value()) {
        return std::nullopt;
    }
    return checked_seconds_(*seconds);
}

[[nodiscard]] std::uint32_t fallback_(std::string_view text) noexcept {
    spdlog::debug("fitgen: unparsable duration '{}', using {}s", text,
                  kDefaultDurationSeconds);
    return kDefaultDurationSeconds;
}

} // namespace

std::uint32_t parse_duration(std::string_view text) noexcept {
    std::optional<std::uint32_t> seconds;
    if (text.find(kMinutesSuffix) != std::string_view::npos) {
        seconds = parse_minutes_(text);
    } else if (text.find(':') != std::string_view::npos) {
        seconds = parse_clock_(text);
    } else {
        seconds = parse_seconds_(text);
    }
    if (!seconds.has_value()) {
        return fallback_(text);
    }
    return *seconds;
}

std::uint32_t parse_duration(double seconds) noexcept {
    const auto checked = checked_seconds_(seconds);
    if (!checked.has_value()) {
        spdlog::debug("fitgen: duration {} out of range, using {}s", seconds,
                      kDefaultDurationSeconds);
        return kDefaultDurationSeconds;
    }
    return *checked;
}

std::uint32_t parse_duration_value(const DurationValue &value) noexcept {
    if (const auto *text = std::get_if<std::string>(&value)) {
        return parse_duration(std::string_view{*text});
    }
    if (const auto *seconds = std::get_if<double>(&value)) {
        return parse_duration(*seconds);
    }
    return kDefaultDurationSeconds;
}

} // namespace fitgen::workout
