#pragma once

#include "fitgen/workout/workout.hpp"

#include <cstdint>
#include <string_view>

namespace fitgen::workout {

// 无法解析时使用的默认时长（1 分钟）。
inline constexpr std::uint32_t kDefaultDurationSeconds = 60;

// 时长以毫秒写入 4 字节字段，因此秒数上限为 UINT32_MAX / 1000。
inline constexpr std::uint32_t kMaxDurationSeconds = 0xFFFFFFFFu / 1000u;

/**
 * @brief 将人工输入的时长字符串归一化为整秒数。
 *
 * 按顺序识别：
 * 1. 含 "min"：去掉后缀，按浮点分钟数解析，乘 60 后向零截断；
 * 2. 含 ':'：`分:秒`，两段均为整数，秒可省略；
 * 3. 其余：按浮点秒数解析并向零截断。
 *
 * 不会失败：任何无法解析、为负或超出字段范围的输入都返回
 * kDefaultDurationSeconds。
 */
[[nodiscard]] std::uint32_t parse_duration(std::string_view text) noexcept;

/**
 * @brief 数值时长按秒处理（向零截断），范围规则与字符串形式一致。
 */
[[nodiscard]] std::uint32_t parse_duration(double seconds) noexcept;

/**
 * @brief 按 DurationValue 的实际类型分派到上面两个重载。
 */
[[nodiscard]] std::uint32_t
parse_duration_value(const DurationValue &value) noexcept;

} // namespace fitgen::workout
