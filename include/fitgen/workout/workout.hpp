#pragma once

#include <string>
#include <variant>
#include <vector>

namespace fitgen::workout {

/**
 * @brief 步骤时长：上游可能给字符串（"5min" / "2:30" / "90"），也可能直接给
 * 数值（按秒处理）。
 */
using DurationValue = std::variant<std::string, double>;

/**
 * @brief 单个训练步骤。
 *
 * type 为自由文本标签（交给 classify_intensity 解释），duration 交给
 * parse_duration 解释。步骤在 WorkoutSpec::steps 中的下标即其 message_index。
 */
struct StepSpec final {
    std::string type{};
    DurationValue duration{};
};

/**
 * @brief 一次训练的完整描述（由调用方持有，编码器只读）。
 *
 * name 在这一层不限制长度，写入时按字段宽度截断。
 */
struct WorkoutSpec final {
    std::string name{};
    std::vector<StepSpec> steps{};
};

} // namespace fitgen::workout
