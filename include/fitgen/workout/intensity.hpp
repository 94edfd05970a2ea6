#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fitgen::workout {

/**
 * @brief 步骤强度（workout_step.intensity 字段的取值）。
 */
enum class Intensity : std::uint8_t {
    rest = 0,
    warmup_cooldown = 1,
    active = 2,
};

/**
 * @brief 步骤类型标签 -> 强度 的查找表。
 *
 * 说明：
 * - 标签按精确、大小写敏感的方式匹配；
 * - 表中没有的标签一律视为 active（拿不准时按训练段处理）；
 * - 上游会不断出现新的标签，业务侧可在默认表基础上 add() 扩展。
 */
class IntensityTable final {
public:
    IntensityTable() = default;

    /**
     * @brief 默认词表：
     * - EEC / VAC -> warmup_cooldown
     * - Pausa -> rest
     * - Pasada / Rodaje / Tempo / Fartlek -> active
     */
    [[nodiscard]] static IntensityTable defaults();

    // 已存在的标签会被覆盖。
    void add(std::string label, Intensity intensity);

    [[nodiscard]] std::optional<Intensity> find(std::string_view label) const;
    [[nodiscard]] Intensity classify(std::string_view label) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::map<std::string, Intensity, std::less<>> entries_{};
};

/**
 * @brief 用默认词表分类（进程内共享的只读表）。
 */
[[nodiscard]] Intensity classify_intensity(std::string_view label);

} // namespace fitgen::workout
