#pragma once

#include <cstdint>

namespace fitgen::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 业务侧可通过 set_log_level 调整全局日志级别；
 * - 编码器只在 debug 级别记录降级处理（无法解析的时长、未知的步骤类型），
 *   内部失败记录为 error。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief 解析日志级别名称（"trace"/"debug"/"info"/"warn"/"error"/
 * "critical"/"off"，大小写敏感）。
 *
 * 无法识别时返回 false，out 保持不变。
 */
bool parse_log_level(const char *name, LogLevel &out) noexcept;

} // namespace fitgen::core
