#pragma once

#include "fitgen/fit/record.hpp"
#include "fitgen/fit/types.hpp"
#include "fitgen/workout/workout.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fitgen::fit {

using FileHeaderBytes = std::array<byte, kFileHeaderSize>;

/**
 * @brief 编码 FIT 文件头（14B）。
 *
 * 编码布局：
 * - Byte0: 头长度（14）
 * - Byte1: 协议版本（0x20）
 * - Byte2..3: Profile 版本（小端）
 * - Byte4..7: 记录区长度 data_size（小端，不含文件头与末尾 CRC）
 * - Byte8..11: ".FIT"
 * - Byte12..13: 对 Byte0..11 计算的 CRC（小端）
 */
[[nodiscard]] FileHeaderBytes encode_file_header(std::uint32_t data_size) noexcept;

/**
 * @brief 编码选项。
 *
 * time_created 为空时取当前系统时间；测试或需要可复现输出时可固定该值。
 */
struct EncodeOptions final {
    std::optional<std::uint32_t> time_created{};
};

/**
 * @brief 预计算整文件编码后的字节数（文件头 + 记录区 + 末尾 CRC）。
 *
 * 步骤数超过 65535 时返回 errc::too_many_steps。
 */
std::error_code encoded_size(const workout::WorkoutSpec &spec,
                             std::size_t &out_size) noexcept;

/**
 * @brief 把一次训练编码为完整的 FIT workout 文件。
 *
 * 记录顺序：file_id -> workout -> 每个步骤一对 workout_step 记录。
 * 末尾 2 字节为对“文件头 + 记录区”计算的 CRC（小端）。
 *
 * 成功时 out 被替换为完整文件；失败时 out 被清空，不会返回部分写入的数据。
 * 时长/步骤类型无法识别不算失败（按默认值处理）。
 */
std::error_code encode_workout_file(const workout::WorkoutSpec &spec,
                                    std::vector<byte> &out,
                                    const EncodeOptions &options = {}) noexcept;

/**
 * @brief 作为附件下发时的文件名："<name>.fit"。
 */
[[nodiscard]] std::string download_name(std::string_view workout_name);

} // namespace fitgen::fit
