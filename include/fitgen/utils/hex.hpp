#pragma once

#include "fitgen/core/common.hpp"
#include "fitgen/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fitgen::utils {

/**
 * @brief 16 进制工具：用于排查生成的 FIT 字节、在测试里书写参考向量。
 */

struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分打印截断提示。
    std::size_t max_bytes{0};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（不可打印字符显示为 '.'）。
    bool show_ascii{true};
};

/**
 * @brief 紧凑格式："0e 20 7b 08"（小写，单空格分隔，无换行）。
 */
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

/**
 * @brief 多行 hexdump。
 */
[[nodiscard]] std::string hex_dump(core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 空白与常见分隔符（, : - _）会被忽略，允许 0x 前缀；
 * 非法字符或奇数个 nibble 返回 core::errc::invalid_argument，out 被清空。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept;

} // namespace fitgen::utils
