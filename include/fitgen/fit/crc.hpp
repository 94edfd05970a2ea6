#pragma once

#include "fitgen/core/common.hpp"

#include <array>
#include <cstdint>

namespace fitgen::fit {

/**
 * @brief FIT 文件的 16 位校验（按 nibble 查表）。
 *
 * 注意：这不是通用的 CRC-16 变体，表项与 nibble 顺序必须与设备端完全一致，
 * 否则生成的文件会被拒收。
 *
 * 每个字节更新两次：先低 4 位，再高 4 位；每次更新：
 * - tmp = table[crc & 0xF]
 * - crc = (crc >> 4) & 0x0FFF
 * - crc = crc ^ tmp ^ table[nibble]
 */
inline constexpr std::array<std::uint16_t, 16> kCrcTable = {
    0x0000, 0xCC01, 0xD801, 0x1400, 0xF001, 0x3C00, 0x2800, 0xE401,
    0xA001, 0x6C00, 0x7800, 0xB401, 0x5000, 0x9C01, 0x8801, 0x4400,
};

/**
 * @brief 在已有校验值上追加一个字节（增量计算）。
 */
[[nodiscard]] std::uint16_t crc16_update(std::uint16_t crc,
                                         core::byte b) noexcept;

/**
 * @brief 计算一段字节的校验值（初值为 0；空输入返回 0）。
 */
[[nodiscard]] std::uint16_t crc16(core::bytes_view bytes) noexcept;

} // namespace fitgen::fit
