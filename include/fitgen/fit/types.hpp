#pragma once

#include "fitgen/core/common.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace fitgen::fit {

using byte = fitgen::core::byte;
using bytes_view = fitgen::core::bytes_view;

/**
 * @brief 字段基础类型（Base Type）编号。
 *
 * 只列出本库用到的几种；字节宽度由字段定义给出，不从类型推导。
 */
enum class BaseType : std::uint8_t {
  enum_ = 0x00,
  string = 0x07,
  uint16 = 0x84,
  uint32 = 0x86,
};

/**
 * @brief 全局消息号（Global Message Number）。
 */
enum class GlobalMessage : std::uint16_t {
  file_id = 0,
  workout = 26,
  workout_step = 27,
};

/**
 * @brief 本地消息类型（Local Message Type），一个文件内固定绑定：
 * - 0: file_id
 * - 1: workout
 * - 2: workout_step
 *
 * 定义记录与数据记录都从同一个 MessageLayout 取该值，因此不会出现
 * “数据记录引用了未定义的本地类型”。
 */
enum class LocalType : std::uint8_t {
  file_identity = 0,
  workout = 1,
  workout_step = 2,
};

// 记录头：bit6=1 为定义记录；低 4 位为本地消息类型。
inline constexpr byte kDefinitionHeaderFlag = 0x40;
inline constexpr byte kLocalTypeMask = 0x0F;
inline constexpr byte kArchitectureLittleEndian = 0x00;

// 文件头（14B）
inline constexpr std::size_t kFileHeaderSize = 14;
inline constexpr byte kProtocolVersion = 0x20;  // 2.0
inline constexpr std::uint16_t kProfileVersion = 2171;
inline constexpr std::array<byte, 4> kFileSignature = {'.', 'F', 'I', 'T'};
inline constexpr std::size_t kFileCrcSize = 2;

// FIT 时间起点：1989-12-31T00:00:00Z，相对 Unix 纪元的秒数。
inline constexpr std::uint32_t kFitEpochOffset = 631065600u;

// file_id 固定取值
inline constexpr std::uint8_t kFileTypeWorkout = 6;
inline constexpr std::uint16_t kManufacturerDevelopment = 0xFFFF;
inline constexpr std::uint16_t kProductId = 0;
inline constexpr std::uint32_t kSerialNumber = 0x78563412u;  // 线上字节 12 34 56 78

// workout / workout_step 固定取值
inline constexpr std::uint8_t kSportRunning = 1;
inline constexpr std::uint8_t kDurationTypeTime = 0;
inline constexpr std::uint8_t kTargetTypeOpen = 0;

// 字符串字段宽度（含结尾 '\0'）
inline constexpr std::size_t kNameFieldSize = 16;

inline constexpr const char *kFileExtension = ".fit";

[[nodiscard]] constexpr byte definition_header(LocalType local) noexcept {
  return static_cast<byte>(kDefinitionHeaderFlag |
                           (static_cast<byte>(local) & kLocalTypeMask));
}

[[nodiscard]] constexpr byte data_header(LocalType local) noexcept {
  return static_cast<byte>(static_cast<byte>(local) & kLocalTypeMask);
}

}  // namespace fitgen::fit
