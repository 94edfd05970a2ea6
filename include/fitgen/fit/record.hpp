#pragma once

#include "fitgen/fit/types.hpp"
#include "fitgen/workout/workout.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace fitgen::fit {

enum class errc : int {
  ok = 0,
  field_mismatch = 1,
  value_out_of_range = 2,
  too_many_fields = 3,
  too_many_steps = 4,
  file_too_large = 5,
};

const std::error_category &error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 定义记录中的一个字段描述：字段号 + 字节宽度 + 基础类型。
 *
 * 设备端按字段在定义中的位置（而不是字段号）解释数据记录，
 * 因此布局中的顺序就是线上顺序，不允许重排。
 */
struct FieldDef final {
  std::uint8_t number{0};
  std::uint8_t size{0};
  BaseType type{BaseType::enum_};
};

/**
 * @brief 一种消息在本文件中的完整布局（全局消息号 + 本地类型 + 字段表）。
 *
 * 定义记录与数据记录都由同一个 MessageLayout 生成，本地类型不会错配。
 */
struct MessageLayout final {
  GlobalMessage global{GlobalMessage::file_id};
  LocalType local{LocalType::file_identity};
  std::span<const FieldDef> fields{};
};

inline constexpr std::array<FieldDef, 5> kFileIdFields = {{
    {0, 1, BaseType::enum_},   // type
    {1, 2, BaseType::uint16},  // manufacturer
    {2, 2, BaseType::uint16},  // product
    {3, 4, BaseType::uint32},  // serial_number
    {4, 4, BaseType::uint32},  // time_created
}};

inline constexpr std::array<FieldDef, 3> kWorkoutFields = {{
    {4, kNameFieldSize, BaseType::string},  // wkt_name
    {5, 1, BaseType::enum_},                // sport
    {6, 2, BaseType::uint16},               // num_valid_steps
}};

inline constexpr std::array<FieldDef, 6> kWorkoutStepFields = {{
    {0, 2, BaseType::uint16},               // message_index
    {1, kNameFieldSize, BaseType::string},  // wkt_step_name
    {2, 1, BaseType::enum_},                // duration_type
    {3, 4, BaseType::uint32},               // duration_value (ms)
    {4, 1, BaseType::enum_},                // target_type
    {6, 1, BaseType::enum_},                // intensity
}};

inline constexpr MessageLayout kFileIdLayout{
    GlobalMessage::file_id, LocalType::file_identity, kFileIdFields};
inline constexpr MessageLayout kWorkoutLayout{
    GlobalMessage::workout, LocalType::workout, kWorkoutFields};
inline constexpr MessageLayout kWorkoutStepLayout{
    GlobalMessage::workout_step, LocalType::workout_step, kWorkoutStepFields};

// 定义记录：header(1) + reserved(1) + arch(1) + global(2) + count(1) + 3*N
[[nodiscard]] constexpr std::size_t
definition_size(const MessageLayout &layout) noexcept {
  return 6 + 3 * layout.fields.size();
}

// 数据记录：header(1) + 各字段宽度之和
[[nodiscard]] constexpr std::size_t
data_size(const MessageLayout &layout) noexcept {
  std::size_t n = 1;
  for (const auto &f : layout.fields) {
    n += f.size;
  }
  return n;
}

[[nodiscard]] constexpr std::size_t
record_size(const MessageLayout &layout) noexcept {
  return definition_size(layout) + data_size(layout);
}

/**
 * @brief 数据记录中的字段值：整数按声明宽度小端写入；字符串按声明宽度截断并补 0。
 */
using FieldValue = std::variant<std::uint64_t, std::string>;

/**
 * @brief 一对“定义记录 + 数据记录”。
 */
struct Record final {
  LocalType local{LocalType::file_identity};
  std::vector<byte> definition{};
  std::vector<byte> data{};

  [[nodiscard]] std::size_t size() const noexcept {
    return definition.size() + data.size();
  }
};

/**
 * @brief 编码定义记录并追加到 out。
 *
 * 字段数超过 255 时返回 errc::too_many_fields（out 不变）。
 */
std::error_code encode_definition(const MessageLayout &layout,
                                  std::vector<byte> &out);

/**
 * @brief 按布局编码数据记录并追加到 out。
 *
 * 失败（out 不变）：
 * - 值个数与字段数不一致，或整数/字符串类型与字段不匹配：errc::field_mismatch
 * - 整数超出字段宽度：errc::value_out_of_range
 */
std::error_code encode_data(const MessageLayout &layout,
                            std::span<const FieldValue> values,
                            std::vector<byte> &out);

/**
 * @brief 由同一布局生成定义记录与数据记录。
 */
std::error_code encode_record(const MessageLayout &layout,
                              std::span<const FieldValue> values,
                              Record &out);

/**
 * @brief 系统时间 -> FIT 时间戳（FIT 纪元起的秒数；早于纪元时为 0）。
 */
[[nodiscard]] std::uint32_t
fit_timestamp(std::chrono::system_clock::time_point tp) noexcept;

/**
 * @brief 步骤名称："<type> <index+1>"（写入时再按字段宽度截断）。
 */
[[nodiscard]] std::string step_name(std::string_view type, std::size_t index);

std::error_code make_file_id_record(std::uint32_t time_created, Record &out);

/**
 * @brief workout 记录：名称（最多 15 字节可见内容）、运动类型、步骤数。
 *
 * num_steps 超过 65535 时返回 errc::too_many_steps。
 */
std::error_code make_workout_record(std::string_view name,
                                    std::size_t num_steps,
                                    Record &out);

/**
 * @brief workout_step 记录：index 即 message_index（从 0 开始）。
 *
 * 时长与强度按 parse_duration_value / classify_intensity 归一化，
 * 无法识别的输入会落到默认值而不是报错。
 */
std::error_code make_workout_step_record(std::size_t index,
                                         const workout::StepSpec &step,
                                         Record &out);

}  // namespace fitgen::fit

namespace std {
template <>
struct is_error_code_enum<fitgen::fit::errc> : true_type {};
}  // namespace std
