#include "fitgen/fit/record.hpp"

#include "fitgen/workout/duration.hpp"
#include "fitgen/workout/intensity.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace fitgen::fit {
namespace {

/*
 * 记录编码说明：
 *
 * - 定义记录 = header(0x40|local) + reserved(0) + arch(0=小端)
 *   + global(2B, 小端) + 字段数(1B) + N * (字段号, 宽度, 基础类型)
 * - 数据记录 = header(local) + 各字段按声明宽度紧密排列
 *
 * 两者都先写入临时缓冲区，全部成功后才追加到调用方的 out，
 * 保证失败时 out 不被部分修改。
 */
class fit_error_category final : public std::error_category {
 public:
  const char *name() const noexcept override { return "fitgen.fit"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::field_mismatch:
        return "field value does not match message layout";
      case errc::value_out_of_range:
        return "field value out of range";
      case errc::too_many_fields:
        return "too many fields in message layout";
      case errc::too_many_steps:
        return "too many workout steps";
      case errc::file_too_large:
        return "fit file too large";
      default:
        return "unknown fitgen.fit error";
    }
  }
};

class ByteWriter final {
 public:
  explicit ByteWriter(std::vector<byte> &out) : out_(out) {}

  void write_u8(byte v) { out_.push_back(v); }

  // 按 width 字节小端写入；调用方保证 v 可以放进 width 字节。
  void write_le_uint(std::uint64_t v, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
      out_.push_back(static_cast<byte>((v >> (8u * i)) & 0xFFu));
    }
  }

  // 定长字符串：最多写 width-1 字节，其余补 0（保证有结尾 '\0'）。
  void write_fixed_string(std::string_view s, std::size_t width) {
    if (width == 0) {
      return;
    }
    const auto n = std::min(s.size(), width - 1);
    out_.insert(out_.end(), s.begin(), s.begin() + static_cast<std::ptrdiff_t>(n));
    out_.insert(out_.end(), width - n, byte{0});
  }

 private:
  std::vector<byte> &out_;
};

[[nodiscard]] constexpr bool fits_width(std::uint64_t v,
                                        std::size_t width) noexcept {
  if (width >= sizeof(std::uint64_t)) {
    return true;
  }
  return v < (std::uint64_t{1} << (8u * width));
}

[[nodiscard]] constexpr bool is_string_field(const FieldDef &f) noexcept {
  return f.type == BaseType::string;
}

}  // namespace

const std::error_category &error_category() noexcept {
  static fit_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::error_code encode_definition(const MessageLayout &layout,
                                  std::vector<byte> &out) {
  if (layout.fields.size() > std::numeric_limits<std::uint8_t>::max()) {
    return make_error_code(errc::too_many_fields);
  }

  std::vector<byte> buf;
  buf.reserve(definition_size(layout));
  ByteWriter w{buf};

  w.write_u8(definition_header(layout.local));
  w.write_u8(0x00);  // reserved
  w.write_u8(kArchitectureLittleEndian);
  w.write_le_uint(static_cast<std::uint16_t>(layout.global), 2);
  w.write_u8(static_cast<byte>(layout.fields.size()));
  for (const auto &f : layout.fields) {
    w.write_u8(f.number);
    w.write_u8(f.size);
    w.write_u8(static_cast<byte>(f.type));
  }

  out.insert(out.end(), buf.begin(), buf.end());
  return {};
}

std::error_code encode_data(const MessageLayout &layout,
                            std::span<const FieldValue> values,
                            std::vector<byte> &out) {
  if (values.size() != layout.fields.size()) {
    return make_error_code(errc::field_mismatch);
  }

  std::vector<byte> buf;
  buf.reserve(data_size(layout));
  ByteWriter w{buf};

  w.write_u8(data_header(layout.local));
  for (std::size_t i = 0; i < layout.fields.size(); ++i) {
    const auto &field = layout.fields[i];
    const auto &value = values[i];

    if (is_string_field(field)) {
      const auto *s = std::get_if<std::string>(&value);
      if (s == nullptr) {
        return make_error_code(errc::field_mismatch);
      }
      w.write_fixed_string(*s, field.size);
      continue;
    }

    const auto *v = std::get_if<std::uint64_t>(&value);
    if (v == nullptr) {
      return make_error_code(errc::field_mismatch);
    }
    if (!fits_width(*v, field.size)) {
      return make_error_code(errc::value_out_of_range);
    }
    w.write_le_uint(*v, field.size);
  }

  out.insert(out.end(), buf.begin(), buf.end());
  return {};
}

std::error_code encode_record(const MessageLayout &layout,
                              std::span<const FieldValue> values,
                              Record &out) {
  Record rec;
  rec.local = layout.local;

  auto ec = encode_definition(layout, rec.definition);
  if (ec) {
    return ec;
  }
  ec = encode_data(layout, values, rec.data);
  if (ec) {
    return ec;
  }

  out = std::move(rec);
  return {};
}

std::uint32_t fit_timestamp(std::chrono::system_clock::time_point tp) noexcept {
  const auto unix_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
          .count();
  if (unix_seconds <= static_cast<std::int64_t>(kFitEpochOffset)) {
    return 0;
  }
  const auto fit_seconds =
      unix_seconds - static_cast<std::int64_t>(kFitEpochOffset);
  if (fit_seconds > std::numeric_limits<std::uint32_t>::max()) {
    return std::numeric_limits<std::uint32_t>::max();
  }
  return static_cast<std::uint32_t>(fit_seconds);
}

std::string step_name(std::string_view type, std::size_t index) {
  std::string name{type};
  name.push_back(' ');
  name.append(std::to_string(index + 1));
  return name;
}

std::error_code make_file_id_record(std::uint32_t time_created, Record &out) {
  const std::array<FieldValue, kFileIdFields.size()> values = {
      FieldValue{std::uint64_t{kFileTypeWorkout}},
      FieldValue{std::uint64_t{kManufacturerDevelopment}},
      FieldValue{std::uint64_t{kProductId}},
      FieldValue{std::uint64_t{kSerialNumber}},
      FieldValue{std::uint64_t{time_created}},
  };
  return encode_record(kFileIdLayout, values, out);
}

std::error_code make_workout_record(std::string_view name,
                                    std::size_t num_steps,
                                    Record &out) {
  if (num_steps > std::numeric_limits<std::uint16_t>::max()) {
    return make_error_code(errc::too_many_steps);
  }
  const std::array<FieldValue, kWorkoutFields.size()> values = {
      FieldValue{std::string{name}},
      FieldValue{std::uint64_t{kSportRunning}},
      FieldValue{static_cast<std::uint64_t>(num_steps)},
  };
  return encode_record(kWorkoutLayout, values, out);
}

std::error_code make_workout_step_record(std::size_t index,
                                         const workout::StepSpec &step,
                                         Record &out) {
  if (index > std::numeric_limits<std::uint16_t>::max()) {
    return make_error_code(errc::too_many_steps);
  }

  const auto seconds = workout::parse_duration_value(step.duration);
  const auto intensity = workout::classify_intensity(step.type);

  const std::array<FieldValue, kWorkoutStepFields.size()> values = {
      FieldValue{static_cast<std::uint64_t>(index)},
      FieldValue{step_name(step.type, index)},
      FieldValue{std::uint64_t{kDurationTypeTime}},
      FieldValue{static_cast<std::uint64_t>(seconds) * 1000u},
      FieldValue{std::uint64_t{kTargetTypeOpen}},
      FieldValue{static_cast<std::uint64_t>(intensity)},
  };
  return encode_record(kWorkoutStepLayout, values, out);
}

}  // namespace fitgen::fit
