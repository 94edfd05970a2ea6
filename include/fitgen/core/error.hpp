#pragma once

#include <system_error>

namespace fitgen::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有编码接口返回 std::error_code，不向调用方抛出异常；
 * - encode_failed 表示编码过程中出现了无法归类的内部异常（例如内存不足），
 *   此时不会返回任何部分写入的数据。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  buffer_overflow = 2,
  encode_failed = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace fitgen::core

namespace std {
template <>
struct is_error_code_enum<fitgen::core::errc> : true_type {};
}  // namespace std
