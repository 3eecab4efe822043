#pragma once

#include <system_error>

namespace jsonb::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有解码接口返回 std::error_code，不走异常路径。
 * - io_error 表示底层字节源（如 std::istream）读取失败，解码层原样向上传递。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  io_error = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace jsonb::core

namespace std {
template <>
struct is_error_code_enum<jsonb::core::errc> : true_type {};
}  // namespace std
