#pragma once

#include "jsonb/literal/error.hpp"
#include "jsonb/literal/types.hpp"

#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace jsonb::literal {

/**
 * @brief 整数字面量的扫描结果：符号 + 64 位无符号绝对值。
 *
 * 绝对值超出 uint64_t 时 scan_integer 直接返回 errc::out_of_range。
 */
struct IntegerLiteral final {
  bool negative{false};
  std::uint64_t magnitude{0};

  friend bool operator==(const IntegerLiteral&, const IntegerLiteral&) = default;
};

/**
 * @brief 扫描整个 text 作为整数字面量（不允许前后空白或多余字符）。
 *
 * - json / json_lenient：-?(0|[1-9][0-9]*)
 * - json5：[+-]?(0[xX][0-9a-fA-F]+|0|[1-9][0-9]*)
 *
 * 语法错误返回 errc::invalid_number；语法正确但绝对值超出 uint64_t 返回 errc::out_of_range。
 */
std::error_code scan_integer(std::string_view text, Flavor flavor, IntegerLiteral& out) noexcept;

/**
 * @brief 把整数字面量收窄到目标整数类型；不可表示时返回 errc::out_of_range（不截断、不回绕）。
 */
template <class T>
std::error_code narrow_integer(const IntegerLiteral& lit, T& out) noexcept {
  static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "T must be an integer type");
  if constexpr (std::is_unsigned_v<T>) {
    if (lit.negative && lit.magnitude != 0) {
      return make_error_code(errc::out_of_range);
    }
    if (lit.magnitude > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
      return make_error_code(errc::out_of_range);
    }
    out = static_cast<T>(lit.magnitude);
  } else {
    const auto max_positive = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    if (!lit.negative) {
      if (lit.magnitude > max_positive) {
        return make_error_code(errc::out_of_range);
      }
      out = static_cast<T>(lit.magnitude);
    } else if (lit.magnitude == max_positive + 1) {
      out = std::numeric_limits<T>::min();
    } else if (lit.magnitude > max_positive) {
      return make_error_code(errc::out_of_range);
    } else {
      out = static_cast<T>(-static_cast<T>(lit.magnitude));
    }
  }
  return {};
}

template <class T>
std::error_code parse_integer(std::string_view text, Flavor flavor, T& out) noexcept {
  IntegerLiteral lit;
  auto ec = scan_integer(text, flavor, lit);
  if (ec) {
    return ec;
  }
  return narrow_integer(lit, out);
}

/**
 * @brief 解析整个 text 作为浮点字面量（整数写法同样接受）。
 *
 * - json / json_lenient：-?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
 * - json5：额外允许前导 +、省略整数部分或小数部分（.5 / 5.）、十六进制整数、
 *   Infinity、NaN（均可带符号）。
 *
 * 按目标类型就近舍入；有限值超出目标类型范围返回 errc::out_of_range，下溢得到带符号的 0。
 */
std::error_code parse_floating(std::string_view text, Flavor flavor, double& out);
std::error_code parse_floating(std::string_view text, Flavor flavor, float& out);

}  // namespace jsonb::literal
