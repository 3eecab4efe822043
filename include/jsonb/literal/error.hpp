#pragma once

#include <system_error>

namespace jsonb::literal {

enum class errc : int {
  ok = 0,
  invalid_number = 1,
  invalid_string = 2,
  invalid_escape = 3,
  invalid_utf8 = 4,
  out_of_range = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace jsonb::literal

namespace std {
template <>
struct is_error_code_enum<jsonb::literal::errc> : true_type {};
}  // namespace std
