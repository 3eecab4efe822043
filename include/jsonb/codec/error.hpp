#pragma once

#include <system_error>

namespace jsonb::codec {

enum class errc : int {
  ok = 0,
  truncated = 1,
  unexpected_type = 2,
  invalid_literal = 3,
  number_overflow = 4,
  malformed_composite = 5,
  trailing_data = 6,
  depth_exceeded = 7,
  length_overflow = 8,
  invalid_utf8 = 9,
  malformed_element = 10,
  visitor_rejected = 11,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace jsonb::codec

namespace std {
template <>
struct is_error_code_enum<jsonb::codec::errc> : true_type {};
}  // namespace std
