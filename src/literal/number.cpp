#include "jsonb/literal/number.hpp"

#include <charconv>
#include <cmath>
#include <string>

namespace jsonb::literal {
namespace {

constexpr std::uint64_t kU64Max = std::numeric_limits<std::uint64_t>::max();

[[nodiscard]] bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

[[nodiscard]] bool has_hex_prefix(std::string_view s) noexcept {
  return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

[[nodiscard]] std::size_t count_digits(std::string_view s, std::size_t pos) noexcept {
  std::size_t n = 0;
  while (pos + n < s.size() && is_digit(s[pos + n])) {
    ++n;
  }
  return n;
}

std::error_code scan_hex_magnitude(std::string_view digits, std::uint64_t& out) noexcept {
  if (digits.empty()) {
    return make_error_code(errc::invalid_number);
  }
  bool overflow = false;
  std::uint64_t v = 0;
  for (char c : digits) {
    const int d = hex_value(c);
    if (d < 0) {
      return make_error_code(errc::invalid_number);
    }
    if (v > (kU64Max >> 4)) {
      overflow = true;
    }
    v = (v << 4) | static_cast<std::uint64_t>(d);
  }
  if (overflow) {
    return make_error_code(errc::out_of_range);
  }
  out = v;
  return {};
}

std::error_code scan_decimal_magnitude(std::string_view digits, std::uint64_t& out) noexcept {
  if (digits.empty()) {
    return make_error_code(errc::invalid_number);
  }
  // 十进制整数不允许前导零（单独的 "0" 除外）。
  if (digits.size() > 1 && digits[0] == '0') {
    return make_error_code(errc::invalid_number);
  }
  bool overflow = false;
  std::uint64_t v = 0;
  for (char c : digits) {
    if (!is_digit(c)) {
      return make_error_code(errc::invalid_number);
    }
    const auto d = static_cast<std::uint64_t>(c - '0');
    if (overflow || v > (kU64Max - d) / 10) {
      overflow = true;
      continue;
    }
    v = v * 10 + d;
  }
  if (overflow) {
    return make_error_code(errc::out_of_range);
  }
  out = v;
  return {};
}

// 读取可选符号，返回符号之后的剩余部分。
[[nodiscard]] std::string_view strip_sign(std::string_view text, Flavor flavor, bool& negative) noexcept {
  negative = false;
  if (!text.empty() && text[0] == '-') {
    negative = true;
    return text.substr(1);
  }
  if (flavor == Flavor::json5 && !text.empty() && text[0] == '+') {
    return text.substr(1);
  }
  return text;
}

// 粗略估计十进制数值的量级（首个有效数字相对小数点的位置），用于区分上溢与下溢。
[[nodiscard]] long long decimal_magnitude(std::string_view int_part,
                                          std::string_view frac_part,
                                          std::string_view exp_part) noexcept {
  long long exponent = 0;
  bool exp_negative = false;
  std::size_t i = 0;
  if (i < exp_part.size() && (exp_part[i] == '+' || exp_part[i] == '-')) {
    exp_negative = exp_part[i] == '-';
    ++i;
  }
  for (; i < exp_part.size(); ++i) {
    if (exponent < 1'000'000'000LL) {
      exponent = exponent * 10 + (exp_part[i] - '0');
    }
  }
  if (exp_negative) {
    exponent = -exponent;
  }

  const auto first_nonzero = int_part.find_first_not_of('0');
  if (first_nonzero != std::string_view::npos) {
    return static_cast<long long>(int_part.size() - first_nonzero) + exponent;
  }
  const auto frac_nonzero = frac_part.find_first_not_of('0');
  if (frac_nonzero == std::string_view::npos) {
    return 0;
  }
  return exponent - static_cast<long long>(frac_nonzero);
}

template <class T>
std::error_code parse_floating_impl(std::string_view text, Flavor flavor, T& out) {
  bool negative = false;
  const auto body = strip_sign(text, flavor, negative);
  if (body.empty()) {
    return make_error_code(errc::invalid_number);
  }

  if (flavor == Flavor::json5) {
    if (body == "Infinity") {
      out = negative ? -std::numeric_limits<T>::infinity() : std::numeric_limits<T>::infinity();
      return {};
    }
    if (body == "NaN") {
      out = std::copysign(std::numeric_limits<T>::quiet_NaN(), negative ? T{-1} : T{1});
      return {};
    }
    if (has_hex_prefix(body)) {
      std::uint64_t magnitude = 0;
      auto ec = scan_hex_magnitude(body.substr(2), magnitude);
      if (ec) {
        return ec;
      }
      const auto v = static_cast<T>(magnitude);
      out = negative ? -v : v;
      return {};
    }
  }

  std::size_t pos = 0;
  const auto int_digits = count_digits(body, pos);
  const auto int_part = body.substr(pos, int_digits);
  pos += int_digits;
  if (int_digits > 1 && int_part[0] == '0') {
    return make_error_code(errc::invalid_number);
  }

  bool has_dot = false;
  std::string_view frac_part;
  if (pos < body.size() && body[pos] == '.') {
    has_dot = true;
    ++pos;
    const auto frac_digits = count_digits(body, pos);
    frac_part = body.substr(pos, frac_digits);
    pos += frac_digits;
  }

  if (flavor == Flavor::json5) {
    if (int_part.empty() && frac_part.empty()) {
      return make_error_code(errc::invalid_number);
    }
  } else if (int_part.empty() || (has_dot && frac_part.empty())) {
    return make_error_code(errc::invalid_number);
  }

  std::string_view exp_part;
  if (pos < body.size() && (body[pos] == 'e' || body[pos] == 'E')) {
    ++pos;
    const auto exp_start = pos;
    if (pos < body.size() && (body[pos] == '+' || body[pos] == '-')) {
      ++pos;
    }
    const auto exp_digits = count_digits(body, pos);
    if (exp_digits == 0) {
      return make_error_code(errc::invalid_number);
    }
    pos += exp_digits;
    exp_part = body.substr(exp_start, pos - exp_start);
  }
  if (pos != body.size()) {
    return make_error_code(errc::invalid_number);
  }

  // from_chars 不接受前导 + 与省略的整数部分，这里先规范化。
  std::string normalized;
  normalized.reserve(text.size() + 3);
  if (negative) {
    normalized.push_back('-');
  }
  if (int_part.empty()) {
    normalized.push_back('0');
  } else {
    normalized.append(int_part);
  }
  if (!frac_part.empty()) {
    normalized.push_back('.');
    normalized.append(frac_part);
  }
  if (!exp_part.empty()) {
    normalized.push_back('e');
    normalized.append(exp_part);
  }

  T value{};
  const char* first = normalized.data();
  const char* last = first + normalized.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
  if (ec == std::errc::result_out_of_range) {
    if (decimal_magnitude(int_part, frac_part, exp_part) <= 0) {
      out = negative ? -T{0} : T{0};
      return {};
    }
    return make_error_code(errc::out_of_range);
  }
  if (ec != std::errc{} || ptr != last) {
    return make_error_code(errc::invalid_number);
  }
  out = value;
  return {};
}

}  // namespace

std::error_code scan_integer(std::string_view text, Flavor flavor, IntegerLiteral& out) noexcept {
  bool negative = false;
  const auto body = strip_sign(text, flavor, negative);

  std::uint64_t magnitude = 0;
  std::error_code ec;
  if (flavor == Flavor::json5 && has_hex_prefix(body)) {
    ec = scan_hex_magnitude(body.substr(2), magnitude);
  } else {
    ec = scan_decimal_magnitude(body, magnitude);
  }
  if (ec) {
    return ec;
  }
  out.negative = negative;
  out.magnitude = magnitude;
  return {};
}

std::error_code parse_floating(std::string_view text, Flavor flavor, double& out) {
  return parse_floating_impl(text, flavor, out);
}

std::error_code parse_floating(std::string_view text, Flavor flavor, float& out) {
  return parse_floating_impl(text, flavor, out);
}

}  // namespace jsonb::literal
