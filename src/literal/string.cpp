#include "jsonb/literal/string.hpp"

#include <cstddef>

namespace jsonb::literal {
namespace {

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

[[nodiscard]] bool read_hex(std::string_view s, std::size_t pos, std::size_t count, std::uint32_t& out) noexcept {
  if (pos + count > s.size()) {
    return false;
  }
  std::uint32_t v = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const int d = hex_value(s[pos + i]);
    if (d < 0) {
      return false;
    }
    v = (v << 4) | static_cast<std::uint32_t>(d);
  }
  out = v;
  return true;
}

[[nodiscard]] bool is_high_surrogate(std::uint32_t cp) noexcept { return cp >= 0xD800 && cp <= 0xDBFF; }
[[nodiscard]] bool is_low_surrogate(std::uint32_t cp) noexcept { return cp >= 0xDC00 && cp <= 0xDFFF; }

// JSON5 的 U+2028 / U+2029（UTF-8：E2 80 A8 / E2 80 A9）也可作为续行符。
[[nodiscard]] std::size_t line_separator_at(std::string_view s, std::size_t pos) noexcept {
  if (pos + 3 <= s.size() && static_cast<unsigned char>(s[pos]) == 0xE2 &&
      static_cast<unsigned char>(s[pos + 1]) == 0x80 &&
      (static_cast<unsigned char>(s[pos + 2]) == 0xA8 || static_cast<unsigned char>(s[pos + 2]) == 0xA9)) {
    return 3;
  }
  return 0;
}

// 解析 \u 转义（pos 指向 'u' 之后），处理代理对；成功时 pos 前移到转义之后。
std::error_code read_unicode_escape(std::string_view body, std::size_t& pos, std::string& out) {
  std::uint32_t cp = 0;
  if (!read_hex(body, pos, 4, cp)) {
    return make_error_code(errc::invalid_escape);
  }
  pos += 4;
  if (is_low_surrogate(cp)) {
    return make_error_code(errc::invalid_escape);
  }
  if (is_high_surrogate(cp)) {
    std::uint32_t low = 0;
    if (pos + 2 > body.size() || body[pos] != '\\' || body[pos + 1] != 'u' ||
        !read_hex(body, pos + 2, 4, low) || !is_low_surrogate(low)) {
      return make_error_code(errc::invalid_escape);
    }
    pos += 6;
    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
  }
  append_utf8(cp, out);
  return {};
}

// JSON5 特有的转义（pos 指向反斜杠后的字符）。
std::error_code read_json5_escape(std::string_view body, std::size_t& pos, std::string& out) {
  const char c = body[pos];
  switch (c) {
    case '\'':
      out.push_back('\'');
      ++pos;
      return {};
    case 'v':
      out.push_back('\v');
      ++pos;
      return {};
    case '0':
      if (pos + 1 < body.size() && body[pos + 1] >= '0' && body[pos + 1] <= '9') {
        return make_error_code(errc::invalid_escape);
      }
      out.push_back('\0');
      ++pos;
      return {};
    case 'x': {
      std::uint32_t cp = 0;
      if (!read_hex(body, pos + 1, 2, cp)) {
        return make_error_code(errc::invalid_escape);
      }
      append_utf8(cp, out);
      pos += 3;
      return {};
    }
    case '\n':
      ++pos;
      return {};
    case '\r':
      ++pos;
      if (pos < body.size() && body[pos] == '\n') {
        ++pos;
      }
      return {};
    default:
      break;
  }
  if (const auto n = line_separator_at(body, pos); n != 0) {
    pos += n;
    return {};
  }
  if (c >= '1' && c <= '9') {
    return make_error_code(errc::invalid_escape);
  }
  // 恒等转义：多字节字符只追加首字节，后续字节由主循环照常复制。
  out.push_back(c);
  ++pos;
  return {};
}

}  // namespace

void append_utf8(std::uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::error_code validate_utf8(std::string_view text) noexcept {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    std::size_t len = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      return make_error_code(errc::invalid_utf8);
    }
    if (i + len > text.size()) {
      return make_error_code(errc::invalid_utf8);
    }
    for (std::size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return make_error_code(errc::invalid_utf8);
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return make_error_code(errc::invalid_utf8);
    }
    i += len;
  }
  return {};
}

std::error_code unescape_string(std::string_view body, Flavor flavor, std::string& out) {
  out.clear();
  out.reserve(body.size());

  std::size_t pos = 0;
  while (pos < body.size()) {
    const char c = body[pos];
    if (c != '\\') {
      const auto uc = static_cast<unsigned char>(c);
      if (flavor == Flavor::json && (uc < 0x20 || c == '"')) {
        return make_error_code(errc::invalid_string);
      }
      out.push_back(c);
      ++pos;
      continue;
    }

    ++pos;
    if (pos >= body.size()) {
      // 正文以孤立的反斜杠结尾。
      return make_error_code(errc::invalid_escape);
    }
    const char e = body[pos];
    switch (e) {
      case '"':
      case '\\':
      case '/':
        out.push_back(e);
        ++pos;
        continue;
      case 'b':
        out.push_back('\b');
        ++pos;
        continue;
      case 'f':
        out.push_back('\f');
        ++pos;
        continue;
      case 'n':
        out.push_back('\n');
        ++pos;
        continue;
      case 'r':
        out.push_back('\r');
        ++pos;
        continue;
      case 't':
        out.push_back('\t');
        ++pos;
        continue;
      case 'u': {
        ++pos;
        auto ec = read_unicode_escape(body, pos, out);
        if (ec) {
          return ec;
        }
        continue;
      }
      default:
        break;
    }

    if (flavor != Flavor::json5) {
      return make_error_code(errc::invalid_escape);
    }
    auto ec = read_json5_escape(body, pos, out);
    if (ec) {
      return ec;
    }
  }

  return validate_utf8(out);
}

}  // namespace jsonb::literal
