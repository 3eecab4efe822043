#include "jsonb/codec/decoder.hpp"

#include "core/log_internal.hpp"
#include "jsonb/codec/header.hpp"
#include "jsonb/literal/number.hpp"
#include "jsonb/literal/string.hpp"

#include <cstdint>
#include <limits>
#include <type_traits>

namespace jsonb::codec {
namespace {

using jsonb::core::detail::logger;

std::error_code map_literal_error(std::error_code ec) noexcept {
  if (ec == literal::errc::out_of_range) {
    return make_error_code(errc::number_overflow);
  }
  if (ec == literal::errc::invalid_utf8) {
    return make_error_code(errc::invalid_utf8);
  }
  return make_error_code(errc::invalid_literal);
}

literal::Flavor number_flavor(ElementType t) noexcept {
  return (t == ElementType::Int5 || t == ElementType::Float5) ? literal::Flavor::json5 : literal::Flavor::json;
}

literal::Flavor text_flavor(ElementType t) noexcept {
  switch (t) {
    case ElementType::TextJ:
      return literal::Flavor::json_lenient;
    case ElementType::Text5:
      return literal::Flavor::json5;
    default:
      return literal::Flavor::json;
  }
}

// Any 形状下：能放进 int64_t 的整数走 on_i64，其余非负整数走 on_u64。
bool fits_i64(const literal::IntegerLiteral& lit) noexcept {
  constexpr auto max_positive = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  return lit.negative || lit.magnitude <= max_positive;
}

}  // namespace

Decoder::Decoder(jsonb::core::ByteSource& source, DecodeOptions options) noexcept
    : root_(source), options_(options) {}

std::error_code Decoder::fail(std::error_code ec,
                              std::size_t offset,
                              Shape expected,
                              std::optional<ElementType> actual) {
  diagnostic_.ec = ec;
  diagnostic_.offset = offset;
  diagnostic_.expected = expected;
  diagnostic_.actual = actual;
  logger().debug("jsonb decode failed at offset {}: [{}] {} (expected {}, actual {})",
                 offset,
                 ec.category().name(),
                 ec.message(),
                 shape_name(expected),
                 actual ? element_type_name(*actual) : "-");
  return ec;
}

std::error_code Decoder::fail(std::error_code ec, const Element& e) {
  return fail(ec, e.offset, e.expected, e.header.type);
}

std::error_code Decoder::decode(Shape expected, Visitor& visitor) {
  diagnostic_ = {};
  return decode_element(root_, expected, visitor, 0);
}

std::error_code Decoder::finish() {
  const auto offset = root_.consumed();
  bool end = false;
  auto ec = root_.at_end(end);
  if (ec) {
    return fail(ec, offset, Shape::Any, std::nullopt);
  }
  if (!end) {
    return fail(make_error_code(errc::trailing_data), offset, Shape::Any, std::nullopt);
  }
  return {};
}

std::error_code Decoder::decode_element(Cursor& in, Shape expected, Visitor& visitor, std::size_t depth) {
  Element e;
  e.offset = root_.consumed();
  e.expected = expected;

  auto ec = read_header(in, e.header);
  if (ec) {
    return fail(ec, e.offset, expected, std::nullopt);
  }
  const auto& h = e.header;
  logger().trace("jsonb element at offset {}: {} header={} payload={}",
                 e.offset,
                 element_type_name(h.type),
                 h.header_size,
                 h.payload_size);

  // 类型不匹配立即失败，不做跨族隐式转换；保留类型对任何形状都不匹配。
  if (!shape_accepts(expected, h.type)) {
    return fail(make_error_code(errc::unexpected_type), e);
  }
  if (in.bounded() && h.payload_size > in.remaining()) {
    return fail(make_error_code(errc::malformed_composite), e);
  }

  switch (h.type) {
    case ElementType::Null:
    case ElementType::True:
    case ElementType::False:
      return decode_unit(in, e, visitor);
    case ElementType::Int:
    case ElementType::Int5:
      return decode_integer(in, e, visitor);
    case ElementType::Float:
    case ElementType::Float5:
      return decode_floating(in, e, visitor);
    case ElementType::Text:
    case ElementType::TextJ:
    case ElementType::Text5:
    case ElementType::TextRaw: {
      ec = decode_text(in, e, text_);
      if (ec) {
        return ec;
      }
      ec = visitor.on_string(text_);
      if (ec) {
        return fail(ec, e);
      }
      return {};
    }
    case ElementType::Array:
      return decode_array(in, e, visitor, depth);
    case ElementType::Object:
      return decode_object(in, e, visitor, depth);
    default:
      return fail(make_error_code(errc::unexpected_type), e);
  }
}

std::error_code Decoder::decode_unit(Cursor& in, const Element& e, Visitor& visitor) {
  const auto& h = e.header;
  if (h.payload_size != 0) {
    if (options_.null_payload == NullPayload::reject) {
      return fail(make_error_code(errc::malformed_element), e);
    }
    auto ec = in.skip(h.payload_size);
    if (ec) {
      return fail(ec, e);
    }
  }
  const auto ec = h.type == ElementType::Null ? visitor.on_null() : visitor.on_bool(h.type == ElementType::True);
  if (ec) {
    return fail(ec, e);
  }
  return {};
}

std::error_code Decoder::decode_integer(Cursor& in, const Element& e, Visitor& visitor) {
  auto ec = in.read_string(e.header.payload_size, payload_);
  if (ec) {
    return fail(ec, e);
  }

  literal::IntegerLiteral lit;
  ec = literal::scan_integer(payload_, number_flavor(e.header.type), lit);
  if (ec) {
    return fail(map_literal_error(ec), e);
  }

  auto emit = [&](auto tag, auto&& callback) -> std::error_code {
    using T = typename decltype(tag)::type;
    T v{};
    auto lec = literal::narrow_integer(lit, v);
    if (lec) {
      return fail(map_literal_error(lec), e);
    }
    auto vec = callback(v);
    if (vec) {
      return fail(vec, e);
    }
    return {};
  };

  switch (e.expected) {
    case Shape::I8:
      return emit(std::type_identity<std::int8_t>{}, [&](std::int8_t v) { return visitor.on_i8(v); });
    case Shape::I16:
      return emit(std::type_identity<std::int16_t>{}, [&](std::int16_t v) { return visitor.on_i16(v); });
    case Shape::I32:
      return emit(std::type_identity<std::int32_t>{}, [&](std::int32_t v) { return visitor.on_i32(v); });
    case Shape::I64:
      return emit(std::type_identity<std::int64_t>{}, [&](std::int64_t v) { return visitor.on_i64(v); });
    case Shape::U8:
      return emit(std::type_identity<std::uint8_t>{}, [&](std::uint8_t v) { return visitor.on_u8(v); });
    case Shape::U16:
      return emit(std::type_identity<std::uint16_t>{}, [&](std::uint16_t v) { return visitor.on_u16(v); });
    case Shape::U32:
      return emit(std::type_identity<std::uint32_t>{}, [&](std::uint32_t v) { return visitor.on_u32(v); });
    case Shape::U64:
      return emit(std::type_identity<std::uint64_t>{}, [&](std::uint64_t v) { return visitor.on_u64(v); });
    default:
      if (fits_i64(lit)) {
        return emit(std::type_identity<std::int64_t>{}, [&](std::int64_t v) { return visitor.on_i64(v); });
      }
      return emit(std::type_identity<std::uint64_t>{}, [&](std::uint64_t v) { return visitor.on_u64(v); });
  }
}

std::error_code Decoder::decode_floating(Cursor& in, const Element& e, Visitor& visitor) {
  auto ec = in.read_string(e.header.payload_size, payload_);
  if (ec) {
    return fail(ec, e);
  }
  const auto flavor = number_flavor(e.header.type);

  if (e.expected == Shape::F32) {
    float v = 0.0f;
    ec = literal::parse_floating(payload_, flavor, v);
    if (ec) {
      return fail(map_literal_error(ec), e);
    }
    ec = visitor.on_f32(v);
  } else {
    double v = 0.0;
    ec = literal::parse_floating(payload_, flavor, v);
    if (ec) {
      return fail(map_literal_error(ec), e);
    }
    ec = visitor.on_f64(v);
  }
  if (ec) {
    return fail(ec, e);
  }
  return {};
}

std::error_code Decoder::decode_text(Cursor& in, const Element& e, std::string& out) {
  auto ec = in.read_string(e.header.payload_size, payload_);
  if (ec) {
    return fail(ec, e);
  }
  if (e.header.type == ElementType::TextRaw) {
    // TextRaw：payload 即字符串内容，不含转义，只需是合法 UTF-8。
    ec = literal::validate_utf8(payload_);
    if (ec) {
      return fail(make_error_code(errc::invalid_utf8), e);
    }
    out.assign(payload_);
    return {};
  }
  ec = literal::unescape_string(payload_, text_flavor(e.header.type), out);
  if (ec) {
    return fail(map_literal_error(ec), e);
  }
  return {};
}

std::error_code Decoder::decode_array(Cursor& in, const Element& e, Visitor& visitor, std::size_t depth) {
  if (depth + 1 > options_.max_depth) {
    return fail(make_error_code(errc::depth_exceeded), e);
  }
  // 子游标与父游标共享同一字节源：子元素消费的字节恰好等于 payload_size 时循环结束。
  auto sub = in.take(e.header.payload_size);

  auto ec = visitor.begin_array();
  if (ec) {
    return fail(ec, e);
  }
  while (!sub.exhausted()) {
    ec = decode_element(sub, Shape::Any, visitor, depth + 1);
    if (ec) {
      return ec;
    }
  }
  ec = visitor.end_array();
  if (ec) {
    return fail(ec, e);
  }
  return {};
}

std::error_code Decoder::decode_object(Cursor& in, const Element& e, Visitor& visitor, std::size_t depth) {
  if (depth + 1 > options_.max_depth) {
    return fail(make_error_code(errc::depth_exceeded), e);
  }
  auto sub = in.take(e.header.payload_size);

  auto ec = visitor.begin_object();
  if (ec) {
    return fail(ec, e);
  }
  while (!sub.exhausted()) {
    Element key;
    key.offset = root_.consumed();
    key.expected = Shape::String;
    ec = read_header(sub, key.header);
    if (ec) {
      return fail(ec, key.offset, Shape::String, std::nullopt);
    }
    if (!is_text(key.header.type)) {
      return fail(make_error_code(errc::unexpected_type), key);
    }
    if (key.header.payload_size > sub.remaining()) {
      return fail(make_error_code(errc::malformed_composite), key);
    }
    ec = decode_text(sub, key, text_);
    if (ec) {
      return ec;
    }
    ec = visitor.on_key(text_);
    if (ec) {
      return fail(ec, key);
    }

    // 子元素个数为奇数：最后一个键没有对应的值。
    if (sub.exhausted()) {
      return fail(make_error_code(errc::malformed_composite), root_.consumed(), Shape::Any, std::nullopt);
    }
    ec = decode_element(sub, Shape::Any, visitor, depth + 1);
    if (ec) {
      return ec;
    }
  }
  ec = visitor.end_object();
  if (ec) {
    return fail(ec, e);
  }
  return {};
}

std::error_code decode(bytes_view in, Shape expected, Visitor& visitor, DecodeOptions options) {
  jsonb::core::SpanSource source(in);
  Decoder decoder(source, options);
  auto ec = decoder.decode(expected, visitor);
  if (ec) {
    return ec;
  }
  if (options.check_trailing) {
    return decoder.finish();
  }
  return {};
}

std::error_code decode(std::istream& in, Shape expected, Visitor& visitor, DecodeOptions options) {
  jsonb::core::StreamSource source(in);
  Decoder decoder(source, options);
  auto ec = decoder.decode(expected, visitor);
  if (ec) {
    return ec;
  }
  if (options.check_trailing) {
    return decoder.finish();
  }
  return {};
}

std::error_code decode_value(bytes_view in, Value& out, DecodeOptions options) {
  ValueBuilder builder;
  auto ec = decode(in, Shape::Any, builder, options);
  if (ec) {
    return ec;
  }
  return builder.take(out);
}

}  // namespace jsonb::codec
