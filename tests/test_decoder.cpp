#include "jsonb/codec/decoder.hpp"
#include "jsonb/codec/error.hpp"
#include "jsonb/codec/value.hpp"
#include "jsonb/core/byte_source.hpp"
#include "jsonb/core/error.hpp"

#include "test_main.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using jsonb::codec::decode;
using jsonb::codec::decode_value;
using jsonb::codec::DecodeOptions;
using jsonb::codec::Decoder;
using jsonb::codec::ElementType;
using jsonb::codec::errc;
using jsonb::codec::from_bytes;
using jsonb::codec::Member;
using jsonb::codec::NullPayload;
using jsonb::codec::Shape;
using jsonb::codec::Value;
using jsonb::core::byte;
using jsonb::core::bytes_view;
using jsonb::core::SpanSource;

bytes_view as_bytes(std::string_view s) {
  return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
}

// 以指定长度模式编码一个元素：length_bytes 为 0（内联）/1/2/4/8，-1 表示最短编码。
std::string el(ElementType type, std::string_view payload, int length_bytes = -1) {
  const auto tag = static_cast<unsigned>(type);
  const auto n = static_cast<std::uint64_t>(payload.size());
  if (length_bytes < 0) {
    length_bytes = n <= 11 ? 0 : (n <= 0xFF ? 1 : (n <= 0xFFFF ? 2 : 4));
  }

  std::string out;
  switch (length_bytes) {
    case 0:
      out.push_back(static_cast<char>((n << 4) | tag));
      break;
    case 1:
      out.push_back(static_cast<char>(0xC0 | tag));
      break;
    case 2:
      out.push_back(static_cast<char>(0xD0 | tag));
      break;
    case 4:
      out.push_back(static_cast<char>(0xE0 | tag));
      break;
    default:
      out.push_back(static_cast<char>(0xF0 | tag));
      break;
  }
  for (int i = length_bytes - 1; i >= 0; --i) {
    out.push_back(static_cast<char>((n >> (8 * i)) & 0xFF));
  }
  out.append(payload);
  return out;
}

std::string int_el(std::string_view text) { return el(ElementType::Int, text); }
std::string text_el(std::string_view text) { return el(ElementType::Text, text); }

// 记录回调序列，便于核对解码器选择了哪个回调。
class RecordingVisitor final : public jsonb::codec::Visitor {
 public:
  std::error_code on_null() override { return push("null"); }
  std::error_code on_bool(bool v) override { return push(v ? "true" : "false"); }
  std::error_code on_i64(std::int64_t v) override { return push("i64:" + std::to_string(v)); }
  std::error_code on_u64(std::uint64_t v) override { return push("u64:" + std::to_string(v)); }
  std::error_code on_f64(double v) override { return push("f64:" + std::to_string(v)); }
  std::error_code on_string(std::string_view v) override { return push("str:" + std::string(v)); }
  std::error_code begin_array() override { return push("["); }
  std::error_code end_array() override { return push("]"); }
  std::error_code begin_object() override { return push("{"); }
  std::error_code on_key(std::string_view k) override { return push("key:" + std::string(k)); }
  std::error_code end_object() override { return push("}"); }

  std::error_code on_i16(std::int16_t v) override { return push("i16:" + std::to_string(v)); }
  std::error_code on_u8(std::uint8_t v) override { return push("u8:" + std::to_string(v)); }

  std::string joined() const {
    std::string out;
    for (const auto& e : events) {
      if (!out.empty()) {
        out.push_back(' ');
      }
      out.append(e);
    }
    return out;
  }

  std::vector<std::string> events;
  std::string reject_string;

 private:
  std::error_code push(std::string e) {
    if (!reject_string.empty() && e == "str:" + reject_string) {
      return std::make_error_code(std::errc::operation_not_permitted);
    }
    events.push_back(std::move(e));
    return {};
  }
};

template <class T>
void expect_int_as(const std::string& bytes, T expected) {
  T v{};
  TEST_EXPECT_OK(from_bytes(as_bytes(bytes), v));
  TEST_EXPECT_EQ(v, expected);
}

void test_non_canonical_headers_decode_identically() {
  for (int mode : {0, 1, 2, 4, 8}) {
    const auto bytes = el(ElementType::Int, "42", mode);
    std::int32_t v = 0;
    TEST_EXPECT_OK(from_bytes(as_bytes(bytes), v));
    TEST_EXPECT_EQ(v, 42);

    const auto text = el(ElementType::Text, "hi", mode);
    std::string s;
    TEST_EXPECT_OK(from_bytes(as_bytes(text), s));
    TEST_EXPECT_EQ(s, "hi");

    // 空 Null 同样可以用长头部编码。
    const auto null = el(ElementType::Null, "", mode);
    std::nullptr_t n = nullptr;
    TEST_EXPECT_OK(from_bytes(as_bytes(null), n));
  }
}

void test_integer_literal_in_every_width() {
  const std::string one("\x13\x31", 2);
  expect_int_as<std::int8_t>(one, 1);
  expect_int_as<std::int16_t>(one, 1);
  expect_int_as<std::int32_t>(one, 1);
  expect_int_as<std::int64_t>(one, 1);
  expect_int_as<std::uint8_t>(one, 1);
  expect_int_as<std::uint16_t>(one, 1);
  expect_int_as<std::uint32_t>(one, 1);
  expect_int_as<std::uint64_t>(one, 1);

  const auto minus = int_el("-200");
  std::int8_t i8 = 0;
  TEST_EXPECT(from_bytes(as_bytes(minus), i8) == errc::number_overflow);
  std::uint32_t u32 = 0;
  TEST_EXPECT(from_bytes(as_bytes(minus), u32) == errc::number_overflow);
  expect_int_as<std::int16_t>(minus, -200);
}

void test_extreme_integers() {
  expect_int_as<std::uint64_t>(int_el("18446744073709551615"), std::numeric_limits<std::uint64_t>::max());
  expect_int_as<std::int64_t>(int_el("-9223372036854775808"), std::numeric_limits<std::int64_t>::min());

  std::int64_t i64 = 0;
  TEST_EXPECT(from_bytes(as_bytes(int_el("18446744073709551615")), i64) == errc::number_overflow);
  std::uint64_t u64 = 0;
  TEST_EXPECT(from_bytes(as_bytes(int_el("18446744073709551616")), u64) == errc::number_overflow);

  // Any 形状：超出 int64_t 的非负整数才使用 uint64_t。
  Value v;
  TEST_EXPECT_OK(decode_value(as_bytes(int_el("18446744073709551615")), v));
  TEST_EXPECT(v == Value::unsigned_integer(std::numeric_limits<std::uint64_t>::max()));
  TEST_EXPECT_OK(decode_value(as_bytes(int_el("9223372036854775807")), v));
  TEST_EXPECT(v == Value::integer(std::numeric_limits<std::int64_t>::max()));
}

void test_integer_literal_flavors() {
  std::int32_t v = 0;
  TEST_EXPECT(from_bytes(as_bytes(int_el("01")), v) == errc::invalid_literal);
  TEST_EXPECT(from_bytes(as_bytes(int_el("0x10")), v) == errc::invalid_literal);
  TEST_EXPECT(from_bytes(as_bytes(int_el(" 1")), v) == errc::invalid_literal);
  TEST_EXPECT(from_bytes(as_bytes(int_el("")), v) == errc::invalid_literal);

  expect_int_as<std::int32_t>(el(ElementType::Int5, "0x10"), 16);
  expect_int_as<std::int32_t>(el(ElementType::Int5, "+7"), 7);
}

void test_trailing_data() {
  const std::string null_only("\x00", 1);
  Value v;
  TEST_EXPECT_OK(decode_value(as_bytes(null_only), v));
  TEST_EXPECT(v.is_null());

  for (int extra : {0x00, 0x13, 0xFF}) {
    std::string bytes = null_only;
    bytes.push_back(static_cast<char>(extra));
    TEST_EXPECT(decode_value(as_bytes(bytes), v) == errc::trailing_data);

    DecodeOptions opt;
    opt.check_trailing = false;
    TEST_EXPECT_OK(decode_value(as_bytes(bytes), v, opt));
  }
}

void test_reserved_tags_rejected() {
  const std::vector<std::string> inputs = {
    std::string("\x0D", 1),
    std::string("\x1E" "a", 2),
    std::string("\xCF\x00", 2),
    std::string("\xFD\x00\x00\x00\x00\x00\x00\x00\x00", 9),
  };
  for (const auto& bytes : inputs) {
    Value v;
    TEST_EXPECT(decode_value(as_bytes(bytes), v) == errc::unexpected_type);
  }

  // 复合类型内部同样拒绝。
  Value v;
  const auto arr = el(ElementType::Array, int_el("1") + std::string("\x0E", 1));
  TEST_EXPECT(decode_value(as_bytes(arr), v) == errc::unexpected_type);
}

void test_object_parity() {
  const auto even = el(ElementType::Object, text_el("a") + int_el("1") + text_el("b") +
                                                el(ElementType::True, "") + text_el("a") + int_el("3"));
  Value v;
  TEST_EXPECT_OK(decode_value(as_bytes(even), v));
  const auto expected = Value::object({
    Member{"a", Value::integer(1)},
    Member{"b", Value::boolean(true)},
    Member{"a", Value::integer(3)},
  });
  TEST_EXPECT(v == expected);

  const auto odd = el(ElementType::Object, text_el("a") + int_el("1") + text_el("dangling"));
  TEST_EXPECT(decode_value(as_bytes(odd), v) == errc::malformed_composite);

  const auto non_text_key = el(ElementType::Object, int_el("1") + int_el("2"));
  TEST_EXPECT(decode_value(as_bytes(non_text_key), v) == errc::unexpected_type);

  // 各种文本类型都可以作为键。
  const auto keys = el(ElementType::Object,
                       el(ElementType::TextRaw, "r") + int_el("1") + el(ElementType::Text5, "\\x41") + int_el("2"));
  TEST_EXPECT_OK(decode_value(as_bytes(keys), v));
  TEST_EXPECT(v.find("r") != nullptr);
  TEST_EXPECT(v.find("A") != nullptr);
}

void test_sub_bound_accounting() {
  const auto children = el(ElementType::Int, "1", 8) + el(ElementType::Text, "abc", 2) +
                        el(ElementType::Array, el(ElementType::Null, "", 1)) + el(ElementType::Float, "2.5", 4) +
                        el(ElementType::Object, "", 1);
  const auto arr = el(ElementType::Array, children);
  const auto next = int_el("7");
  const auto input = arr + next;

  SpanSource source(as_bytes(input));
  Decoder decoder(source);
  jsonb::codec::ValueBuilder builder;
  TEST_EXPECT_OK(decoder.decode(Shape::Array, builder));
  TEST_EXPECT_EQ(decoder.consumed(), arr.size());

  Value v;
  TEST_EXPECT_OK(builder.take(v));
  const auto* items = v.get_if<jsonb::codec::Array>();
  TEST_EXPECT(items != nullptr);
  if (items) {
    TEST_EXPECT_EQ(items->size(), 5u);
  }

  // 父游标恰好停在数组之后，下一个顶层元素完整可读。
  RecordingVisitor rec;
  TEST_EXPECT_OK(decoder.decode(Shape::I64, rec));
  TEST_EXPECT_EQ(rec.joined(), "i64:7");
  TEST_EXPECT_OK(decoder.finish());
}

void test_child_overrunning_parent_bound() {
  // 数组声明 payload 2 字节，子元素需要 3 字节。
  const std::string bytes = std::string("\x2B", 1) + text_el("ab");
  Value v;
  TEST_EXPECT(decode_value(as_bytes(bytes), v) == errc::malformed_composite);

  // 数组声明长度大于实际输入：截断。
  const std::string truncated = std::string("\x5B", 1) + int_el("1");
  TEST_EXPECT(decode_value(as_bytes(truncated), v) == errc::truncated);
}

void test_truncated_input() {
  Value v;
  TEST_EXPECT(decode_value(bytes_view{}, v) == errc::truncated);
  TEST_EXPECT(decode_value(as_bytes(std::string("\x13", 1)), v) == errc::truncated);
  TEST_EXPECT(decode_value(as_bytes(std::string("\xC7\x05" "a", 3)), v) == errc::truncated);
  TEST_EXPECT(decode_value(as_bytes(std::string("\xF7\x00", 2)), v) == errc::truncated);
}

void test_type_mismatch_diagnostic() {
  const auto input = text_el("12");
  SpanSource source(as_bytes(input));
  Decoder decoder(source);
  RecordingVisitor rec;
  auto ec = decoder.decode(Shape::I32, rec);
  TEST_EXPECT(ec == errc::unexpected_type);
  TEST_EXPECT(decoder.diagnostic().ec == errc::unexpected_type);
  TEST_EXPECT_EQ(decoder.diagnostic().offset, 0u);
  TEST_EXPECT_EQ(decoder.diagnostic().expected, Shape::I32);
  TEST_EXPECT(decoder.diagnostic().actual.has_value());
  TEST_EXPECT(decoder.diagnostic().actual == ElementType::Text);
  TEST_EXPECT(rec.events.empty());

  // 整数与浮点之间不做隐式转换。
  double d = 0.0;
  TEST_EXPECT(from_bytes(as_bytes(int_el("1")), d) == errc::unexpected_type);
  std::int64_t i = 0;
  TEST_EXPECT(from_bytes(as_bytes(el(ElementType::Float, "1.0")), i) == errc::unexpected_type);
  bool b = false;
  TEST_EXPECT(from_bytes(as_bytes(std::string("\x00", 1)), b) == errc::unexpected_type);
}

void test_diagnostic_offset_inside_composite() {
  // [1, reserved] ：出错元素位于偏移 3（数组头 1 + 子元素 2）。
  const auto input = el(ElementType::Array, int_el("1") + std::string("\x0D", 1));
  SpanSource source(as_bytes(input));
  Decoder decoder(source);
  RecordingVisitor rec;
  TEST_EXPECT(decoder.decode(Shape::Any, rec) == errc::unexpected_type);
  TEST_EXPECT_EQ(decoder.diagnostic().offset, 3u);
  TEST_EXPECT(decoder.diagnostic().actual == ElementType::Reserved13);
  TEST_EXPECT_EQ(decoder.diagnostic().expected, Shape::Any);

  // 尾随数据：偏移为尾随数据起点。
  const std::string trailing("\x01\x02", 2);
  SpanSource source2(as_bytes(trailing));
  Decoder decoder2(source2);
  TEST_EXPECT_OK(decoder2.decode(Shape::Bool, rec));
  TEST_EXPECT(decoder2.finish() == errc::trailing_data);
  TEST_EXPECT_EQ(decoder2.diagnostic().offset, 1u);
  TEST_EXPECT(!decoder2.diagnostic().actual.has_value());
}

void test_text_variants() {
  std::string s;
  TEST_EXPECT_OK(from_bytes(as_bytes(text_el("a\\nb")), s));
  TEST_EXPECT_EQ(s, "a\nb");

  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::TextRaw, "a\\nb")), s));
  TEST_EXPECT_EQ(s, "a\\nb");

  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::TextJ, "tab\there")), s));
  TEST_EXPECT_EQ(s, "tab\there");
  TEST_EXPECT(from_bytes(as_bytes(text_el("tab\there")), s) == errc::invalid_literal);

  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Text5, "\\x41\\'")), s));
  TEST_EXPECT_EQ(s, "A'");
  TEST_EXPECT(from_bytes(as_bytes(text_el("\\'")), s) == errc::invalid_literal);

  TEST_EXPECT(from_bytes(as_bytes(el(ElementType::TextRaw, std::string("\xFF", 1))), s) == errc::invalid_utf8);
  TEST_EXPECT(from_bytes(as_bytes(text_el(std::string("\xC3", 1))), s) == errc::invalid_utf8);

  // 长文本走扩展长度头部。
  const std::string long_text(300, 'x');
  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::TextRaw, long_text)), s));
  TEST_EXPECT_EQ(s, long_text);
}

void test_floats() {
  double d = 0.0;
  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Float, "1.5")), d));
  TEST_EXPECT_EQ(d, 1.5);
  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Float, "-2e2")), d));
  TEST_EXPECT_EQ(d, -200.0);
  TEST_EXPECT(from_bytes(as_bytes(el(ElementType::Float, "Infinity")), d) == errc::invalid_literal);
  TEST_EXPECT(from_bytes(as_bytes(el(ElementType::Float, "1e400")), d) == errc::number_overflow);

  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Float5, "-Infinity")), d));
  TEST_EXPECT(std::isinf(d) && d < 0);
  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Float5, ".25")), d));
  TEST_EXPECT_EQ(d, 0.25);

  float f = 0.0f;
  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Float, "0.1")), f));
  TEST_EXPECT_EQ(f, 0.1f);
  TEST_EXPECT(from_bytes(as_bytes(el(ElementType::Float, "1e39")), f) == errc::number_overflow);
}

void test_null_payload_policy() {
  const std::string null_with_payload("\x20xy", 3);
  Value v;
  TEST_EXPECT_OK(decode_value(as_bytes(null_with_payload), v));
  TEST_EXPECT(v.is_null());

  const std::string true_with_payload("\x11z", 2);
  TEST_EXPECT_OK(decode_value(as_bytes(true_with_payload), v));
  TEST_EXPECT(v == Value::boolean(true));

  DecodeOptions strict;
  strict.null_payload = NullPayload::reject;
  TEST_EXPECT(decode_value(as_bytes(null_with_payload), v, strict) == errc::malformed_element);
  TEST_EXPECT(decode_value(as_bytes(true_with_payload), v, strict) == errc::malformed_element);
  TEST_EXPECT_OK(decode_value(as_bytes(std::string("\x02", 1)), v, strict));
  TEST_EXPECT(v == Value::boolean(false));

  // 声明的 payload 超出输入时，排空同样报截断。
  TEST_EXPECT(decode_value(as_bytes(std::string("\x50x", 2)), v) == errc::truncated);
}

std::string nested_arrays(std::size_t depth) {
  std::string bytes = el(ElementType::Array, "");
  for (std::size_t i = 1; i < depth; ++i) {
    bytes = el(ElementType::Array, bytes);
  }
  return bytes;
}

void test_depth_limit() {
  Value v;
  DecodeOptions opt;
  opt.max_depth = 3;
  TEST_EXPECT_OK(decode_value(as_bytes(nested_arrays(3)), v, opt));
  TEST_EXPECT(decode_value(as_bytes(nested_arrays(4)), v, opt) == errc::depth_exceeded);

  TEST_EXPECT_OK(decode_value(as_bytes(nested_arrays(200)), v));
  TEST_EXPECT(decode_value(as_bytes(nested_arrays(300)), v) == errc::depth_exceeded);

  // 对象同样计入深度。
  const auto obj = el(ElementType::Object, text_el("k") + nested_arrays(3));
  TEST_EXPECT(decode_value(as_bytes(obj), v, opt) == errc::depth_exceeded);
}

void test_stream_input() {
  const auto bytes = el(ElementType::Object, text_el("name") + el(ElementType::TextRaw, "jsonb") + text_el("n") +
                                                 el(ElementType::Array, int_el("1") + int_el("-2")));
  std::istringstream in(bytes);
  jsonb::codec::ValueBuilder builder;
  TEST_EXPECT_OK(decode(in, Shape::Object, builder));
  Value v;
  TEST_EXPECT_OK(builder.take(v));
  const auto expected = Value::object({
    Member{"name", Value::string("jsonb")},
    Member{"n", Value::array({Value::integer(1), Value::integer(-2)})},
  });
  TEST_EXPECT(v == expected);

  std::istringstream trailing(bytes + std::string("\x00", 1));
  builder.reset();
  TEST_EXPECT(decode(trailing, Shape::Any, builder) == errc::trailing_data);

  std::istringstream cut(bytes.substr(0, bytes.size() - 1));
  builder.reset();
  TEST_EXPECT(decode(cut, Shape::Any, builder) == errc::truncated);
}

class BrokenBuf final : public std::streambuf {
 protected:
  int_type underflow() override { throw std::runtime_error("read failed"); }
};

void test_stream_io_error_propagates() {
  BrokenBuf buf;
  std::istream in(&buf);
  RecordingVisitor rec;
  TEST_EXPECT(decode(in, Shape::Any, rec) == jsonb::core::errc::io_error);
}

void test_callback_selection() {
  RecordingVisitor rec;
  TEST_EXPECT_OK(decode(as_bytes(int_el("-3")), Shape::I16, rec));
  TEST_EXPECT_EQ(rec.joined(), "i16:-3");

  rec.events.clear();
  TEST_EXPECT_OK(decode(as_bytes(int_el("200")), Shape::U8, rec));
  TEST_EXPECT_EQ(rec.joined(), "u8:200");

  // 未覆写的窄回调转发到 64 位回调。
  rec.events.clear();
  TEST_EXPECT_OK(decode(as_bytes(int_el("5")), Shape::U32, rec));
  TEST_EXPECT_EQ(rec.joined(), "u64:5");

  // 复合类型的子元素按 Any 解码。
  rec.events.clear();
  const auto arr = el(ElementType::Array, int_el("1") + el(ElementType::Object, text_el("k") + el(ElementType::Null, "")) +
                                              el(ElementType::False, ""));
  TEST_EXPECT_OK(decode(as_bytes(arr), Shape::Any, rec));
  TEST_EXPECT_EQ(rec.joined(), "[ i64:1 { key:k null } false ]");
}

void test_visitor_error_propagates() {
  RecordingVisitor rec;
  rec.reject_string = "bad";
  const auto arr = el(ElementType::Array, text_el("ok") + text_el("bad") + text_el("never"));
  auto ec = decode(as_bytes(arr), Shape::Any, rec);
  TEST_EXPECT(ec == std::errc::operation_not_permitted);
  TEST_EXPECT_EQ(rec.joined(), "[ str:ok");
}

void test_from_bytes_targets() {
  bool b = false;
  TEST_EXPECT_OK(from_bytes(as_bytes(std::string("\x01", 1)), b));
  TEST_EXPECT(b);

  std::nullptr_t n = nullptr;
  TEST_EXPECT_OK(from_bytes(as_bytes(std::string("\x00", 1)), n));

  std::string s = "unchanged";
  TEST_EXPECT(from_bytes(as_bytes(int_el("1")), s) == errc::unexpected_type);
  TEST_EXPECT_EQ(s, "unchanged");

  Value v;
  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Array, "")), v));
  TEST_EXPECT(v == Value::array({}));
  TEST_EXPECT_OK(from_bytes(as_bytes(el(ElementType::Object, "")), v));
  TEST_EXPECT(v == Value::object({}));
}

}  // namespace

int main() {
  test_non_canonical_headers_decode_identically();
  test_integer_literal_in_every_width();
  test_extreme_integers();
  test_integer_literal_flavors();
  test_trailing_data();
  test_reserved_tags_rejected();
  test_object_parity();
  test_sub_bound_accounting();
  test_child_overrunning_parent_bound();
  test_truncated_input();
  test_type_mismatch_diagnostic();
  test_diagnostic_offset_inside_composite();
  test_text_variants();
  test_floats();
  test_null_payload_policy();
  test_depth_limit();
  test_stream_input();
  test_stream_io_error_propagates();
  test_callback_selection();
  test_visitor_error_propagates();
  test_from_bytes_targets();
  return ::jsonb::tests::run_and_report();
}
