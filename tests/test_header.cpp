#include "jsonb/codec/error.hpp"
#include "jsonb/codec/header.hpp"
#include "jsonb/codec/types.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace {

using jsonb::codec::byte;
using jsonb::codec::bytes_view;
using jsonb::codec::decode_header;
using jsonb::codec::ElementType;
using jsonb::codec::errc;
using jsonb::codec::Header;
using jsonb::codec::header_size_for;
using jsonb::codec::Shape;

Header decode_ok(std::initializer_list<int> raw) {
  std::vector<byte> bytes;
  for (int b : raw) {
    bytes.push_back(static_cast<byte>(b));
  }
  Header h;
  TEST_EXPECT_OK(decode_header(bytes_view{bytes.data(), bytes.size()}, h));
  return h;
}

std::error_code decode_err(std::initializer_list<int> raw) {
  std::vector<byte> bytes;
  for (int b : raw) {
    bytes.push_back(static_cast<byte>(b));
  }
  Header h;
  return decode_header(bytes_view{bytes.data(), bytes.size()}, h);
}

void test_header_size_for() {
  static_assert(header_size_for(0x00) == 1);
  static_assert(header_size_for(0xB7) == 1);
  static_assert(header_size_for(0xC7) == 2);
  static_assert(header_size_for(0xD7) == 3);
  static_assert(header_size_for(0xE7) == 5);
  static_assert(header_size_for(0xF7) == 9);
  TEST_EXPECT_EQ(header_size_for(0x13), 1u);
}

void test_inline_sizes() {
  TEST_EXPECT((decode_ok({0x00}) == Header{ElementType::Null, 0, 1}));
  TEST_EXPECT((decode_ok({0x13}) == Header{ElementType::Int, 1, 1}));
  TEST_EXPECT((decode_ok({0xB7}) == Header{ElementType::Text, 11, 1}));
  TEST_EXPECT((decode_ok({0x0B}) == Header{ElementType::Array, 0, 1}));
}

void test_extended_sizes_big_endian() {
  TEST_EXPECT((decode_ok({0xC7, 0x0C}) == Header{ElementType::Text, 12, 2}));
  TEST_EXPECT((decode_ok({0xDB, 0x01, 0x00}) == Header{ElementType::Array, 256, 3}));
  TEST_EXPECT((decode_ok({0xEC, 0x00, 0x01, 0x00, 0x00}) == Header{ElementType::Object, 65536, 5}));
  TEST_EXPECT((decode_ok({0xF3, 0, 0, 0, 0, 0, 0, 0, 0x01}) == Header{ElementType::Int, 1, 9}));
}

// 非最简编码同样合法。
void test_non_canonical_headers() {
  TEST_EXPECT((decode_ok({0xC3, 0x01}) == Header{ElementType::Int, 1, 2}));
  TEST_EXPECT((decode_ok({0xD3, 0x00, 0x01}) == Header{ElementType::Int, 1, 3}));
  TEST_EXPECT((decode_ok({0xE0, 0, 0, 0, 0}) == Header{ElementType::Null, 0, 5}));
}

void test_reserved_types_are_reported() {
  TEST_EXPECT_EQ(decode_ok({0x0D}).type, ElementType::Reserved13);
  TEST_EXPECT_EQ(decode_ok({0x0E}).type, ElementType::Reserved14);
  TEST_EXPECT_EQ(decode_ok({0x0F}).type, ElementType::Reserved15);
  TEST_EXPECT(jsonb::codec::is_reserved(ElementType::Reserved14));
  TEST_EXPECT(!jsonb::codec::is_reserved(ElementType::Object));
}

void test_truncated_headers() {
  TEST_EXPECT(decode_err({}) == errc::truncated);
  TEST_EXPECT(decode_err({0xC7}) == errc::truncated);
  TEST_EXPECT(decode_err({0xD7, 0x00}) == errc::truncated);
  TEST_EXPECT(decode_err({0xF7, 0, 0, 0, 0, 0, 0, 0}) == errc::truncated);
}

void test_type_names_and_shapes() {
  TEST_EXPECT_EQ(std::string_view(jsonb::codec::element_type_name(ElementType::TextRaw)), "textraw");
  TEST_EXPECT_EQ(std::string_view(jsonb::codec::element_type_name(ElementType::Reserved15)), "reserved15");
  TEST_EXPECT_EQ(std::string_view(jsonb::codec::shape_name(Shape::U16)), "u16");

  using jsonb::codec::shape_accepts;
  TEST_EXPECT(shape_accepts(Shape::Any, ElementType::Object));
  TEST_EXPECT(!shape_accepts(Shape::Any, ElementType::Reserved13));
  TEST_EXPECT(shape_accepts(Shape::Bool, ElementType::False));
  TEST_EXPECT(!shape_accepts(Shape::Bool, ElementType::Null));
  TEST_EXPECT(shape_accepts(Shape::I8, ElementType::Int5));
  TEST_EXPECT(!shape_accepts(Shape::I64, ElementType::Float));
  TEST_EXPECT(shape_accepts(Shape::F32, ElementType::Float5));
  TEST_EXPECT(!shape_accepts(Shape::F64, ElementType::Int));
  TEST_EXPECT(shape_accepts(Shape::String, ElementType::TextJ));
  TEST_EXPECT(!shape_accepts(Shape::String, ElementType::Array));
  TEST_EXPECT(shape_accepts(Shape::Null, ElementType::Null));
}

}  // namespace

int main() {
  test_header_size_for();
  test_inline_sizes();
  test_extended_sizes_big_endian();
  test_non_canonical_headers();
  test_reserved_types_are_reported();
  test_truncated_headers();
  test_type_names_and_shapes();
  return ::jsonb::tests::run_and_report();
}
