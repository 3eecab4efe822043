#pragma once

#include "jsonb/core/common.hpp"

#include <cstddef>
#include <cstdint>

namespace jsonb::codec {

using byte = jsonb::core::byte;
using bytes_view = jsonb::core::bytes_view;
using mutable_bytes_view = jsonb::core::mutable_bytes_view;

/**
 * @brief JSONB 元素类型（头部首字节的低 4 位）。
 *
 * Reserved13/14/15 在合法输入中永远不会出现，遇到即解码失败。
 */
enum class ElementType : std::uint8_t {
  Null = 0,
  True = 1,
  False = 2,
  Int = 3,
  Int5 = 4,
  Float = 5,
  Float5 = 6,
  Text = 7,
  TextJ = 8,
  Text5 = 9,
  TextRaw = 10,
  Array = 11,
  Object = 12,
  Reserved13 = 13,
  Reserved14 = 14,
  Reserved15 = 15,
};

/**
 * @brief 调用方期望的值形状。
 *
 * Any 表示“由元素自身决定”（数组/对象的子元素总是以 Any 解码）；
 * 其余取值要求元素类型与之匹配，否则报 errc::unexpected_type，不做跨族隐式转换。
 */
enum class Shape : std::uint8_t {
  Any,
  Null,
  Bool,
  I8,
  I16,
  I32,
  I64,
  U8,
  U16,
  U32,
  U64,
  F32,
  F64,
  String,
  Array,
  Object,
};

/**
 * @brief 单个元素的头部。
 *
 * payload_size 是精确值：标量必须恰好读取这么多字节，复合类型的子元素必须恰好填满它。
 * header_size 为头部本身占用的字节数（1/2/3/5/9）。
 */
struct Header final {
  ElementType type{ElementType::Null};
  std::size_t payload_size{0};
  std::size_t header_size{1};

  friend bool operator==(const Header&, const Header&) = default;
};

// 复合类型默认最大嵌套层数：防止恶意输入构造极深嵌套导致栈溢出。
inline constexpr std::size_t kDefaultMaxDepth = 256;

[[nodiscard]] constexpr ElementType element_type_from_bits(std::uint8_t bits) noexcept {
  return static_cast<ElementType>(bits & 0x0Fu);
}

[[nodiscard]] constexpr bool is_reserved(ElementType t) noexcept {
  return t == ElementType::Reserved13 || t == ElementType::Reserved14 || t == ElementType::Reserved15;
}

[[nodiscard]] constexpr bool is_text(ElementType t) noexcept {
  return t == ElementType::Text || t == ElementType::TextJ || t == ElementType::Text5 ||
         t == ElementType::TextRaw;
}

[[nodiscard]] constexpr bool is_composite(ElementType t) noexcept {
  return t == ElementType::Array || t == ElementType::Object;
}

[[nodiscard]] const char* element_type_name(ElementType t) noexcept;
[[nodiscard]] const char* shape_name(Shape s) noexcept;

/**
 * @brief 判断期望形状是否接受该元素类型（保留类型对任何形状都返回 false）。
 */
[[nodiscard]] bool shape_accepts(Shape expected, ElementType actual) noexcept;

}  // namespace jsonb::codec
