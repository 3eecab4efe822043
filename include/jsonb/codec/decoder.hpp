#pragma once

#include "jsonb/codec/cursor.hpp"
#include "jsonb/codec/error.hpp"
#include "jsonb/codec/types.hpp"
#include "jsonb/codec/value.hpp"
#include "jsonb/codec/visitor.hpp"
#include "jsonb/core/byte_source.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace jsonb::codec {

/**
 * @brief Null/True/False 元素携带非零 payload 时的处理策略。
 */
enum class NullPayload : std::uint8_t {
  drain,   // 读掉并忽略（默认，兼容宽松的写入方）
  reject,  // 报 errc::malformed_element
};

struct DecodeOptions final {
  // 复合类型最大嵌套层数（顶层数组算第 1 层）。
  std::size_t max_depth{kDefaultMaxDepth};

  NullPayload null_payload{NullPayload::drain};

  // 顶层入口（decode/decode_value/from_bytes）解出一个值后是否调用 finish() 检查尾随数据。
  bool check_trailing{true};
};

/**
 * @brief 最近一次失败的诊断信息。
 *
 * offset 为出错元素头部在输入中的字节偏移（尾随数据错误时为尾随数据的起点）；
 * actual 在头部已成功读出时给出实际元素类型。
 */
struct Diagnostic final {
  std::error_code ec{};
  std::size_t offset{0};
  Shape expected{Shape::Any};
  std::optional<ElementType> actual{};
};

/**
 * @brief JSONB 解码器（拉取式、单线程、递归下降）。
 *
 * 用法：
 * - decode(shape, visitor) 解出一个元素并驱动 visitor；
 * - finish() 检查输入是否已耗尽（尾随数据报 errc::trailing_data），不受 check_trailing 影响。
 *
 * 任一错误都会中止整个解码，不产生部分结果；失败后字节源的位置不做保证。
 * 每个 Decoder 独占一个字节源；并行解码多个文档时各自创建实例即可。
 */
class Decoder final {
 public:
  explicit Decoder(jsonb::core::ByteSource& source, DecodeOptions options = {}) noexcept;

  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  std::error_code decode(Shape expected, Visitor& visitor);
  std::error_code finish();

  [[nodiscard]] const Diagnostic& diagnostic() const noexcept { return diagnostic_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return root_.consumed(); }
  [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }

 private:
  // 已读出头部的元素：offset 为头部偏移，expected 为调用方要求的形状。
  struct Element final {
    Header header;
    std::size_t offset{0};
    Shape expected{Shape::Any};
  };

  std::error_code decode_element(Cursor& in, Shape expected, Visitor& visitor, std::size_t depth);
  std::error_code decode_unit(Cursor& in, const Element& e, Visitor& visitor);
  std::error_code decode_integer(Cursor& in, const Element& e, Visitor& visitor);
  std::error_code decode_floating(Cursor& in, const Element& e, Visitor& visitor);
  std::error_code decode_text(Cursor& in, const Element& e, std::string& out);
  std::error_code decode_array(Cursor& in, const Element& e, Visitor& visitor, std::size_t depth);
  std::error_code decode_object(Cursor& in, const Element& e, Visitor& visitor, std::size_t depth);

  std::error_code fail(std::error_code ec,
                       std::size_t offset,
                       Shape expected,
                       std::optional<ElementType> actual);
  std::error_code fail(std::error_code ec, const Element& e);

  Cursor root_;
  DecodeOptions options_{};
  Diagnostic diagnostic_{};
  std::string payload_;
  std::string text_;
};

/**
 * @brief 从内存缓冲区解码恰好一个顶层值（check_trailing 时拒绝尾随数据）。
 */
std::error_code decode(bytes_view in, Shape expected, Visitor& visitor, DecodeOptions options = {});

/**
 * @brief 从 std::istream 解码恰好一个顶层值（check_trailing 时拒绝尾随数据）。
 */
std::error_code decode(std::istream& in, Shape expected, Visitor& visitor, DecodeOptions options = {});

/**
 * @brief 解码为 Value（形状为 Any）。
 */
std::error_code decode_value(bytes_view in, Value& out, DecodeOptions options = {});

namespace detail {

template <class T>
constexpr Shape shape_for() noexcept {
  if constexpr (std::is_same_v<T, bool>) {
    return Shape::Bool;
  } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
    static_assert(sizeof(T) <= 8, "unsupported integer width");
    if constexpr (sizeof(T) == 1) {
      return Shape::I8;
    } else if constexpr (sizeof(T) == 2) {
      return Shape::I16;
    } else if constexpr (sizeof(T) == 4) {
      return Shape::I32;
    } else {
      return Shape::I64;
    }
  } else if constexpr (std::is_integral_v<T>) {
    static_assert(sizeof(T) <= 8, "unsupported integer width");
    if constexpr (sizeof(T) == 1) {
      return Shape::U8;
    } else if constexpr (sizeof(T) == 2) {
      return Shape::U16;
    } else if constexpr (sizeof(T) == 4) {
      return Shape::U32;
    } else {
      return Shape::U64;
    }
  } else if constexpr (std::is_same_v<T, float>) {
    return Shape::F32;
  } else if constexpr (std::is_same_v<T, double>) {
    return Shape::F64;
  } else if constexpr (std::is_same_v<T, std::string>) {
    return Shape::String;
  } else {
    static_assert(std::is_same_v<T, std::nullptr_t>, "unsupported target type");
    return Shape::Null;
  }
}

/**
 * @brief 把单个标量回调写入 T 的 Visitor（供 from_bytes 使用）。
 *
 * 解码器已按 shape_for<T>() 选择回调，因此这里的数值转换不会丢失精度。
 */
template <class T>
class ScalarSink final : public Visitor {
 public:
  explicit ScalarSink(T& out) noexcept : out_(out) {}

  std::error_code on_null() override {
    if constexpr (std::is_same_v<T, std::nullptr_t>) {
      out_ = nullptr;
      return {};
    } else {
      return make_error_code(errc::visitor_rejected);
    }
  }
  std::error_code on_bool(bool value) override { return store(value); }
  std::error_code on_i64(std::int64_t value) override { return store(value); }
  std::error_code on_u64(std::uint64_t value) override { return store(value); }
  std::error_code on_f64(double value) override { return store(value); }
  std::error_code on_f32(float value) override { return store(value); }

  std::error_code on_string(std::string_view value) override {
    if constexpr (std::is_same_v<T, std::string>) {
      out_.assign(value);
      return {};
    } else {
      return make_error_code(errc::visitor_rejected);
    }
  }

  std::error_code begin_array() override { return make_error_code(errc::visitor_rejected); }
  std::error_code end_array() override { return make_error_code(errc::visitor_rejected); }
  std::error_code begin_object() override { return make_error_code(errc::visitor_rejected); }
  std::error_code on_key(std::string_view) override { return make_error_code(errc::visitor_rejected); }
  std::error_code end_object() override { return make_error_code(errc::visitor_rejected); }

 private:
  template <class V>
  std::error_code store(V value) {
    if constexpr (std::is_arithmetic_v<T> && std::is_same_v<V, bool> == std::is_same_v<T, bool>) {
      out_ = static_cast<T>(value);
      return {};
    } else {
      return make_error_code(errc::visitor_rejected);
    }
  }

  T& out_;
};

}  // namespace detail

/**
 * @brief 把 in 解码为单个 C++ 值：整数/浮点/bool/std::string/std::nullptr_t/Value。
 *
 * 整数宽度按 sizeof(T) 选择对应形状，超出范围报 errc::number_overflow。
 */
template <class T>
std::error_code from_bytes(bytes_view in, T& out, DecodeOptions options = {}) {
  if constexpr (std::is_same_v<T, Value>) {
    return decode_value(in, out, options);
  } else {
    T tmp{};
    detail::ScalarSink<T> sink(tmp);
    auto ec = decode(in, detail::shape_for<T>(), sink, options);
    if (ec) {
      return ec;
    }
    out = std::move(tmp);
    return {};
  }
}

}  // namespace jsonb::codec
