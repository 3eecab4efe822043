#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace jsonb::codec {

/**
 * @brief 值构造接口：解码器只面向该接口输出，不依赖任何具体的值类型。
 *
 * 调用顺序：
 * - 标量：恰好一次 on_xxx；
 * - 数组：begin_array，随后每个元素一次（可递归），最后 end_array；
 * - 对象：begin_object，随后交替 on_key / 值，最后 end_object；键按出现顺序给出，
 *   重复键原样传递，是否去重由实现决定。
 *
 * 任一回调返回非零 error_code 会立即中止整个解码，并原样返回给调用方。
 * on_string / on_key 的 string_view 只在回调期间有效。
 */
class Visitor {
 public:
  virtual ~Visitor() = default;

  virtual std::error_code on_null() = 0;
  virtual std::error_code on_bool(bool value) = 0;
  virtual std::error_code on_i64(std::int64_t value) = 0;
  virtual std::error_code on_u64(std::uint64_t value) = 0;
  virtual std::error_code on_f64(double value) = 0;
  virtual std::error_code on_string(std::string_view value) = 0;

  virtual std::error_code begin_array() = 0;
  virtual std::error_code end_array() = 0;

  virtual std::error_code begin_object() = 0;
  virtual std::error_code on_key(std::string_view key) = 0;
  virtual std::error_code end_object() = 0;

  // 窄宽度默认转发到 64 位回调；需要区分宽度时重写。
  virtual std::error_code on_i8(std::int8_t value) { return on_i64(value); }
  virtual std::error_code on_i16(std::int16_t value) { return on_i64(value); }
  virtual std::error_code on_i32(std::int32_t value) { return on_i64(value); }
  virtual std::error_code on_u8(std::uint8_t value) { return on_u64(value); }
  virtual std::error_code on_u16(std::uint16_t value) { return on_u64(value); }
  virtual std::error_code on_u32(std::uint32_t value) { return on_u64(value); }
  virtual std::error_code on_f32(float value) { return on_f64(value); }
};

}  // namespace jsonb::codec
