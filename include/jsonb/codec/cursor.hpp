#pragma once

#include "jsonb/codec/error.hpp"
#include "jsonb/codec/types.hpp"
#include "jsonb/core/byte_source.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace jsonb::codec {

/**
 * @brief 带“剩余字节预算”的顺序读游标。
 *
 * - 根游标直接包装 ByteSource，没有预算上限；
 * - take(n) 返回预算为 n 的子游标，子游标经由父游标读取（不拷贝数据），
 *   因此子游标每消费一个字节，父游标（直至根）的位置同步前进；
 * - 子游标读取超出预算时立即返回 errc::malformed_composite（元素越过了父元素边界），
 *   字节源本身供给不足时返回 errc::truncated，字节源的错误码原样返回。
 *
 * 注意：子游标持有父游标的指针，必须先于父游标销毁；本类不做线程安全保证。
 */
class Cursor final {
 public:
  explicit Cursor(jsonb::core::ByteSource& source) noexcept;

  Cursor(Cursor&&) noexcept = default;
  Cursor(const Cursor&) = delete;
  Cursor& operator=(const Cursor&) = delete;
  Cursor& operator=(Cursor&&) = delete;

  [[nodiscard]] Cursor take(std::size_t limit) noexcept;

  std::error_code read_exact(mutable_bytes_view out) noexcept;
  std::error_code read_u8(byte& out) noexcept;

  /**
   * @brief 读取 bytes（0..8）个字节的大端无符号整数。
   */
  std::error_code read_be_uint(std::size_t bytes, std::uint64_t& out) noexcept;

  /**
   * @brief 读取 n 个字节到 out（覆盖原内容）。分块追加，截断输入不会触发巨量分配。
   */
  std::error_code read_string(std::size_t n, std::string& out);

  std::error_code skip(std::size_t n) noexcept;

  /**
   * @brief 是否已无可读数据。
   *
   * 有预算的游标只看预算；根游标会向字节源探测一个字节（探测到的字节会被缓存，
   * 不会丢失），因此可用于检测尾随数据。
   */
  std::error_code at_end(bool& out) noexcept;

  [[nodiscard]] bool bounded() const noexcept { return bounded_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return remaining_; }
  [[nodiscard]] bool exhausted() const noexcept { return bounded_ && remaining_ == 0; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

 private:
  Cursor(Cursor* parent, std::size_t limit) noexcept;

  std::error_code pull(mutable_bytes_view out) noexcept;

  jsonb::core::ByteSource* source_{nullptr};
  Cursor* parent_{nullptr};
  bool bounded_{false};
  std::size_t remaining_{0};
  std::size_t consumed_{0};
  std::optional<byte> peeked_{};
};

}  // namespace jsonb::codec
