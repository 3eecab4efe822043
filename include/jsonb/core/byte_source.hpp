#pragma once

#include "jsonb/core/common.hpp"
#include "jsonb/core/error.hpp"

#include <cstddef>
#include <istream>
#include <system_error>
#include <vector>

namespace jsonb::core {

/**
 * @brief 顺序只读字节源（解码器唯一的输入抽象）。
 *
 * 约定：
 * - read_some 至多读取 out.size() 字节，实际读取数写入 n；
 * - 返回成功且 n==0 表示输入已结束；
 * - 底层失败返回 core::errc::io_error（或实现自身的错误码），解码器原样向上传递。
 *
 * 注意：字节源不要求可回退；解码失败后源的位置不保证处于任何“安全点”。
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept = 0;
};

/**
 * @brief 基于内存缓冲区的字节源（不拷贝，调用方保证 in 的生命周期）。
 */
class SpanSource final : public ByteSource {
 public:
  explicit SpanSource(bytes_view in) noexcept : in_(in) {}

  std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept override;

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

struct StreamSourceOptions final {
  // 每次从 istream 预读的字节数（0 会按 1 处理）。
  std::size_t chunk_size{kDefaultStreamChunkSize};
};

/**
 * @brief 基于 std::istream 的字节源（带块预读）。
 *
 * 由于预读，istream 的读位置可能越过解码器实际消费的位置。
 * istream 的 badbit、或非 EOF 引起的 failbit 都会映射为 core::errc::io_error；
 * 若 istream 开启了异常掩码，读取时抛出的异常（ios_base::failure 或 streambuf 的原始异常）同样映射为 io_error。
 */
class StreamSource final : public ByteSource {
 public:
  explicit StreamSource(std::istream& in, StreamSourceOptions options = {});

  StreamSource(const StreamSource&) = delete;
  StreamSource& operator=(const StreamSource&) = delete;

  std::error_code read_some(mutable_bytes_view out, std::size_t& n) noexcept override;

 private:
  std::error_code fill() noexcept;

  std::istream& in_;
  std::vector<byte> chunk_;
  std::size_t pos_{0};
  std::size_t end_{0};
  bool eof_{false};
};

}  // namespace jsonb::core
