#pragma once

#include "jsonb/codec/cursor.hpp"
#include "jsonb/codec/types.hpp"

#include <cstddef>
#include <system_error>

namespace jsonb::codec {

/**
 * @brief 根据头部首字节计算头部总长度（1/2/3/5/9）。
 *
 * 首字节高 4 位：
 * - 0..11：payload_size 就是该值本身，头部 1 字节；
 * - 12/13/14/15：其后 1/2/4/8 字节为大端无符号 payload_size。
 */
[[nodiscard]] constexpr std::size_t header_size_for(byte first) noexcept {
  switch (first >> 4) {
    case 12:
      return 2;
    case 13:
      return 3;
    case 14:
      return 5;
    case 15:
      return 9;
    default:
      return 1;
  }
}

/**
 * @brief 从游标读取一个元素头部（恰好消费 header_size 字节）。
 *
 * 非最简编码（例如用 0xF3 + 8 字节长度描述 1 字节 payload）同样合法，不做拒绝。
 * 保留类型在此处照常返回，由调用方决定报错；声明长度超过剩余输入不在此校验，
 * 由后续读取 payload 时报告。
 */
std::error_code read_header(Cursor& in, Header& out) noexcept;

/**
 * @brief 从内存缓冲区解析一个元素头部（不消费 payload）。
 */
std::error_code decode_header(bytes_view in, Header& out) noexcept;

}  // namespace jsonb::codec
