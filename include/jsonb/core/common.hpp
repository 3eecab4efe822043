#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace jsonb::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// StreamSource 每次从 std::istream 预读的块大小。
inline constexpr std::size_t kDefaultStreamChunkSize = 4 * 1024;

// 跳过/读取 payload 时单次搬运的字节数上限：
// 声明长度极大但实际输入很短时，先报截断而不是先分配巨量内存。
inline constexpr std::size_t kPayloadReadChunk = 4 * 1024;

}  // 命名空间 jsonb::core
