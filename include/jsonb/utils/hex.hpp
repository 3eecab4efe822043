#pragma once

#include "jsonb/core/common.hpp"
#include "jsonb/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace jsonb::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 测试与示例里用 “c3 01 31” 或 "\xc3\x01\x31" 这样的文本书写 JSONB 字节；
 * - 将 bytes 以 hexdump 形式输出，便于人工核对头部与 payload。
 */

struct HexDumpOptions final {
    // 每行字节数（0 按 16 处理）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏：JSONB 的标量 payload 都是文本，打开后可以直接读出字面量。
    bool show_ascii{true};
};

[[nodiscard]] std::string hex_dump(jsonb::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 解析 16 进制文本为 bytes（覆盖 out 原内容）。
 *
 * 支持：
 * - 大小写 hex，两位一组；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号、引号；
 * - 每组可带 0x/0X 或 \x 前缀（便于直接粘贴字节串字面量）。
 *
 * 出现其它字符或 nibble 数为奇数时返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<jsonb::core::byte> &out) noexcept;

} // namespace jsonb::utils
