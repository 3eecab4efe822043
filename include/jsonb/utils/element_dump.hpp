#pragma once

#include "jsonb/core/common.hpp"

#include <cstddef>
#include <string>

namespace jsonb::utils {

/**
 * @brief JSONB 字节流的结构化列表（调试/抓包分析用途）。
 *
 * 每个元素输出一行：偏移、元素类型、头部字节数、payload 字节数；
 * 标量的 payload 原样（按可打印字符转义）附在行尾，复合类型的子元素缩进列出。
 *
 * 说明：
 * - 只解析头部与边界，不解释字面量，也不是 JSON 重新序列化；
 * - 遇到非法输入时输出一行 "<error: ...>" 并停止；
 * - 顶层可以连续列出多个元素（便于观察尾随数据）。
 */
struct ElementDumpOptions final {
    // 递归最大深度（超出部分只输出复合元素自身，不再展开）。
    std::size_t max_depth{32};

    // 标量 payload 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{64};

    // 每层缩进空格数。
    std::size_t indent_spaces{2};
};

[[nodiscard]] std::string dump_elements(jsonb::core::bytes_view bytes,
                                        ElementDumpOptions options = {});

} // namespace jsonb::utils
