#pragma once

#include <cstdint>

namespace jsonb::literal {

/**
 * @brief 字面量方言。
 *
 * - json：严格 JSON（RFC 8259）；
 * - json_lenient：转义集合与 json 相同，但容忍未转义的控制字符与双引号；
 * - json5：JSON5 超集（数字：+ 号、十六进制、前后小数点、Infinity/NaN；
 *   字符串：\' \v \0 \xHH、续行、任意非数字字符的恒等转义）。
 */
enum class Flavor : std::uint8_t {
  json,
  json_lenient,
  json5,
};

}  // namespace jsonb::literal
