#pragma once

#include "jsonb/literal/error.hpp"
#include "jsonb/literal/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace jsonb::literal {

/**
 * @brief 反转义字符串字面量的“正文”（不含两侧引号），结果写入 out（覆盖原内容）。
 *
 * - json：仅标准转义 \" \\ \/ \b \f \n \r \t \uXXXX；拒绝未转义的控制字符（< 0x20）与双引号；
 * - json_lenient：转义集合同 json，但容忍未转义的控制字符与双引号；
 * - json5：在 json 基础上增加 \' \v \0（后面不能紧跟数字）、\xHH、续行
 *   （反斜杠后接 LF、CR、CRLF、U+2028、U+2029）以及任意非数字字符的恒等转义。
 *
 * \u 代理对会被合并，孤立代理返回 errc::invalid_escape。
 * 结果必须是合法 UTF-8，否则返回 errc::invalid_utf8。
 */
std::error_code unescape_string(std::string_view body, Flavor flavor, std::string& out);

/**
 * @brief 校验 UTF-8（拒绝过长编码、代理区码点与超出 U+10FFFF 的码点）。
 */
std::error_code validate_utf8(std::string_view text) noexcept;

/**
 * @brief 将码点以 UTF-8 追加到 out（调用方保证 cp 不是代理且不超过 U+10FFFF）。
 */
void append_utf8(std::uint32_t cp, std::string& out);

}  // namespace jsonb::literal
