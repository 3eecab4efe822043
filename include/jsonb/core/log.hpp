#pragma once

#include <cstdint>

namespace jsonb::core {

/**
 * @brief 日志级别（控制库内名为 "jsonb" 的 spdlog logger）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 解码器在拒绝输入时输出 debug 日志，逐个元素头部输出 trace 日志；
 * - 日志只用于排查问题，不影响解码结果。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace jsonb::core
