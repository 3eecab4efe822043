#include "jsonb/core/log.hpp"

#include "core/log_internal.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace jsonb::core {
namespace {

constexpr const char *kLoggerName = "jsonb";

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    default:
        return LogLevel::off;
    }
}

std::shared_ptr<spdlog::logger> make_logger() noexcept {
    // 业务侧可能已经以同名注册了自己的 logger（例如改成文件 sink），优先复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    try {
        return spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex &) {
        // 并发注册时另一方已经抢先完成。
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        return spdlog::default_logger();
    }
}

} // namespace

namespace detail {

spdlog::logger &logger() noexcept {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    detail::logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger().level()); }

} // namespace jsonb::core
