#pragma once

#include <spdlog/spdlog.h>

namespace jsonb::core::detail {

// 库内共享的 logger（名称 "jsonb"，输出到 stderr）。仅供 src/ 内部使用。
spdlog::logger &logger() noexcept;

} // namespace jsonb::core::detail
