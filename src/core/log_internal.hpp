#pragma once

// 库内部使用的日志入口（不安装、不出现在 public headers 中）。

#include <spdlog/spdlog.h>

namespace benc::core::detail {

[[nodiscard]] spdlog::logger &logger() noexcept;

} // namespace benc::core::detail
