#include "benc/core/log.hpp"

#include "core/log_internal.hpp"

#include <array>
#include <cstddef>

namespace benc::core {
namespace {

// LogLevel 与 spdlog 级别一一对应（下标即 LogLevel 的数值）。
constexpr std::array<spdlog::level::level_enum, 7> kSpdlogLevels{
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index >= kSpdlogLevels.size()) {
        return spdlog::level::off;
    }
    return kSpdlogLevels[index];
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < kSpdlogLevels.size(); ++i) {
        if (kSpdlogLevels[i] == level) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::off;
}

} // namespace

namespace detail {

spdlog::logger &logger() noexcept {
    // 复用 spdlog 的默认 logger：业务侧替换默认 logger（sink/pattern）后，
    // 本库日志会自动跟随。
    return *spdlog::default_logger_raw();
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept {
    return from_spdlog_level(detail::logger().level());
}

} // namespace benc::core
