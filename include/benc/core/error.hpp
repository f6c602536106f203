#pragma once

#include <system_error>

namespace benc::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有接口优先返回 std::error_code，避免异常路径。
 * - 解码相关的错误在 benc::codec::errc 中单独定义，这里只放与格式无关的错误：
 *   - buffer_overflow：调用方提供的固定输出缓冲区不足
 *   - invalid_argument：工具函数的文本输入非法（例如 16 进制字符串）
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,
  invalid_argument = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace benc::core

namespace std {
template <>
struct is_error_code_enum<benc::core::errc> : true_type {};
}  // namespace std
