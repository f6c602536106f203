#pragma once

#include "benc/codec/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace benc::codec {

/**
 * @brief 解码错误类型（封闭集合，所有畸形输入都落在其中之一）。
 */
enum class errc : int {
  ok = 0,
  unexpected_eof = 1,            // 标量（长度前缀/字节串/整数）中途输入结束，或输入为空
  invalid_length = 2,            // 长度前缀畸形：前导 0、非数字、超出 size_t
  invalid_integer = 3,           // 整数畸形：无数字、非数字、前导 0、"-0"
  invalid_type_prefix = 4,       // 首字节不对应任何产生式
  unterminated_container = 5,    // List/Dictionary 在元素边界处输入结束（缺少 'e'）
  non_string_dict_key = 6,       // 字典 key 位置不是字节串
  unsorted_or_duplicate_key = 7, // 字典 key 未严格升序
  trailing_data = 8,             // 顶层值之后仍有剩余字节
  nesting_too_deep = 9,          // 嵌套层数超过 DecodeLimits::max_depth
  integer_overflow = 10,         // 整数超出 int64 范围
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 错误是否表示“输入提前结束”（unexpected_eof / unterminated_container）。
 */
[[nodiscard]] bool is_truncation(const std::error_code& ec) noexcept;

inline constexpr std::size_t kDefaultMaxDepth = 64;

/**
 * @brief 解码资源限制（用于不可信输入）。
 *
 * max_depth 为同时打开的 List/Dictionary 数量上限：
 * - 打开第 max_depth + 1 层容器前即返回 errc::nesting_too_deep，不再继续递归；
 * - max_depth = 0 表示只接受标量。
 */
struct DecodeLimits final {
  std::size_t max_depth{kDefaultMaxDepth};
};

/**
 * @brief 计算 Value 编码后的字节数。
 */
[[nodiscard]] std::size_t encoded_size(const Value& value) noexcept;

/**
 * @brief 编码 Value 并追加到 out（内部一次性 reserve，避免反复 realloc）。
 *
 * 字典总是按 key 字节序输出，与插入顺序无关；对任意 Value 都不会失败。
 */
void encode(const Value& value, std::vector<byte>& out);

[[nodiscard]] std::vector<byte> encode(const Value& value);

/**
 * @brief 编码 Value 到固定缓冲区。
 *
 * 注意：
 * - out 过小会返回 core::errc::buffer_overflow，此时 written 为 0
 * - 成功时 written 为写入字节数
 * - 非升序插入的字典需要临时排序数组，内存不足时 std::terminate
 */
std::error_code encode_to(mutable_bytes_view out, const Value& value, std::size_t& written) noexcept;

/**
 * @brief 解码整个输入缓冲区为一个 Value。
 *
 * 成功时 out 被替换为解码结果；失败时 out 保持不变（不会留下半棵树），
 * 返回遇到的第一个错误。顶层值之后的多余字节视为 errc::trailing_data。
 */
std::error_code decode(bytes_view in, Value& out, const DecodeLimits& limits = {}) noexcept;

/**
 * @brief 从输入缓冲区头部解码一个 Value。
 *
 * 与 decode 的区别：顶层值之后允许有剩余字节，consumed 为该值占用的字节数，
 * 可用于遍历首尾相接的多个值。失败时 consumed 为 0、out 保持不变。
 */
std::error_code decode_one(
  bytes_view in,
  Value& out,
  std::size_t& consumed,
  const DecodeLimits& limits = {}) noexcept;

}  // namespace benc::codec

namespace std {
template <>
struct is_error_code_enum<benc::codec::errc> : true_type {};
}  // namespace std
