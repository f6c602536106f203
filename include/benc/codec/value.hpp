#pragma once

#include "benc/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace benc::codec {

using byte = benc::core::byte;
using bytes_view = benc::core::bytes_view;
using mutable_bytes_view = benc::core::mutable_bytes_view;

class Value;
using List = std::vector<Value>;

/**
 * @brief 字节串（不要求可打印，也不要求是合法 UTF-8）。
 *
 * 使用 std::string 承载：允许包含 '\\0'，长度即内容长度，不单独存储。
 */
struct ByteString final {
  std::string value;
  friend bool operator==(const ByteString&, const ByteString&) = default;
};

/**
 * @brief 有符号 64 位整数。
 *
 * 超出 int64 范围的数值在内存模型中不可表示；解码时遇到会返回
 * errc::integer_overflow，而不是静默回绕。
 */
struct Integer final {
  std::int64_t value{0};
  friend bool operator==(const Integer&, const Integer&) = default;
};

/**
 * @brief 字典：字节串 key -> Value，key 唯一。
 *
 * 约定：
 * - 内存中按插入顺序保存（解码得到的字典天然是升序）；
 * - insert 遇到已存在的 key 时原地替换 value，不改变其位置；
 * - 编码器不依赖插入顺序，而是通过 sorted_entries() 按 key 的无符号字节序输出；
 * - 相等比较与插入顺序无关。
 *
 * 注意：成员函数全部在 value.cpp 中定义（此处 Value 仍是不完整类型）。
 */
class Dictionary final {
 public:
  using entry_type = std::pair<std::string, Value>;
  using container_type = std::vector<entry_type>;
  using const_iterator = container_type::const_iterator;

  Dictionary();
  Dictionary(const Dictionary& other);
  Dictionary(Dictionary&& other) noexcept;
  Dictionary& operator=(const Dictionary& other);
  Dictionary& operator=(Dictionary&& other) noexcept;
  ~Dictionary();

  /**
   * @brief 插入或替换；返回 true 表示新增了 key。
   */
  bool insert(std::string key, Value value);

  [[nodiscard]] const Value* find(std::string_view key) const noexcept;
  [[nodiscard]] bool contains(std::string_view key) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;

  /**
   * @brief 按 key 的字节序（无符号、字典序）升序返回条目指针。
   *
   * 指针指向本对象内部存储，在下一次 insert 之前有效。
   */
  [[nodiscard]] std::vector<const entry_type*> sorted_entries() const;

  void reserve(std::size_t n);

  friend bool operator==(const Dictionary& lhs, const Dictionary& rhs) noexcept;
  friend bool operator!=(const Dictionary& lhs, const Dictionary& rhs) noexcept { return !(lhs == rhs); }

 private:
  container_type entries_;

  // entries_ 目前是否按 key 严格升序（解码路径始终成立）。
  // 成立时 insert 末尾追加、find 二分查找都无需线性扫描。
  bool ascending_{true};
};

enum class ValueKind : std::uint8_t {
  byte_string = 0,
  integer = 1,
  list = 2,
  dictionary = 3,
};

/**
 * @brief bencode 数据值（封闭的四选一类型，支持嵌套 List/Dictionary）。
 *
 * 约定：
 * - 每个 Value 独占其子节点（值语义），整棵树随根节点析构；
 * - 语法没有引用结构，因此不存在共享或环；
 * - 不提供默认构造：Value 永远是四种形态之一。
 */
class Value final {
 public:
  using storage_type = std::variant<ByteString, Integer, List, Dictionary>;

  Value() = delete;

  explicit Value(ByteString v);
  explicit Value(Integer v);
  explicit Value(List v);
  explicit Value(Dictionary v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }

  [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<ByteString>(storage_); }
  [[nodiscard]] bool is_integer() const noexcept { return std::holds_alternative<Integer>(storage_); }
  [[nodiscard]] bool is_list() const noexcept { return std::holds_alternative<List>(storage_); }
  [[nodiscard]] bool is_dictionary() const noexcept { return std::holds_alternative<Dictionary>(storage_); }

  static Value string(std::string value);
  static Value bytes(bytes_view value);
  static Value integer(std::int64_t value);
  static Value list(std::vector<Value> values);

  /**
   * @brief 由 (key, value) 序列构造字典；重复 key 以后出现者为准。
   */
  static Value dictionary(std::vector<Dictionary::entry_type> entries);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

/**
 * @brief 按无符号字节序比较两个 key（bencode 规范顺序）。
 */
[[nodiscard]] bool key_less(std::string_view lhs, std::string_view rhs) noexcept;

[[nodiscard]] const char* to_string(ValueKind kind) noexcept;

}  // namespace benc::codec
