#include "benc/codec/value.hpp"

#include <algorithm>
#include <type_traits>

namespace benc::codec {
namespace {

using entry_iterator = Dictionary::container_type::const_iterator;

entry_iterator find_entry(
  const Dictionary::container_type& entries,
  std::string_view key,
  bool ascending) noexcept {
  if (ascending) {
    const auto it = std::lower_bound(
      entries.begin(), entries.end(), key, [](const Dictionary::entry_type& e, std::string_view k) {
        return key_less(e.first, k);
      });
    if (it != entries.end() && std::string_view(it->first) == key) {
      return it;
    }
    return entries.end();
  }
  return std::find_if(entries.begin(), entries.end(), [&](const Dictionary::entry_type& e) {
    return std::string_view(e.first) == key;
  });
}

}  // namespace

Dictionary::Dictionary() = default;
Dictionary::Dictionary(const Dictionary& other) = default;
Dictionary::Dictionary(Dictionary&& other) noexcept = default;
Dictionary& Dictionary::operator=(const Dictionary& other) = default;
Dictionary& Dictionary::operator=(Dictionary&& other) noexcept = default;
Dictionary::~Dictionary() = default;

bool Dictionary::insert(std::string key, Value value) {
  const bool in_order = entries_.empty() || key_less(entries_.back().first, key);
  // 升序且新 key 大于现有所有 key 时，key 必然不存在，无需查找。
  if (!(ascending_ && in_order)) {
    const auto it = find_entry(entries_, key, ascending_);
    if (it != entries_.end()) {
      entries_[static_cast<std::size_t>(it - entries_.begin())].second = std::move(value);
      return false;
    }
  }
  entries_.emplace_back(std::move(key), std::move(value));
  if (!in_order) {
    ascending_ = false;
  }
  return true;
}

const Value* Dictionary::find(std::string_view key) const noexcept {
  const auto it = find_entry(entries_, key, ascending_);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool Dictionary::contains(std::string_view key) const noexcept {
  return find(key) != nullptr;
}

std::size_t Dictionary::size() const noexcept { return entries_.size(); }
bool Dictionary::empty() const noexcept { return entries_.empty(); }

Dictionary::const_iterator Dictionary::begin() const noexcept { return entries_.begin(); }
Dictionary::const_iterator Dictionary::end() const noexcept { return entries_.end(); }

std::vector<const Dictionary::entry_type*> Dictionary::sorted_entries() const {
  std::vector<const entry_type*> out;
  out.reserve(entries_.size());
  for (const auto& entry : entries_) {
    out.push_back(&entry);
  }
  if (ascending_) {
    return out;
  }
  std::sort(out.begin(), out.end(), [](const entry_type* a, const entry_type* b) {
    return key_less(a->first, b->first);
  });
  return out;
}

void Dictionary::reserve(std::size_t n) { entries_.reserve(n); }

bool operator==(const Dictionary& lhs, const Dictionary& rhs) noexcept {
  if (lhs.entries_.size() != rhs.entries_.size()) {
    return false;
  }
  // key 唯一，因此“同样大小 + lhs 的每个 key 都能在 rhs 中找到相等的 value”即为相等。
  for (const auto& entry : lhs.entries_) {
    const auto* other = rhs.find(entry.first);
    if (!other || !(*other == entry.second)) {
      return false;
    }
  }
  return true;
}

Value::Value(ByteString v) : storage_(std::move(v)) {}
Value::Value(Integer v) : storage_(v) {}
Value::Value(List v) : storage_(std::move(v)) {}
Value::Value(Dictionary v) : storage_(std::move(v)) {}

Value Value::string(std::string value) {
  return Value(ByteString{std::move(value)});
}

Value Value::bytes(bytes_view value) {
  return Value(ByteString{std::string(reinterpret_cast<const char*>(value.data()), value.size())});
}

Value Value::integer(std::int64_t value) {
  return Value(Integer{value});
}

Value Value::list(std::vector<Value> values) {
  return Value(List{std::move(values)});
}

Value Value::dictionary(std::vector<Dictionary::entry_type> entries) {
  Dictionary dict;
  for (auto& entry : entries) {
    dict.insert(std::move(entry.first), std::move(entry.second));
  }
  return Value(std::move(dict));
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      if (!b) {
        return false;
      }
      return a == *b;
    },
    lhs.storage_);
}

bool key_less(std::string_view lhs, std::string_view rhs) noexcept {
  // char_traits<char>::compare 按 unsigned char 比较，
  // 因此 0x80 以上的字节排在 ASCII 之后。
  return lhs.compare(rhs) < 0;
}

const char* to_string(ValueKind kind) noexcept {
  switch (kind) {
    case ValueKind::byte_string:
      return "byte string";
    case ValueKind::integer:
      return "integer";
    case ValueKind::list:
      return "list";
    case ValueKind::dictionary:
      return "dictionary";
  }
  return "unknown";
}

}  // namespace benc::codec
