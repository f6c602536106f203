#include "bench_main.hpp"
#include "benc/codec/codec.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace benc::codec;

namespace {

Value make_nested_list(std::size_t depth) {
  Value v = Value::integer(42);
  for (std::size_t i = 0; i < depth; ++i) {
    v = Value::list({std::move(v)});
  }
  return v;
}

// 编码后再解码同一份数据，分别计时。
void bench_encode_decode(std::string_view encode_name,
                         std::string_view decode_name,
                         const Value& value,
                         int iterations,
                         const DecodeLimits& limits = {}) {
  std::vector<byte> encoded;

  BENCH_RUN(encode_name, encoded_size(value), iterations, {
    encoded.clear();
    encode(value, encoded);
  });

  BENCH_RUN(decode_name, encoded.size(), iterations, {
    Value decoded = Value::integer(0);
    auto ec = decode(bytes_view{encoded.data(), encoded.size()}, decoded, limits);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });
}

void bench_deep_nested() {
  constexpr std::size_t depth = 64;
  bench_encode_decode("bencode: Deep nested list encode (64 levels)",
                      "bencode: Deep nested list decode (64 levels)",
                      make_nested_list(depth),
                      100);
}

void bench_large_list() {
  constexpr std::size_t item_count = 100'000;
  std::vector<Value> items;
  items.reserve(item_count);
  for (std::size_t i = 0; i < item_count; ++i) {
    items.push_back(Value::integer(static_cast<std::int64_t>(i) - 50'000));
  }
  bench_encode_decode("bencode: Integer list encode (100000 items)",
                      "bencode: Integer list decode (100000 items)",
                      Value::list(std::move(items)),
                      5);
}

void bench_large_string() {
  constexpr std::size_t size = 1024 * 1024;
  bench_encode_decode("bencode: Byte string encode (1MB)",
                      "bencode: Byte string decode (1MB)",
                      Value::string(std::string(size, '\xAB')),
                      5);
}

void bench_wide_dictionary() {
  constexpr std::size_t key_count = 10'000;

  // 逆序插入：编码时需要完整排序
  Dictionary dict;
  dict.reserve(key_count);
  for (std::size_t i = key_count; i > 0; --i) {
    dict.insert("key" + std::to_string(i), Value::string("value"));
  }
  bench_encode_decode("bencode: Dictionary encode (10000 keys, unsorted)",
                      "bencode: Dictionary decode (10000 keys)",
                      Value(std::move(dict)),
                      5);
}

}  // namespace

int main() {
  bench_deep_nested();
  bench_large_list();
  bench_large_string();
  bench_wide_dictionary();

  benc::benchmarks::print_results();
  return 0;
}
