#include "bench_main.hpp"
#include "jsonb/codec/decoder.hpp"
#include "jsonb/codec/value.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace jsonb;
using namespace jsonb::codec;

// 以最短头部编码一个元素。
static std::string encode_element(ElementType type, std::string_view payload) {
  const auto tag = static_cast<unsigned>(type);
  const auto n = static_cast<std::uint64_t>(payload.size());
  std::string out;
  if (n <= 11) {
    out.push_back(static_cast<char>((n << 4) | tag));
  } else if (n <= 0xFF) {
    out.push_back(static_cast<char>(0xC0 | tag));
    out.push_back(static_cast<char>(n));
  } else if (n <= 0xFFFF) {
    out.push_back(static_cast<char>(0xD0 | tag));
    out.push_back(static_cast<char>(n >> 8));
    out.push_back(static_cast<char>(n & 0xFF));
  } else {
    out.push_back(static_cast<char>(0xE0 | tag));
    for (int shift = 24; shift >= 0; shift -= 8) {
      out.push_back(static_cast<char>((n >> shift) & 0xFF));
    }
  }
  out.append(payload);
  return out;
}

static core::bytes_view as_bytes(const std::string &s) {
  return core::bytes_view{reinterpret_cast<const core::byte *>(s.data()), s.size()};
}

// 只计数、不构造值：衡量解码器本身的开销。
class CountingVisitor final : public Visitor {
 public:
  std::error_code on_null() override { return bump(); }
  std::error_code on_bool(bool) override { return bump(); }
  std::error_code on_i64(std::int64_t) override { return bump(); }
  std::error_code on_u64(std::uint64_t) override { return bump(); }
  std::error_code on_f64(double) override { return bump(); }
  std::error_code on_string(std::string_view) override { return bump(); }
  std::error_code begin_array() override { return bump(); }
  std::error_code end_array() override { return {}; }
  std::error_code begin_object() override { return bump(); }
  std::error_code on_key(std::string_view) override { return {}; }
  std::error_code end_object() override { return {}; }

  std::size_t count{0};

 private:
  std::error_code bump() {
    ++count;
    return {};
  }
};

static void bench_decode_large_int_array() {
  constexpr std::size_t item_count = 100000;

  std::string payload;
  for (std::size_t i = 0; i < item_count; ++i) {
    payload += encode_element(ElementType::Int, std::to_string(static_cast<std::int64_t>(i) - 50000));
  }
  const auto encoded = encode_element(ElementType::Array, payload);

  BENCH_RUN("JSONB: Int array visit (100000 items)", encoded.size(), 5, {
    CountingVisitor v;
    auto ec = decode(as_bytes(encoded), Shape::Array, v);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN("JSONB: Int array to Value (100000 items)", encoded.size(), 5, {
    Value out;
    auto ec = decode_value(as_bytes(encoded), out);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });
}

static void bench_decode_float_array() {
  constexpr std::size_t item_count = 100000;

  std::string payload;
  for (std::size_t i = 0; i < item_count; ++i) {
    payload += encode_element(ElementType::Float, std::to_string(static_cast<double>(i) * 3.14159));
  }
  const auto encoded = encode_element(ElementType::Array, payload);

  BENCH_RUN("JSONB: Float array visit (100000 items)", encoded.size(), 5, {
    CountingVisitor v;
    auto ec = decode(as_bytes(encoded), Shape::Array, v);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });
}

static void bench_decode_deep_nested() {
  // 深度嵌套数组（200 层，低于默认深度上限）
  constexpr int depth = 200;

  std::string encoded = encode_element(ElementType::Array, encode_element(ElementType::Int, "42"));
  for (int i = 1; i < depth; ++i) {
    encoded = encode_element(ElementType::Array, encoded);
  }

  BENCH_RUN("JSONB: Deep nested array (200 levels)", encoded.size(), 100, {
    Value out;
    auto ec = decode_value(as_bytes(encoded), out);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });
}

static void bench_decode_long_strings() {
  constexpr std::size_t string_size = 1024 * 1024;

  const std::string raw(string_size, 'x');
  const auto encoded_raw = encode_element(ElementType::TextRaw, raw);

  // Text 每 8 字节带一个转义
  std::string escaped;
  escaped.reserve(string_size);
  while (escaped.size() < string_size) {
    escaped += "abcdef\\n";
  }
  const auto encoded_text = encode_element(ElementType::Text, escaped);

  BENCH_RUN("JSONB: TextRaw decode (1 MB)", encoded_raw.size(), 10, {
    std::string out;
    auto ec = from_bytes(as_bytes(encoded_raw), out);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN("JSONB: Text unescape (1 MB)", encoded_text.size(), 10, {
    std::string out;
    auto ec = from_bytes(as_bytes(encoded_text), out);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });
}

static void bench_decode_object() {
  constexpr std::size_t member_count = 10000;

  std::string payload;
  for (std::size_t i = 0; i < member_count; ++i) {
    payload += encode_element(ElementType::Text, "key" + std::to_string(i));
    payload += encode_element(ElementType::TextRaw, "value" + std::to_string(i));
  }
  const auto encoded = encode_element(ElementType::Object, payload);

  BENCH_RUN("JSONB: Object to Value (10000 members)", encoded.size(), 5, {
    Value out;
    auto ec = decode_value(as_bytes(encoded), out);
    if (ec) {
      std::cerr << "Decode failed: " << ec.message() << "\n";
    }
  });
}

int main() {
  bench_decode_large_int_array();
  bench_decode_float_array();
  bench_decode_deep_nested();
  bench_decode_long_strings();
  bench_decode_object();

  jsonb::benchmarks::print_results();
  return 0;
}
