#include "jsonb/codec/header.hpp"

#include "jsonb/core/byte_source.hpp"

#include <cstdint>
#include <limits>

namespace jsonb::codec {
namespace {

std::error_code size_from_u64(std::uint64_t v, std::size_t& out) noexcept {
  if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
    if (v > std::numeric_limits<std::size_t>::max()) {
      return make_error_code(errc::length_overflow);
    }
  }
  out = static_cast<std::size_t>(v);
  return {};
}

}  // namespace

std::error_code read_header(Cursor& in, Header& out) noexcept {
  byte first = 0;
  auto ec = in.read_u8(first);
  if (ec) {
    return ec;
  }

  const auto header_size = header_size_for(first);
  std::size_t payload_size = 0;
  if (header_size == 1) {
    payload_size = static_cast<std::size_t>(first >> 4);
  } else {
    std::uint64_t v = 0;
    ec = in.read_be_uint(header_size - 1, v);
    if (ec) {
      return ec;
    }
    ec = size_from_u64(v, payload_size);
    if (ec) {
      return ec;
    }
  }

  out.type = element_type_from_bits(first);
  out.payload_size = payload_size;
  out.header_size = header_size;
  return {};
}

std::error_code decode_header(bytes_view in, Header& out) noexcept {
  jsonb::core::SpanSource source(in);
  Cursor cursor(source);
  return read_header(cursor, out);
}

}  // namespace jsonb::codec
