#include "jsonb/codec/cursor.hpp"

#include <algorithm>
#include <array>

namespace jsonb::codec {

Cursor::Cursor(jsonb::core::ByteSource& source) noexcept : source_(&source) {}

Cursor::Cursor(Cursor* parent, std::size_t limit) noexcept
    : source_(parent->source_), parent_(parent), bounded_(true), remaining_(limit) {}

Cursor Cursor::take(std::size_t limit) noexcept { return Cursor(this, limit); }

std::error_code Cursor::pull(mutable_bytes_view out) noexcept {
  std::size_t filled = 0;
  if (peeked_ && !out.empty()) {
    out[0] = *peeked_;
    peeked_.reset();
    filled = 1;
  }
  while (filled < out.size()) {
    std::size_t n = 0;
    auto ec = source_->read_some(out.subspan(filled), n);
    if (ec) {
      return ec;
    }
    if (n == 0) {
      return make_error_code(errc::truncated);
    }
    filled += n;
  }
  return {};
}

std::error_code Cursor::read_exact(mutable_bytes_view out) noexcept {
  if (out.empty()) {
    return {};
  }
  if (bounded_ && out.size() > remaining_) {
    return make_error_code(errc::malformed_composite);
  }
  auto ec = parent_ ? parent_->read_exact(out) : pull(out);
  if (ec) {
    return ec;
  }
  if (bounded_) {
    remaining_ -= out.size();
  }
  consumed_ += out.size();
  return {};
}

std::error_code Cursor::read_u8(byte& out) noexcept {
  return read_exact(mutable_bytes_view{&out, 1});
}

std::error_code Cursor::read_be_uint(std::size_t bytes, std::uint64_t& out) noexcept {
  std::array<byte, 8> buf{};
  if (bytes > buf.size()) {
    return make_error_code(errc::length_overflow);
  }
  auto ec = read_exact(mutable_bytes_view{buf.data(), bytes});
  if (ec) {
    return ec;
  }
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < bytes; ++i) {
    v = (v << 8) | static_cast<std::uint64_t>(buf[i]);
  }
  out = v;
  return {};
}

std::error_code Cursor::read_string(std::size_t n, std::string& out) {
  out.clear();
  while (out.size() < n) {
    const auto offset = out.size();
    const auto chunk = std::min(n - offset, jsonb::core::kPayloadReadChunk);
    out.resize(offset + chunk);
    auto ec = read_exact(mutable_bytes_view{reinterpret_cast<byte*>(out.data()) + offset, chunk});
    if (ec) {
      return ec;
    }
  }
  return {};
}

std::error_code Cursor::skip(std::size_t n) noexcept {
  std::array<byte, 256> sink{};
  while (n > 0) {
    const auto chunk = std::min(n, sink.size());
    auto ec = read_exact(mutable_bytes_view{sink.data(), chunk});
    if (ec) {
      return ec;
    }
    n -= chunk;
  }
  return {};
}

std::error_code Cursor::at_end(bool& out) noexcept {
  if (bounded_) {
    out = remaining_ == 0;
    return {};
  }
  if (peeked_) {
    out = false;
    return {};
  }
  byte b = 0;
  std::size_t n = 0;
  auto ec = source_->read_some(mutable_bytes_view{&b, 1}, n);
  if (ec) {
    return ec;
  }
  if (n == 0) {
    out = true;
    return {};
  }
  peeked_ = b;
  out = false;
  return {};
}

}  // namespace jsonb::codec
