#include "jsonb/core/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <ios>

namespace jsonb::core {

std::error_code SpanSource::read_some(mutable_bytes_view out, std::size_t& n) noexcept {
  n = std::min(out.size(), remaining());
  if (n != 0) {
    std::memcpy(out.data(), in_.data() + pos_, n);
    pos_ += n;
  }
  return {};
}

StreamSource::StreamSource(std::istream& in, StreamSourceOptions options)
    : in_(in), chunk_(std::max<std::size_t>(options.chunk_size, 1)) {}

std::error_code StreamSource::fill() noexcept {
  pos_ = 0;
  end_ = 0;
  if (eof_) {
    return {};
  }
  try {
    in_.read(reinterpret_cast<char*>(chunk_.data()), static_cast<std::streamsize>(chunk_.size()));
  } catch (const std::exception&) {
    // 开启异常掩码时，istream 抛出 ios_base::failure 或重新抛出 streambuf 的原始异常。
    return make_error_code(errc::io_error);
  }
  end_ = static_cast<std::size_t>(in_.gcount());
  if (in_.bad()) {
    return make_error_code(errc::io_error);
  }
  if (in_.fail()) {
    // 短读：只有 EOF 才是正常结束，其余视为底层失败。
    if (!in_.eof()) {
      return make_error_code(errc::io_error);
    }
    eof_ = true;
  }
  return {};
}

std::error_code StreamSource::read_some(mutable_bytes_view out, std::size_t& n) noexcept {
  n = 0;
  if (out.empty()) {
    return {};
  }
  if (pos_ == end_) {
    auto ec = fill();
    if (ec) {
      return ec;
    }
  }
  n = std::min(out.size(), end_ - pos_);
  if (n != 0) {
    std::memcpy(out.data(), chunk_.data() + pos_, n);
    pos_ += n;
  }
  return {};
}

}  // namespace jsonb::core
