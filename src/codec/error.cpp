#include "jsonb/codec/error.hpp"

#include <string>

namespace jsonb::codec {
namespace {

class codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "jsonb.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::truncated:
        return "truncated input";
      case errc::unexpected_type:
        return "unexpected jsonb element type";
      case errc::invalid_literal:
        return "invalid jsonb scalar literal";
      case errc::number_overflow:
        return "number does not fit the requested type";
      case errc::malformed_composite:
        return "malformed jsonb array or object";
      case errc::trailing_data:
        return "trailing data after jsonb value";
      case errc::depth_exceeded:
        return "jsonb nesting too deep";
      case errc::length_overflow:
        return "jsonb payload size overflow";
      case errc::invalid_utf8:
        return "invalid utf-8 in jsonb text";
      case errc::malformed_element:
        return "unexpected payload on jsonb element";
      case errc::visitor_rejected:
        return "visitor rejected value";
      default:
        return "unknown jsonb.codec error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace jsonb::codec
