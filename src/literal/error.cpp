#include "jsonb/literal/error.hpp"

#include <string>

namespace jsonb::literal {
namespace {

class literal_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "jsonb.literal"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_number:
        return "invalid number literal";
      case errc::invalid_string:
        return "invalid string literal";
      case errc::invalid_escape:
        return "invalid escape sequence";
      case errc::invalid_utf8:
        return "invalid utf-8 sequence";
      case errc::out_of_range:
        return "number out of range";
      default:
        return "unknown jsonb.literal error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static literal_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace jsonb::literal
