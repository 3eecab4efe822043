#include "jsonb/codec/value.hpp"

#include "jsonb/codec/error.hpp"

#include <bit>
#include <type_traits>
#include <utility>

namespace jsonb::codec {
namespace {

// 浮点比较采用“按位相等”：解码结果关注位模式是否一致，NaN、-0/+0 不会产生歧义。
bool double_bits_equal(double a, double b) noexcept {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

}  // namespace

Value::Value() noexcept : storage_(Null{}) {}
Value::Value(Null v) noexcept : storage_(v) {}
Value::Value(Array v) : storage_(std::move(v)) {}
Value::Value(Object v) : storage_(std::move(v)) {}

template <class T>
Value Value::make(T v) {
  Value out;
  out.storage_.template emplace<T>(std::move(v));
  return out;
}

Value Value::null() { return Value(Null{}); }
Value Value::boolean(bool v) { return make<bool>(v); }
Value Value::integer(std::int64_t v) { return make<std::int64_t>(v); }
Value Value::unsigned_integer(std::uint64_t v) { return make<std::uint64_t>(v); }
Value Value::number(double v) { return make<double>(v); }
Value Value::string(std::string v) { return make<std::string>(std::move(v)); }
Value Value::array(std::vector<Value> values) { return Value(std::move(values)); }
Value Value::object(std::vector<Member> members) { return Value(std::move(members)); }

const Value* Value::find(std::string_view key) const noexcept {
  const auto* members = get_if<Object>();
  if (!members) {
    return nullptr;
  }
  for (const auto& m : *members) {
    if (m.key == key) {
      return &m.value;
    }
  }
  return nullptr;
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto& b = std::get<T>(rhs.storage_);
      if constexpr (std::is_same_v<T, double>) {
        return double_bits_equal(a, b);
      } else {
        return a == b;
      }
    },
    lhs.storage_);
}

std::error_code ValueBuilder::emit(Value v) {
  if (stack_.empty()) {
    if (root_) {
      return make_error_code(errc::visitor_rejected);
    }
    root_ = std::move(v);
    return {};
  }

  auto& top = stack_.back();
  if (auto* arr = top.container.get_if<Array>()) {
    arr->push_back(std::move(v));
    return {};
  }
  auto* obj = top.container.get_if<Object>();
  if (!obj || !top.pending_key) {
    return make_error_code(errc::visitor_rejected);
  }
  obj->push_back(Member{std::move(*top.pending_key), std::move(v)});
  top.pending_key.reset();
  return {};
}

std::error_code ValueBuilder::on_null() { return emit(Value::null()); }
std::error_code ValueBuilder::on_bool(bool value) { return emit(Value::boolean(value)); }
std::error_code ValueBuilder::on_i64(std::int64_t value) { return emit(Value::integer(value)); }
std::error_code ValueBuilder::on_u64(std::uint64_t value) { return emit(Value::unsigned_integer(value)); }
std::error_code ValueBuilder::on_f64(double value) { return emit(Value::number(value)); }

std::error_code ValueBuilder::on_string(std::string_view value) {
  return emit(Value::string(std::string(value)));
}

std::error_code ValueBuilder::begin_array() {
  stack_.push_back(Frame{Value::array({}), std::nullopt});
  return {};
}

std::error_code ValueBuilder::end_array() {
  if (stack_.empty() || !stack_.back().container.is_array()) {
    return make_error_code(errc::visitor_rejected);
  }
  Value done = std::move(stack_.back().container);
  stack_.pop_back();
  return emit(std::move(done));
}

std::error_code ValueBuilder::begin_object() {
  stack_.push_back(Frame{Value::object({}), std::nullopt});
  return {};
}

std::error_code ValueBuilder::on_key(std::string_view key) {
  if (stack_.empty() || !stack_.back().container.is_object() || stack_.back().pending_key) {
    return make_error_code(errc::visitor_rejected);
  }
  stack_.back().pending_key = std::string(key);
  return {};
}

std::error_code ValueBuilder::end_object() {
  if (stack_.empty() || !stack_.back().container.is_object() || stack_.back().pending_key) {
    return make_error_code(errc::visitor_rejected);
  }
  Value done = std::move(stack_.back().container);
  stack_.pop_back();
  return emit(std::move(done));
}

std::error_code ValueBuilder::take(Value& out) {
  if (!complete()) {
    return make_error_code(errc::visitor_rejected);
  }
  out = std::move(*root_);
  root_.reset();
  return {};
}

void ValueBuilder::reset() noexcept {
  stack_.clear();
  root_.reset();
}

}  // namespace jsonb::codec
