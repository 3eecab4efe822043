#pragma once

#include "jsonb/codec/visitor.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonb::codec {

class Value;
struct Member;

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

using Array = std::vector<Value>;
// 对象保持键的出现顺序，且允许重复键（本层不做唯一性约束）。
using Object = std::vector<Member>;

/**
 * @brief 解码后的逻辑值（null/bool/整数/浮点/字符串/数组/对象）。
 *
 * 约定：
 * - 整数区分 int64_t 与 uint64_t：Any 形状下能放进 int64_t 的都用 int64_t，
 *   仅超出 int64_t 的非负整数使用 uint64_t；
 * - 浮点比较按位进行（NaN 与自身相等，+0 与 -0 不等）。
 */
class Value final {
 public:
  using storage_type =
    std::variant<Null, bool, std::int64_t, std::uint64_t, double, std::string, Array, Object>;

  Value() noexcept;

  explicit Value(Null v) noexcept;
  explicit Value(Array v);
  explicit Value(Object v);

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

  [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<Null>(storage_); }
  [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(storage_); }
  [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<Object>(storage_); }

  /**
   * @brief 对象中按键查找第一个匹配成员；非对象或未找到返回 nullptr。
   */
  [[nodiscard]] const Value* find(std::string_view key) const noexcept;

  static Value null();
  static Value boolean(bool v);
  static Value integer(std::int64_t v);
  static Value unsigned_integer(std::uint64_t v);
  static Value number(double v);
  static Value string(std::string v);
  static Value array(std::vector<Value> values);
  static Value object(std::vector<Member> members);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  template <class T>
  static Value make(T v);

  storage_type storage_;
};

struct Member final {
  std::string key;
  Value value;

  friend bool operator==(const Member&, const Member&) = default;
};

/**
 * @brief 把 Visitor 回调组装成 Value 的构造器。
 *
 * 调用序列不合法（例如对象中缺少 on_key、end_array 与 begin_object 不配对、
 * 根值重复给出）时返回 errc::visitor_rejected。
 */
class ValueBuilder final : public Visitor {
 public:
  std::error_code on_null() override;
  std::error_code on_bool(bool value) override;
  std::error_code on_i64(std::int64_t value) override;
  std::error_code on_u64(std::uint64_t value) override;
  std::error_code on_f64(double value) override;
  std::error_code on_string(std::string_view value) override;

  std::error_code begin_array() override;
  std::error_code end_array() override;

  std::error_code begin_object() override;
  std::error_code on_key(std::string_view key) override;
  std::error_code end_object() override;

  [[nodiscard]] bool complete() const noexcept { return stack_.empty() && root_.has_value(); }

  /**
   * @brief 取走已完成的根值；未完成时返回 errc::visitor_rejected。
   */
  std::error_code take(Value& out);

  void reset() noexcept;

 private:
  struct Frame final {
    Value container;
    std::optional<std::string> pending_key;
  };

  std::error_code emit(Value v);

  std::vector<Frame> stack_;
  std::optional<Value> root_;
};

}  // namespace jsonb::codec
