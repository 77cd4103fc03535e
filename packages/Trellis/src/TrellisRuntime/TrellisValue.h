#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace trellis {

class Value;

using NativeFunction = std::function<Value(const std::vector<Value>& arguments)>;

namespace detail {

template <typename T>
struct IsSharedPtr : std::false_type {};

template <typename T>
struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};

} // namespace detail

/**
 * Dynamically typed value carried by props, state and effect dependencies.
 *
 * Primitives (undefined, null, bool, number, string) compare by value. Functions
 * and objects compare by identity: copying a Value shares the referenced payload,
 * while every Value::object call boxes a fresh payload.
 */
class Value {
public:
  enum class Kind : std::uint8_t {
    Undefined = 0,
    Null = 1,
    Bool = 2,
    Number = 3,
    String = 4,
    Function = 5,
    Object = 6,
  };

  Value() = default;
  Value(std::nullptr_t);
  Value(bool value);
  Value(const char* value);
  Value(std::string value);

  template <
      typename T,
      std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T number) : kind_(Kind::Number), number_(static_cast<double>(number)) {}

  static Value undefined();
  static Value null();
  static Value function(NativeFunction fn);
  static Value handler(std::function<void(const Value& event)> fn);

  template <typename T>
  static Value object(T payload);

  template <typename T>
  static Value reference(std::shared_ptr<T> target);

  template <typename T>
  static Value from(T&& value);

  [[nodiscard]] Kind getKind() const noexcept {
    return kind_;
  }

  [[nodiscard]] bool isUndefined() const noexcept {
    return kind_ == Kind::Undefined;
  }
  [[nodiscard]] bool isNull() const noexcept {
    return kind_ == Kind::Null;
  }
  [[nodiscard]] bool isBool() const noexcept {
    return kind_ == Kind::Bool;
  }
  [[nodiscard]] bool isNumber() const noexcept {
    return kind_ == Kind::Number;
  }
  [[nodiscard]] bool isString() const noexcept {
    return kind_ == Kind::String;
  }
  [[nodiscard]] bool isFunction() const noexcept {
    return kind_ == Kind::Function;
  }
  [[nodiscard]] bool isObject() const noexcept {
    return kind_ == Kind::Object;
  }
  [[nodiscard]] bool isNullish() const noexcept {
    return kind_ == Kind::Undefined || kind_ == Kind::Null;
  }

  [[nodiscard]] bool getBool() const;
  [[nodiscard]] double getNumber() const;
  [[nodiscard]] const std::string& getString() const;

  Value call(const std::vector<Value>& arguments = {}) const;

  template <typename T>
  [[nodiscard]] bool holds() const noexcept {
    return kind_ == Kind::Object && objectType_ == std::type_index(typeid(T));
  }

  template <typename T>
  [[nodiscard]] const T& getObject() const;

  template <typename T>
  [[nodiscard]] std::shared_ptr<T> getReference() const;

  template <typename T>
  [[nodiscard]] T as() const;

  // SameValue: NaN equals NaN, +0 and -0 differ, functions and objects by identity.
  static bool sameValue(const Value& a, const Value& b);

  [[nodiscard]] std::string toString() const;

private:
  [[noreturn]] void throwTypeError(const char* expected) const;

  Kind kind_{Kind::Undefined};
  bool bool_{false};
  double number_{0.0};
  std::string string_{};
  std::shared_ptr<const NativeFunction> function_{};
  std::shared_ptr<void> object_{};
  std::type_index objectType_{typeid(void)};
};

using DependencyList = std::vector<Value>;

template <typename... Ts>
DependencyList deps(Ts&&... values) {
  return DependencyList{Value::from(std::forward<Ts>(values))...};
}

std::string numberToString(double value);

template <typename T>
Value Value::object(T payload) {
  Value value;
  value.kind_ = Kind::Object;
  value.object_ = std::make_shared<T>(std::move(payload));
  value.objectType_ = std::type_index(typeid(T));
  return value;
}

template <typename T>
Value Value::reference(std::shared_ptr<T> target) {
  using Stored = std::remove_const_t<T>;
  if (!target) {
    return Value::null();
  }
  Value value;
  value.kind_ = Kind::Object;
  value.object_ = std::const_pointer_cast<Stored>(std::move(target));
  value.objectType_ = std::type_index(typeid(Stored));
  return value;
}

template <typename T>
Value Value::from(T&& value) {
  using U = std::decay_t<T>;
  if constexpr (std::is_same_v<U, Value>) {
    return std::forward<T>(value);
  } else if constexpr (std::is_same_v<U, std::nullptr_t>) {
    return Value::null();
  } else if constexpr (std::is_same_v<U, bool>) {
    return Value(static_cast<bool>(value));
  } else if constexpr (std::is_arithmetic_v<U>) {
    return Value(static_cast<double>(value));
  } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
    return Value(std::string(value));
  } else if constexpr (std::is_same_v<U, std::string>) {
    return Value(std::string(std::forward<T>(value)));
  } else if constexpr (std::is_same_v<U, std::string_view>) {
    return Value(std::string(value));
  } else if constexpr (std::is_same_v<U, NativeFunction>) {
    return Value::function(std::forward<T>(value));
  } else if constexpr (detail::IsSharedPtr<U>::value) {
    return Value::reference(std::forward<T>(value));
  } else {
    return Value::object<U>(std::forward<T>(value));
  }
}

template <typename T>
const T& Value::getObject() const {
  if (!holds<T>()) {
    throwTypeError(typeid(T).name());
  }
  return *static_cast<const T*>(object_.get());
}

template <typename T>
std::shared_ptr<T> Value::getReference() const {
  if (!holds<std::remove_const_t<T>>()) {
    throwTypeError(typeid(T).name());
  }
  return std::static_pointer_cast<T>(object_);
}

template <typename T>
T Value::as() const {
  if constexpr (std::is_same_v<T, Value>) {
    return *this;
  } else if constexpr (std::is_same_v<T, bool>) {
    return getBool();
  } else if constexpr (std::is_arithmetic_v<T>) {
    return static_cast<T>(getNumber());
  } else if constexpr (std::is_same_v<T, std::string>) {
    return getString();
  } else if constexpr (detail::IsSharedPtr<T>::value) {
    if (isNull()) {
      return T{};
    }
    return getReference<typename T::element_type>();
  } else {
    return getObject<T>();
  }
}

} // namespace trellis
