#include "TrellisRuntime/TrellisValue.h"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace trellis {

namespace {

const char* kindName(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::Undefined:
      return "undefined";
    case Value::Kind::Null:
      return "null";
    case Value::Kind::Bool:
      return "bool";
    case Value::Kind::Number:
      return "number";
    case Value::Kind::String:
      return "string";
    case Value::Kind::Function:
      return "function";
    case Value::Kind::Object:
      return "object";
  }
  return "unknown";
}

} // namespace

Value::Value(std::nullptr_t) : kind_(Kind::Null) {}

Value::Value(bool value) : kind_(Kind::Bool), bool_(value) {}

Value::Value(const char* value) : kind_(Kind::String), string_(value != nullptr ? value : "") {}

Value::Value(std::string value) : kind_(Kind::String), string_(std::move(value)) {}

Value Value::undefined() {
  return Value();
}

Value Value::null() {
  return Value(nullptr);
}

Value Value::function(NativeFunction fn) {
  Value value;
  value.kind_ = Kind::Function;
  value.function_ = std::make_shared<const NativeFunction>(std::move(fn));
  return value;
}

Value Value::handler(std::function<void(const Value& event)> fn) {
  return Value::function([fn = std::move(fn)](const std::vector<Value>& arguments) {
    fn(arguments.empty() ? Value::undefined() : arguments.front());
    return Value::undefined();
  });
}

bool Value::getBool() const {
  if (kind_ != Kind::Bool) {
    throwTypeError("bool");
  }
  return bool_;
}

double Value::getNumber() const {
  if (kind_ != Kind::Number) {
    throwTypeError("number");
  }
  return number_;
}

const std::string& Value::getString() const {
  if (kind_ != Kind::String) {
    throwTypeError("string");
  }
  return string_;
}

Value Value::call(const std::vector<Value>& arguments) const {
  if (kind_ != Kind::Function || !function_ || !*function_) {
    throwTypeError("function");
  }
  return (*function_)(arguments);
}

bool Value::sameValue(const Value& a, const Value& b) {
  if (a.kind_ != b.kind_) {
    return false;
  }
  switch (a.kind_) {
    case Kind::Undefined:
    case Kind::Null:
      return true;
    case Kind::Bool:
      return a.bool_ == b.bool_;
    case Kind::Number:
      if (std::isnan(a.number_) && std::isnan(b.number_)) {
        return true;
      }
      return a.number_ == b.number_ && std::signbit(a.number_) == std::signbit(b.number_);
    case Kind::String:
      return a.string_ == b.string_;
    case Kind::Function:
      return a.function_ == b.function_;
    case Kind::Object:
      return a.object_ == b.object_ && a.objectType_ == b.objectType_;
  }
  return false;
}

std::string Value::toString() const {
  switch (kind_) {
    case Kind::Undefined:
      return "undefined";
    case Kind::Null:
      return "null";
    case Kind::Bool:
      return bool_ ? "true" : "false";
    case Kind::Number:
      return numberToString(number_);
    case Kind::String:
      return string_;
    case Kind::Function:
      return "[function]";
    case Kind::Object:
      return "[object]";
  }
  return std::string{};
}

void Value::throwTypeError(const char* expected) const {
  throw std::invalid_argument(
      std::string("Value of kind ") + kindName(kind_) + " cannot be read as " + expected);
}

std::string numberToString(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "Infinity" : "-Infinity";
  }
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

} // namespace trellis
