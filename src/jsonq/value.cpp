#include <jsonq/error.hpp>

#include <jsonq/value.hpp>

namespace jsonq {

const char *value_type_name(ValueType type) {
  switch (type) {
    case ValueType::Null: return "null";
    case ValueType::Boolean: return "boolean";
    case ValueType::Number: return "number";
    case ValueType::String: return "string";
    case ValueType::Sequence: return "sequence";
    case ValueType::Mapping: return "mapping";
  }
  return "unknown";
}

Value Value::sequence(std::initializer_list<Value> elements) {
  return Value(Sequence(elements));
}

Value Value::mapping(std::initializer_list<std::pair<const std::string, Value>> members) {
  return Value(Mapping(members));
}

ValueType Value::type() const {
  return static_cast<ValueType>(data.index());
}

static TypeMismatchError make_accessor_error(const Value & value, ValueType expected) {
  return TypeMismatchError("", value.type_name(),
    std::string("value is ") + value.type_name() + ", not " + value_type_name(expected));
}

bool Value::as_boolean() const {
  if (auto b = std::get_if<bool>(&data)) return *b;
  throw make_accessor_error(*this, ValueType::Boolean);
}

double Value::as_number() const {
  if (auto n = std::get_if<double>(&data)) return *n;
  throw make_accessor_error(*this, ValueType::Number);
}

const std::string & Value::as_string() const {
  if (auto s = std::get_if<std::string>(&data)) return *s;
  throw make_accessor_error(*this, ValueType::String);
}

const Value::Sequence & Value::as_sequence() const {
  if (auto s = std::get_if<Sequence>(&data)) return *s;
  throw make_accessor_error(*this, ValueType::Sequence);
}

const Value::Mapping & Value::as_mapping() const {
  if (auto m = std::get_if<Mapping>(&data)) return *m;
  throw make_accessor_error(*this, ValueType::Mapping);
}

const Value *Value::member(const std::string & key) const {
  const auto & members = as_mapping();
  auto it = members.find(key);
  if (it == members.end()) return nullptr;
  return &it->second;
}

} // namespace jsonq
