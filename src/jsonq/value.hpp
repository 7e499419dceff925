#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonq {

enum class ValueType {
  Null,
  Boolean,
  Number,
  String,
  Sequence,
  Mapping
};

const char *value_type_name(ValueType type);

// In-memory JSON value as produced by a JSON decoder. The query engine only
// ever reads it; the caller owns the tree and must keep it alive while
// selections reference it.
class Value {
public:
  using Sequence = std::vector<Value>;
  using Mapping = std::map<std::string, Value>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : data(b) {}
  Value(double n) : data(n) {}
  // Every other arithmetic type is stored as a number.
  template <typename N,
            typename = std::enable_if_t<std::is_arithmetic_v<N> && !std::is_same_v<N, bool>>>
  Value(N n) : data(static_cast<double>(n)) {}
  Value(const char *s) : data(std::string(s)) {}
  Value(std::string s) : data(std::move(s)) {}
  Value(Sequence s) : data(std::move(s)) {}
  Value(Mapping m) : data(std::move(m)) {}

  static Value sequence(std::initializer_list<Value> elements);
  static Value mapping(std::initializer_list<std::pair<const std::string, Value>> members);

  ValueType type() const;
  const char *type_name() const { return value_type_name(type()); }

  bool is_null() const { return type() == ValueType::Null; }
  bool is_boolean() const { return type() == ValueType::Boolean; }
  bool is_number() const { return type() == ValueType::Number; }
  bool is_string() const { return type() == ValueType::String; }
  bool is_sequence() const { return type() == ValueType::Sequence; }
  bool is_mapping() const { return type() == ValueType::Mapping; }

  // Typed accessors. Each throws TypeMismatchError when the value holds a
  // different type.
  bool as_boolean() const;
  double as_number() const;
  const std::string & as_string() const;
  const Sequence & as_sequence() const;
  const Mapping & as_mapping() const;

  // Returns nullptr when the key is absent. Throws TypeMismatchError on
  // anything other than a mapping.
  const Value *member(const std::string & key) const;

  bool operator==(const Value & other) const { return data == other.data; }
  bool operator!=(const Value & other) const { return !(*this == other); }
private:
  std::variant<
    std::monostate,
    bool,
    double,
    std::string,
    Sequence,
    Mapping
  > data;
};

} // namespace jsonq
