#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include <jsonq/value.hpp>

namespace jsonq {

enum class FieldKind {
  String,
  Number,
  Integer,
  Int,
  Boolean,
  Unsupported
};

using FieldValue = std::variant<std::string, double, int64_t, bool>;

template <typename M>
struct field_traits {
  static constexpr FieldKind kind = FieldKind::Unsupported;
};

template <>
struct field_traits<std::string> {
  static constexpr FieldKind kind = FieldKind::String;
};

template <>
struct field_traits<double> {
  static constexpr FieldKind kind = FieldKind::Number;
};

template <>
struct field_traits<int64_t> {
  static constexpr FieldKind kind = FieldKind::Integer;
};

// Read as an integer and narrowed, failing when the value doesn't fit.
template <>
struct field_traits<int> {
  static constexpr FieldKind kind = FieldKind::Int;
};

template <>
struct field_traits<bool> {
  static constexpr FieldKind kind = FieldKind::Boolean;
};

namespace detail {
std::string demangle(const char *name);

// Reads the value at `path` below `element` with the getter for `kind`.
// Returns an empty optional when an optional path is missing.
std::optional<FieldValue> resolve_field(const Value & element, const std::string & path,
                                        FieldKind kind);
} // namespace detail

template <typename T>
struct FieldBinding {
  std::string name;
  std::string path;
  FieldKind kind;
  std::string type_name;
  std::function<void(T &, const FieldValue &)> assign;
};

// Describes how a record type T is filled from a selected value: one
// binding per field, each naming the path to read. A path starting with
// `?` marks the field optional.
//
//   auto shape = jsonq::Shape<Issue>()
//     .field("Key", &Issue::key, "issue.key")
//     .field("Name", &Issue::name, "issue.fields.project.name");
template <typename T>
class Shape {
public:
  template <typename M>
  Shape & field(const std::string & name, M T::*member, const std::string & path) {
    using Field = std::remove_cv_t<M>;
    // Const members can't be written and register as unsupported.
    constexpr FieldKind kind =
      std::is_const_v<M> ? FieldKind::Unsupported : field_traits<Field>::kind;

    FieldBinding<T> binding {
      name, path, kind,
      (std::is_const_v<M> ? "const " : "") + detail::demangle(typeid(M).name()), {}
    };
    if constexpr (kind == FieldKind::Int) {
      binding.assign = [member](T & record, const FieldValue & value) {
        record.*member = static_cast<int>(std::get<int64_t>(value));
      };
    } else if constexpr (kind != FieldKind::Unsupported) {
      binding.assign = [member](T & record, const FieldValue & value) {
        record.*member = std::get<Field>(value);
      };
    }
    bindings.emplace_back(std::move(binding));
    return *this;
  }

  const std::vector<FieldBinding<T>> & fields() const { return bindings; }
private:
  std::vector<FieldBinding<T>> bindings;
};

} // namespace jsonq
