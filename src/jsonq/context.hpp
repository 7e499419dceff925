#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <jsonq/error.hpp>
#include <jsonq/options.hpp>
#include <jsonq/shape.hpp>
#include <jsonq/util/tracer.hpp>
#include <jsonq/value.hpp>

namespace jsonq {

// Selection over a JSON value. select() narrows the selection step by
// step; extract() copies the selection into records.
//
// The first error raised by select() is kept: later select() calls do
// nothing and extract() rethrows it, so calls can be chained:
//
//   Context(root)
//     .select("issue.changelog.items[fieldId==\"assignee\"]")
//     .extract(&assignments, assignment_shape);
//
// The root value must outlive the context. A context must not be shared
// between threads without external locking.
class Context {
public:
  explicit Context(const Value & root, Options options = {});

  Context & select(const std::string & path);

  // Fills a single record. The selection must hold exactly one value.
  template <typename T>
  void extract(T *record, const Shape<T> & shape);

  // Appends one record per selected value, in selection order.
  template <typename T>
  void extract(std::vector<T> *records, const Shape<T> & shape);
  template <typename T>
  void extract(std::vector<std::unique_ptr<T>> *records, const Shape<T> & shape);
  template <typename T>
  void extract(std::vector<std::shared_ptr<T>> *records, const Shape<T> & shape);

  // Same as above, with the shape given by `T::shape()`.
  template <typename R>
  void extract(R *target);

  bool ok() const { return !latched; }
  std::exception_ptr error() const { return latched; }

  const std::vector<const Value *> & selection() const { return selected; }
private:
  std::vector<const Value *> selected;
  std::exception_ptr latched;
  Options options;

  void check_target(const void *target) const;
  const Value & single_element() const;

  template <typename T>
  static void check_shape(const Shape<T> & shape);

  template <typename T>
  static std::vector<std::optional<FieldValue>> resolve(const Value & element,
                                                        const Shape<T> & shape);

  template <typename T>
  static void assign(T & record, const Shape<T> & shape,
                     const std::vector<std::optional<FieldValue>> & values);

  template <typename T, typename Make>
  auto build_records(const Shape<T> & shape, Make make);
};

template <typename R>
struct record_type {
  using type = R;
};

template <typename T>
struct record_type<std::vector<T>> {
  using type = T;
};

template <typename T>
struct record_type<std::vector<std::unique_ptr<T>>> {
  using type = T;
};

template <typename T>
struct record_type<std::vector<std::shared_ptr<T>>> {
  using type = T;
};

template <typename T>
void Context::check_shape(const Shape<T> & shape) {
  for (const auto & binding : shape.fields()) {
    if (binding.kind == FieldKind::Unsupported) {
      throw UnsupportedFieldTypeError(binding.name, binding.type_name);
    }
  }
}

template <typename T>
std::vector<std::optional<FieldValue>> Context::resolve(const Value & element,
                                                        const Shape<T> & shape) {
  std::vector<std::optional<FieldValue>> values;
  values.reserve(shape.fields().size());
  for (const auto & binding : shape.fields()) {
    values.emplace_back(detail::resolve_field(element, binding.path, binding.kind));
  }
  return values;
}

template <typename T>
void Context::assign(T & record, const Shape<T> & shape,
                     const std::vector<std::optional<FieldValue>> & values) {
  const auto & bindings = shape.fields();
  for (size_t i = 0; i < bindings.size(); i++) {
    if (values[i].has_value()) {
      bindings[i].assign(record, *values[i]);
    }
  }
}

// Resolves every field of every record before anything is written, so a
// failing field leaves the target untouched.
template <typename T, typename Make>
auto Context::build_records(const Shape<T> & shape, Make make) {
  using Values = std::vector<std::optional<FieldValue>>;
  using Record = std::invoke_result_t<Make, const Values &>;

  check_shape(shape);

  std::vector<Values> resolved;
  resolved.reserve(selected.size());
  for (auto element : selected) {
    resolved.emplace_back(resolve(*element, shape));
  }

  std::vector<Record> records;
  records.reserve(resolved.size());
  for (const auto & values : resolved) {
    records.emplace_back(make(values));
  }
  return records;
}

template <typename T>
void Context::extract(T *record, const Shape<T> & shape) {
  util::ScopedTrace trace("extract", options.trace);
  check_target(record);
  check_shape(shape);

  auto values = resolve(single_element(), shape);
  assign(*record, shape, values);
}

template <typename T>
void Context::extract(std::vector<T> *records, const Shape<T> & shape) {
  util::ScopedTrace trace("extract", options.trace);
  check_target(records);

  auto built = build_records(shape, [&shape](const auto & values) {
    T record {};
    Context::assign(record, shape, values);
    return record;
  });
  for (auto & record : built) {
    records->emplace_back(std::move(record));
  }
}

template <typename T>
void Context::extract(std::vector<std::unique_ptr<T>> *records, const Shape<T> & shape) {
  util::ScopedTrace trace("extract", options.trace);
  check_target(records);

  auto built = build_records(shape, [&shape](const auto & values) {
    auto record = std::make_unique<T>();
    Context::assign(*record, shape, values);
    return record;
  });
  for (auto & record : built) {
    records->emplace_back(std::move(record));
  }
}

template <typename T>
void Context::extract(std::vector<std::shared_ptr<T>> *records, const Shape<T> & shape) {
  util::ScopedTrace trace("extract", options.trace);
  check_target(records);

  auto built = build_records(shape, [&shape](const auto & values) {
    auto record = std::make_shared<T>();
    Context::assign(*record, shape, values);
    return record;
  });
  for (auto & record : built) {
    records->emplace_back(std::move(record));
  }
}

template <typename R>
void Context::extract(R *target) {
  using T = typename record_type<R>::type;
  extract(target, T::shape());
}

} // namespace jsonq
