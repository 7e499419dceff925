#include <jsonq/getters.hpp>

#include <jsonq/context.hpp>

namespace jsonq {

Context::Context(const Value & root, Options options)
  : selected { &root }
  , options(options) {}

Context & Context::select(const std::string & path) {
  if (latched) {
    return *this;
  }

  util::ScopedTrace trace("select " + path, options.trace);

  std::vector<const Value *> result;
  try {
    for (auto value : selected) {
      auto elements = jsonq::select(*value, path);
      result.insert(result.end(), elements.begin(), elements.end());
    }
  } catch (const Error &) {
    latched = std::current_exception();
    return *this;
  }
  selected = std::move(result);

  return *this;
}

void Context::check_target(const void *target) const {
  if (latched) {
    std::rethrow_exception(latched);
  }
  if (target == nullptr) {
    throw InvalidTargetError("jsonq: extract into a null target");
  }
}

const Value & Context::single_element() const {
  switch (selected.size()) {
    case 0: throw EmptySelectionError("jsonq: empty selection");
    case 1: return *selected.front();
    default: throw MultipleResultsError("jsonq: selection matches more than one item");
  }
}

} // namespace jsonq
