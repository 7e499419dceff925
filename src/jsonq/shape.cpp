#include <cstdlib>
#include <memory>

#include <cxxabi.h>

#include <jsonq/shape.hpp>

namespace jsonq::detail {

std::string demangle(const char *name) {
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(
    abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  if (status != 0 || !demangled) {
    return name;
  }
  return demangled.get();
}

} // namespace jsonq::detail
