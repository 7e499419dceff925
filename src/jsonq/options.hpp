#pragma once

namespace jsonq {

struct Options {
  // Record every select() and extract() call in util::Tracer.
  bool trace = false;
};

} // namespace jsonq
