#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <mutex>

namespace jsonq::util {

// Index of a trace, tagged with the clear() generation it was started in.
struct trace_id {
  size_t index = 0;
  uint64_t generation = 0;
};

struct Trace {
  std::string task;
  uint64_t start_ns;
  uint64_t duration_ns = 0;

  Trace(std::string task, uint64_t start_ns)
    : task(task), start_ns(start_ns) {}
};

// Process-wide record of timed tasks, exported as CSV.
class Tracer {
public:
  static Tracer& get_instance() {
    static Tracer instance;
    return instance;
  }

  trace_id start_trace(std::string task);
  void finish_trace(trace_id id);

  std::vector<Trace> get_traces();
  void clear();

  void export_traces(const std::string &file_name);
private:
  Tracer() {}

  std::vector<Trace> traces;
  uint64_t generation = 0;

  std::mutex tracer_mutex;
public:
  Tracer(Tracer const&)          = delete;
  void operator=(Tracer const&)  = delete;
};

// Records `task` from construction to destruction. Does nothing when
// constructed disabled.
class ScopedTrace {
public:
  ScopedTrace(std::string task, bool enabled = true);
  ~ScopedTrace();

  ScopedTrace(ScopedTrace const&)    = delete;
  void operator=(ScopedTrace const&) = delete;
private:
  bool enabled;
  trace_id id;
};

} // namespace jsonq::util
