#include <chrono>
#include <fstream>
#include <stdexcept>

#include <jsonq/util/tracer.hpp>

namespace jsonq::util {

static uint64_t now_ns() {
  auto now = std::chrono::steady_clock::now();
  auto epoch = now.time_since_epoch();
  return std::chrono::duration_cast<std::chrono::nanoseconds>(epoch).count();
}

trace_id Tracer::start_trace(std::string task) {
  auto start_ns = now_ns();
  std::lock_guard<std::mutex> lock(tracer_mutex);
  traces.emplace_back(task, start_ns);
  return trace_id { traces.size() - 1, generation };
}

void Tracer::finish_trace(trace_id id) {
  auto end_ns = now_ns();
  std::lock_guard<std::mutex> lock(tracer_mutex);
  if (id.generation != generation) {
    // Traces were cleared while this one was running.
    return;
  }
  auto& trace = traces[id.index];
  trace.duration_ns = end_ns - trace.start_ns;
}

std::vector<Trace> Tracer::get_traces() {
  std::lock_guard<std::mutex> lock(tracer_mutex);
  return traces;
}

void Tracer::clear() {
  std::lock_guard<std::mutex> lock(tracer_mutex);
  traces.clear();
  generation++;
}

void Tracer::export_traces(const std::string &file_name) {
  std::ofstream output(file_name);
  if (!output.is_open()) {
    throw std::runtime_error("Could not open trace file: " + file_name);
  }

  output << "task,start_ns,duration_ns" << std::endl;

  std::lock_guard<std::mutex> lock(tracer_mutex);
  if (traces.empty()) {
    return;
  }

  auto first_start_ns = traces[0].start_ns;

  for (const auto &trace : traces) {
    auto start_ns = trace.start_ns - first_start_ns;
    output << trace.task << "," << start_ns << "," << trace.duration_ns << std::endl;
  }
}

ScopedTrace::ScopedTrace(std::string task, bool enabled)
  : enabled(enabled) {
  if (enabled) {
    id = Tracer::get_instance().start_trace(task);
  }
}

ScopedTrace::~ScopedTrace() {
  if (enabled) {
    Tracer::get_instance().finish_trace(id);
  }
}

} // namespace jsonq::util
