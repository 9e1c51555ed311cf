#include "eligo/core/trace.hpp"

#include <iostream>
#include <new>
#include <string>

#include "eligo/config.hpp"

namespace eligo::core {

auto trace_enabled() noexcept -> bool {
  static const bool enabled = [] {
    try {
      auto v = safe_getenv(kEnvTrace);
      return v && !v->empty() && (*v)[0] == '1';
    } catch (const std::bad_alloc&) {
      return false;
    }
  }();
  return enabled;
}

auto format_trace_line(std::string_view topic, std::string_view message) -> std::string {
  std::string line;
  line.reserve(topic.size() + message.size() + 12);
  line.append("[eligo][").append(topic).append("] ").append(message).append("\n");
  return line;
}

auto trace(std::string_view topic, std::string_view message) -> void {
  if (!trace_enabled()) return;
  std::cerr << format_trace_line(topic, message) << std::flush;
}

} // namespace eligo::core
