#include "eligo/error.hpp"

namespace eligo::core {

auto to_string(error_code code) noexcept -> const char* {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::missing_field: return "missing_field";
    case error_code::malformed_value: return "malformed_value";
    case error_code::invalid_composition: return "invalid_composition";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unimplemented: return "unimplemented";
    case error_code::internal: return "internal";
  }
  return "internal";
}

} // namespace eligo::core
