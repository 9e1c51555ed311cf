#include "eligo/config.hpp"

#include <cstdlib>

#include "eligo/core/trace.hpp"

namespace eligo::core {

namespace {

auto read_base_salary() -> std::expected<std::optional<decimal>, error> {
  auto raw = safe_getenv(kEnvBaseSalary);
  if (!raw || raw->empty()) return std::optional<decimal>{};
  auto base = parse_decimal(*raw);
  if (!base) {
    return make_error(error_code::config_invalid,
                      std::string(kEnvBaseSalary) + ": " + base.error().message, "config");
  }
  if (*base <= 0) {
    return make_error(error_code::config_invalid,
                      std::string(kEnvBaseSalary) + " must be positive, got '" + *raw + "'",
                      "config");
  }
  return std::optional<decimal>{std::move(*base)};
}

auto read_reference_time() -> std::expected<std::optional<timestamp>, error> {
  auto raw = safe_getenv(kEnvReferenceTime);
  if (!raw || raw->empty()) return std::optional<timestamp>{};
  auto ref = parse_timestamp(*raw);
  if (!ref) {
    return make_error(error_code::config_invalid,
                      std::string(kEnvReferenceTime) + ": " + ref.error().message, "config");
  }
  return std::optional<timestamp>{*ref};
}

} // anonymous namespace

auto standard_base_salary() -> decimal {
  return decimal(104500, 100);
}

auto safe_getenv(const char* name) -> std::optional<std::string> {
  if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
  char* buf = nullptr;
  std::size_t len = 0;
  if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
    std::free(buf);
    return std::nullopt;
  }
  std::string value(buf);
  std::free(buf);
  return value;
#else
  const char* v = std::getenv(name);
  if (!v) return std::nullopt;
  return std::string(v);
#endif
}

auto load_settings() -> std::expected<settings, error> {
  settings out{};

  auto base = read_base_salary();
  if (!base) return std::unexpected(base.error());
  if (*base) out.base_salary = std::move(**base);

  auto ref = read_reference_time();
  if (!ref) return std::unexpected(ref.error());
  out.reference_time = *ref;

  if (auto raw = safe_getenv(kEnvTrace); raw && !raw->empty()) {
    out.trace = ((*raw)[0] == '1');
  }
  return out;
}

auto configured_base_salary() -> decimal {
  auto base = read_base_salary();
  if (!base) {
    trace("config", base.error().message + "; using built-in base salary");
    return standard_base_salary();
  }
  return *base ? **base : standard_base_salary();
}

auto configured_reference_time() -> timestamp {
  auto ref = read_reference_time();
  if (!ref) {
    trace("config", ref.error().message + "; using wall clock");
    return now_seconds();
  }
  return *ref ? **ref : now_seconds();
}

} // namespace eligo::core
