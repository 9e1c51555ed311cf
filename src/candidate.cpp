#include "eligo/candidate.hpp"

#include "eligo/core/trace.hpp"

namespace eligo {

namespace {

auto field_error(core::error_code code, std::string_view key, std::string detail) -> std::unexpected<core::error> {
  std::string msg = (code == core::error_code::missing_field)
                        ? "missing field '" + std::string(key) + "'"
                        : "field '" + std::string(key) + "': " + detail;
  core::trace("candidate", msg);
  return core::make_error(code, std::move(msg), "candidate");
}

} // anonymous namespace

Candidate::Candidate(std::initializer_list<std::pair<std::string, std::string>> text_fields) {
  for (const auto& [key, value] : text_fields) set_text(key, value);
}

auto Candidate::set_text(std::string key, std::string value) -> Candidate& {
  fields_.insert_or_assign(std::move(key), field_value{std::in_place_type<std::string>, std::move(value)});
  return *this;
}

auto Candidate::set_decimal(std::string key, decimal value) -> Candidate& {
  fields_.insert_or_assign(std::move(key), field_value{std::in_place_type<decimal>, std::move(value)});
  return *this;
}

auto Candidate::set_timestamp(std::string key, timestamp value) -> Candidate& {
  fields_.insert_or_assign(std::move(key), field_value{std::in_place_type<timestamp>, value});
  return *this;
}

auto Candidate::erase(std::string_view key) -> bool {
  auto it = fields_.find(key);
  if (it == fields_.end()) return false;
  fields_.erase(it);
  return true;
}

auto Candidate::contains(std::string_view key) const -> bool {
  return fields_.find(key) != fields_.end();
}

auto Candidate::get(std::string_view key) const
    -> std::expected<std::reference_wrapper<const field_value>, core::error> {
  auto it = fields_.find(key);
  if (it == fields_.end()) return field_error(core::error_code::missing_field, key, {});
  return std::cref(it->second);
}

auto Candidate::get_text(std::string_view key) const -> std::expected<std::string, core::error> {
  auto v = get(key);
  if (!v) return std::unexpected(v.error());
  if (const auto* s = std::get_if<std::string>(&v->get())) return *s;
  return field_error(core::error_code::malformed_value, key, "expected text");
}

auto Candidate::get_decimal(std::string_view key) const -> std::expected<decimal, core::error> {
  auto v = get(key);
  if (!v) return std::unexpected(v.error());
  const field_value& value = v->get();
  if (const auto* d = std::get_if<decimal>(&value)) return *d;
  if (const auto* s = std::get_if<std::string>(&value)) {
    auto parsed = parse_decimal(*s);
    if (!parsed) return field_error(core::error_code::malformed_value, key, parsed.error().message);
    return parsed;
  }
  return field_error(core::error_code::malformed_value, key, "expected a decimal");
}

auto Candidate::get_timestamp(std::string_view key) const -> std::expected<timestamp, core::error> {
  auto v = get(key);
  if (!v) return std::unexpected(v.error());
  const field_value& value = v->get();
  if (const auto* t = std::get_if<timestamp>(&value)) return *t;
  if (const auto* s = std::get_if<std::string>(&value)) {
    auto parsed = parse_timestamp(*s);
    if (!parsed) return field_error(core::error_code::malformed_value, key, parsed.error().message);
    return parsed;
  }
  return field_error(core::error_code::malformed_value, key, "expected a date");
}

auto validate_employee(const Candidate& candidate) -> std::expected<void, core::error> {
  if (auto r = candidate.get_text(fields::area); !r) return std::unexpected(r.error());
  if (auto r = candidate.get_text(fields::role); !r) return std::unexpected(r.error());
  if (auto r = candidate.get_decimal(fields::gross_salary); !r) return std::unexpected(r.error());
  if (auto r = candidate.get_timestamp(fields::admission_date); !r) return std::unexpected(r.error());
  return {};
}

} // namespace eligo
