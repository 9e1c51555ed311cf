#include "eligo/rules/salary_rules.hpp"

#include "eligo/config.hpp"

namespace eligo::rules {

SalaryNormalizer::SalaryNormalizer() : base_(core::configured_base_salary()) {}

auto SalaryNormalizer::normalize(const decimal& raw) const -> std::expected<decimal, core::error> {
  if (base_ <= 0) {
    return core::make_error(core::error_code::invalid_argument,
                            "base salary must be positive, got " + eligo::to_string(base_), "rules.salary");
  }
  return decimal(raw / base_);
}

auto SalaryNormalizer::ratio_of(const Candidate& candidate) const -> std::expected<decimal, core::error> {
  auto raw = candidate.get_decimal(fields::gross_salary);
  if (!raw) return std::unexpected(raw.error());
  return normalize(*raw);
}

auto SalaryGreaterThan::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto ratio = normalizer_.ratio_of(candidate);
  if (!ratio) return std::unexpected(ratio.error());
  return *ratio > threshold_;
}

auto SalaryGreaterThan::describe() const -> std::string {
  return "SalaryGreaterThan(threshold=" + eligo::to_string(threshold_) + ")";
}

auto SalaryLessThan::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto ratio = normalizer_.ratio_of(candidate);
  if (!ratio) return std::unexpected(ratio.error());
  return *ratio < threshold_;
}

auto SalaryLessThan::describe() const -> std::string {
  return "SalaryLessThan(threshold=" + eligo::to_string(threshold_) + ")";
}

auto SalaryBetween::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto ratio = normalizer_.ratio_of(candidate);
  if (!ratio) return std::unexpected(ratio.error());
  return first_ <= *ratio && *ratio <= second_;
}

auto SalaryBetween::describe() const -> std::string {
  return "SalaryBetween(first=" + eligo::to_string(first_) + ", second=" + eligo::to_string(second_) + ")";
}

auto salary_greater_than(decimal threshold) -> spec_ptr {
  return std::make_shared<SalaryGreaterThan>(std::move(threshold));
}

auto salary_greater_than(decimal threshold, decimal base) -> spec_ptr {
  return std::make_shared<SalaryGreaterThan>(std::move(threshold), SalaryNormalizer(std::move(base)));
}

auto salary_less_than(decimal threshold) -> spec_ptr {
  return std::make_shared<SalaryLessThan>(std::move(threshold));
}

auto salary_less_than(decimal threshold, decimal base) -> spec_ptr {
  return std::make_shared<SalaryLessThan>(std::move(threshold), SalaryNormalizer(std::move(base)));
}

auto salary_between(decimal first, decimal second) -> spec_ptr {
  return std::make_shared<SalaryBetween>(std::move(first), std::move(second));
}

auto salary_between(decimal first, decimal second, decimal base) -> spec_ptr {
  return std::make_shared<SalaryBetween>(std::move(first), std::move(second),
                                         SalaryNormalizer(std::move(base)));
}

} // namespace eligo::rules
