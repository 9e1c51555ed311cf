#pragma once

/** \file salary_rules.hpp
 *  \brief Rules on the gross salary ("salario_bruto") expressed in base salaries.
 *
 * The ratio salary / base is computed exactly; thresholds are exact decimals,
 * so 5225.00 / 1045.00 is exactly 5.
 */

#include <expected>

#include "eligo/decimal.hpp"
#include "eligo/specification.hpp"

namespace eligo::rules {

/** \brief Converts a raw salary into a multiple of a base salary.
 *
 * A zero base is not treated as "use the default": any non-positive base is
 * rejected with error_code::invalid_argument when a ratio is computed.
 */
class SalaryNormalizer {
public:
  /** \brief Uses core::configured_base_salary(). */
  SalaryNormalizer();
  explicit SalaryNormalizer(decimal base) : base_(std::move(base)) {}

  /** \brief raw / base; error_code::invalid_argument when base <= 0. */
  auto normalize(const decimal& raw) const -> std::expected<decimal, core::error>;

  /** \brief Reads "salario_bruto" and normalizes it. */
  auto ratio_of(const Candidate& candidate) const -> std::expected<decimal, core::error>;

  auto base() const noexcept -> const decimal& { return base_; }

private:
  decimal base_;
};

/** \brief ratio > threshold. */
class SalaryGreaterThan final : public Specification {
public:
  explicit SalaryGreaterThan(decimal threshold, SalaryNormalizer normalizer = {})
      : threshold_(std::move(threshold)), normalizer_(std::move(normalizer)) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto describe() const -> std::string override;

private:
  decimal threshold_;
  SalaryNormalizer normalizer_;
};

/** \brief ratio < threshold. */
class SalaryLessThan final : public Specification {
public:
  explicit SalaryLessThan(decimal threshold, SalaryNormalizer normalizer = {})
      : threshold_(std::move(threshold)), normalizer_(std::move(normalizer)) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto describe() const -> std::string override;

private:
  decimal threshold_;
  SalaryNormalizer normalizer_;
};

/** \brief first <= ratio <= second. */
class SalaryBetween final : public Specification {
public:
  SalaryBetween(decimal first, decimal second, SalaryNormalizer normalizer = {})
      : first_(std::move(first)), second_(std::move(second)), normalizer_(std::move(normalizer)) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto describe() const -> std::string override;

private:
  decimal first_;
  decimal second_;
  SalaryNormalizer normalizer_;
};

auto salary_greater_than(decimal threshold) -> spec_ptr;
auto salary_greater_than(decimal threshold, decimal base) -> spec_ptr;
auto salary_less_than(decimal threshold) -> spec_ptr;
auto salary_less_than(decimal threshold, decimal base) -> spec_ptr;
auto salary_between(decimal first, decimal second) -> spec_ptr;
auto salary_between(decimal first, decimal second, decimal base) -> spec_ptr;

} // namespace eligo::rules
