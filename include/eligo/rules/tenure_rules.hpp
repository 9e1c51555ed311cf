#pragma once

/** \file tenure_rules.hpp
 *  \brief Rules on time since admission ("data_de_admissao").
 *
 * Each rule freezes its reference time when constructed: the injected value,
 * else ELIGO_REFERENCE_TIME, else the wall clock at construction. Evaluation
 * never reads the clock, so repeated evaluations agree.
 *
 * Differences are absolute. The LessThan/AtLeast rules compare whole calendar
 * years; the Between rule compares whole days against years * 365, with
 * strict bounds on both sides. The two units do not agree near anniversaries
 * (five calendar years can be 1826 days, above 5 * 365) and this is kept as is.
 */

#include <cstdint>
#include <optional>

#include "eligo/specification.hpp"
#include "eligo/timestamp.hpp"

namespace eligo::rules {

inline constexpr std::int64_t kDaysPerYear = 365;

/** \brief Common state: threshold-independent frozen reference time. */
class TenureSpecification : public Specification {
public:
  auto reference_time() const noexcept -> timestamp { return frozen_; }

protected:
  explicit TenureSpecification(std::optional<timestamp> reference_time);

  auto admission_of(const Candidate& candidate) const -> std::expected<timestamp, core::error>;

  timestamp frozen_;
};

/** \brief whole years since admission < threshold. */
class AdmissionTimeInYearsLessThan final : public TenureSpecification {
public:
  explicit AdmissionTimeInYearsLessThan(std::int64_t threshold,
                                        std::optional<timestamp> reference_time = std::nullopt)
      : TenureSpecification(reference_time), threshold_(threshold) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto describe() const -> std::string override;

private:
  std::int64_t threshold_;
};

/** \brief whole years since admission >= threshold. */
class AdmissionTimeInYearsGreaterThan final : public TenureSpecification {
public:
  explicit AdmissionTimeInYearsGreaterThan(std::int64_t threshold,
                                           std::optional<timestamp> reference_time = std::nullopt)
      : TenureSpecification(reference_time), threshold_(threshold) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto describe() const -> std::string override;

private:
  std::int64_t threshold_;
};

/** \brief initial * 365 < whole days since admission < final * 365. */
class AdmissionTimeInYearsBetween final : public TenureSpecification {
public:
  AdmissionTimeInYearsBetween(std::int64_t initial, std::int64_t final_years,
                              std::optional<timestamp> reference_time = std::nullopt)
      : TenureSpecification(reference_time),
        initial_days_(initial * kDaysPerYear),
        final_days_(final_years * kDaysPerYear) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto describe() const -> std::string override;

  auto initial_days() const noexcept -> std::int64_t { return initial_days_; }
  auto final_days() const noexcept -> std::int64_t { return final_days_; }

private:
  std::int64_t initial_days_;
  std::int64_t final_days_;
};

auto admission_years_less_than(std::int64_t threshold,
                               std::optional<timestamp> reference_time = std::nullopt) -> spec_ptr;
auto admission_years_at_least(std::int64_t threshold,
                              std::optional<timestamp> reference_time = std::nullopt) -> spec_ptr;
auto admission_years_between(std::int64_t initial, std::int64_t final_years,
                             std::optional<timestamp> reference_time = std::nullopt) -> spec_ptr;

} // namespace eligo::rules
