#include "eligo/rules/tenure_rules.hpp"

#include "eligo/config.hpp"

namespace eligo::rules {

TenureSpecification::TenureSpecification(std::optional<timestamp> reference_time)
    : frozen_(reference_time ? *reference_time : core::configured_reference_time()) {}

auto TenureSpecification::admission_of(const Candidate& candidate) const
    -> std::expected<timestamp, core::error> {
  return candidate.get_timestamp(fields::admission_date);
}

auto AdmissionTimeInYearsLessThan::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto admission = admission_of(candidate);
  if (!admission) return std::unexpected(admission.error());
  return whole_years_between(*admission, frozen_) < threshold_;
}

auto AdmissionTimeInYearsLessThan::describe() const -> std::string {
  return "AdmissionTimeInYearsLessThan(threshold=" + std::to_string(threshold_) +
         ", current_time=" + eligo::to_string(frozen_) + ")";
}

auto AdmissionTimeInYearsGreaterThan::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto admission = admission_of(candidate);
  if (!admission) return std::unexpected(admission.error());
  return whole_years_between(*admission, frozen_) >= threshold_;
}

auto AdmissionTimeInYearsGreaterThan::describe() const -> std::string {
  return "AdmissionTimeInYearsGreaterThan(threshold=" + std::to_string(threshold_) +
         ", current_time=" + eligo::to_string(frozen_) + ")";
}

auto AdmissionTimeInYearsBetween::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto admission = admission_of(candidate);
  if (!admission) return std::unexpected(admission.error());
  const std::int64_t days = whole_days_between(*admission, frozen_);
  return initial_days_ < days && days < final_days_;
}

auto AdmissionTimeInYearsBetween::describe() const -> std::string {
  return "AdmissionTimeInYearsBetween(initial=" + std::to_string(initial_days_) +
         ", final=" + std::to_string(final_days_) + ")";
}

auto admission_years_less_than(std::int64_t threshold, std::optional<timestamp> reference_time)
    -> spec_ptr {
  return std::make_shared<AdmissionTimeInYearsLessThan>(threshold, reference_time);
}

auto admission_years_at_least(std::int64_t threshold, std::optional<timestamp> reference_time)
    -> spec_ptr {
  return std::make_shared<AdmissionTimeInYearsGreaterThan>(threshold, reference_time);
}

auto admission_years_between(std::int64_t initial, std::int64_t final_years,
                             std::optional<timestamp> reference_time) -> spec_ptr {
  return std::make_shared<AdmissionTimeInYearsBetween>(initial, final_years, reference_time);
}

} // namespace eligo::rules
