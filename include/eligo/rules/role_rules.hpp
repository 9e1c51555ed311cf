#pragma once

/** \file role_rules.hpp
 *  \brief Department ("area") and role ("cargo") matching rules.
 *
 * Matching is exact after case folding: "TECNOLOGIA" and "Tecnologia" both
 * match "tecnologia"; "Tecnologia " does not.
 */

#include <string>
#include <string_view>

#include "eligo/specification.hpp"

namespace eligo::rules {

/** \brief Case-insensitive equality of a text field with a fixed value. */
class FieldMatchSpecification : public Specification {
public:
  /**
   * \param field  candidate key to read
   * \param value  expected value, compared case-insensitively
   * \param label  rendering used by describe(), e.g. "ITDepartment()"
   */
  FieldMatchSpecification(std::string_view field, std::string value, std::string label);

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto describe() const -> std::string override { return label_; }

  auto field() const noexcept -> const std::string& { return field_; }
  auto value() const noexcept -> const std::string& { return value_; }

private:
  std::string field_;
  std::string value_;   /**< stored case-folded */
  std::string label_;
};

/** \brief Department name match on "area". */
auto area_is(std::string department) -> spec_ptr;

/** \brief Role name match on "cargo". */
auto role_is(std::string role) -> spec_ptr;

auto director_board() -> spec_ptr;                  /**< area "diretoria" */
auto accounting_department() -> spec_ptr;           /**< area "contabilidade" */
auto financial_department() -> spec_ptr;            /**< area "financeiro" */
auto it_department() -> spec_ptr;                   /**< area "tecnologia" */
auto facilities_department() -> spec_ptr;           /**< area "serviços gerais" */
auto customer_experience_department() -> spec_ptr;  /**< area "relacionamento com o cliente" */
auto trainee() -> spec_ptr;                         /**< cargo "estagiario" */

} // namespace eligo::rules
