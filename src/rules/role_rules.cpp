#include "eligo/rules/role_rules.hpp"

#include "case_fold.hpp"

namespace eligo::rules {

FieldMatchSpecification::FieldMatchSpecification(std::string_view field, std::string value,
                                                 std::string label)
    : field_(field), value_(detail::fold_case(value)), label_(std::move(label)) {}

auto FieldMatchSpecification::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto text = candidate.get_text(field_);
  if (!text) return std::unexpected(text.error());
  return detail::fold_case(*text) == value_;
}

auto area_is(std::string department) -> spec_ptr {
  std::string label = "AreaIs(" + department + ")";
  return std::make_shared<FieldMatchSpecification>(fields::area, std::move(department), std::move(label));
}

auto role_is(std::string role) -> spec_ptr {
  std::string label = "RoleIs(" + role + ")";
  return std::make_shared<FieldMatchSpecification>(fields::role, std::move(role), std::move(label));
}

auto director_board() -> spec_ptr {
  return std::make_shared<FieldMatchSpecification>(fields::area, "diretoria", "DirectorBoard()");
}

auto accounting_department() -> spec_ptr {
  return std::make_shared<FieldMatchSpecification>(fields::area, "contabilidade", "AccountingDepartment()");
}

auto financial_department() -> spec_ptr {
  return std::make_shared<FieldMatchSpecification>(fields::area, "financeiro", "FinancialDepartment()");
}

auto it_department() -> spec_ptr {
  return std::make_shared<FieldMatchSpecification>(fields::area, "tecnologia", "ITDepartment()");
}

auto facilities_department() -> spec_ptr {
  return std::make_shared<FieldMatchSpecification>(fields::area, "serviços gerais", "FacilitiesDepartment()");
}

auto customer_experience_department() -> spec_ptr {
  return std::make_shared<FieldMatchSpecification>(fields::area, "relacionamento com o cliente",
                                                   "CustomerExperienceDepartment()");
}

auto trainee() -> spec_ptr {
  return std::make_shared<FieldMatchSpecification>(fields::role, "estagiario", "Trainee()");
}

} // namespace eligo::rules
