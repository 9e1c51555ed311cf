/** \file role_rules_test.cpp
 *  \brief Department and role matching.
 */

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "eligo/rules/role_rules.hpp"

using namespace eligo;
using eligo::core::error_code;

namespace {

Candidate in_area(const std::string& area) { return Candidate{{"area", area}, {"cargo", "Analista"}}; }

} // namespace

TEST_CASE("each department matches its own name only", "[rules][area]") {
  struct row { spec_ptr rule; const char* area; };
  const row rows[] = {
      {rules::director_board(), "Diretoria"},
      {rules::accounting_department(), "Contabilidade"},
      {rules::financial_department(), "Financeiro"},
      {rules::it_department(), "Tecnologia"},
      {rules::facilities_department(), "Serviços Gerais"},
      {rules::customer_experience_department(), "Relacionamento com o Cliente"},
  };
  for (const auto& r : rows) {
    for (const auto& other : rows) {
      INFO(r.rule->describe() << " vs " << other.area);
      REQUIRE(r.rule->is_satisfied_by(in_area(other.area)).value() == (&r == &other));
    }
  }
}

TEST_CASE("area matching ignores case", "[rules][area]") {
  auto it = rules::it_department();
  REQUIRE(it->is_satisfied_by(in_area("TECNOLOGIA")).value());
  REQUIRE(it->is_satisfied_by(in_area("tecnologia")).value());
  REQUIRE(it->is_satisfied_by(in_area("TeCnOlOgIa")).value());

  auto facilities = rules::facilities_department();
  REQUIRE(facilities->is_satisfied_by(in_area("SERVIÇOS GERAIS")).value());
  REQUIRE(facilities->is_satisfied_by(in_area("serviços gerais")).value());
}

TEST_CASE("area matching is otherwise exact", "[rules][area]") {
  auto it = rules::it_department();
  REQUIRE_FALSE(it->is_satisfied_by(in_area("Tecnologia ")).value());
  REQUIRE_FALSE(it->is_satisfied_by(in_area("Tecnologia da Informação")).value());
  REQUIRE_FALSE(rules::facilities_department()->is_satisfied_by(in_area("Servicos Gerais")).value());
}

TEST_CASE("trainee matches the role field", "[rules][role]") {
  auto t = rules::trainee();
  REQUIRE(t->is_satisfied_by(Candidate{{"cargo", "Estagiario"}}).value());
  REQUIRE(t->is_satisfied_by(Candidate{{"cargo", "ESTAGIARIO"}}).value());
  REQUIRE_FALSE(t->is_satisfied_by(Candidate{{"cargo", "Analista"}}).value());
  // department does not matter
  REQUIRE_FALSE(t->is_satisfied_by(Candidate{{"area", "Estagiario"}, {"cargo", "Gerente"}}).value());
}

TEST_CASE("generic area and role matchers", "[rules]") {
  auto sales = rules::area_is("Vendas");
  REQUIRE(sales->is_satisfied_by(in_area("VENDAS")).value());
  REQUIRE(sales->describe() == "AreaIs(Vendas)");

  auto manager = rules::role_is("Gerente");
  REQUIRE(manager->is_satisfied_by(Candidate{{"cargo", "gerente"}}).value());
  REQUIRE(manager->describe() == "RoleIs(Gerente)");
}

TEST_CASE("missing or non-text fields are errors", "[rules][errors]") {
  REQUIRE(rules::it_department()->is_satisfied_by(Candidate{{"cargo", "Analista"}}).error().code ==
          error_code::missing_field);
  REQUIRE(rules::trainee()->is_satisfied_by(Candidate{{"area", "Tecnologia"}}).error().code ==
          error_code::missing_field);

  Candidate numeric;
  numeric.set_decimal("cargo", decimal(1));
  REQUIRE(rules::trainee()->is_satisfied_by(numeric).error().code == error_code::malformed_value);
}

TEST_CASE("describe uses the rule names", "[rules]") {
  REQUIRE(rules::director_board()->describe() == "DirectorBoard()");
  REQUIRE(rules::accounting_department()->describe() == "AccountingDepartment()");
  REQUIRE(rules::financial_department()->describe() == "FinancialDepartment()");
  REQUIRE(rules::it_department()->describe() == "ITDepartment()");
  REQUIRE(rules::facilities_department()->describe() == "FacilitiesDepartment()");
  REQUIRE(rules::customer_experience_department()->describe() == "CustomerExperienceDepartment()");
  REQUIRE(rules::trainee()->describe() == "Trainee()");
}
