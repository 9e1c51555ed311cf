/** \file specification_algebra_test.cpp
 *  \brief Truth tables, flattening and construction rules of the combinators.
 */

#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <vector>

#include "eligo/rules/role_rules.hpp"
#include "eligo/specification.hpp"

using namespace eligo;
using eligo::core::error_code;

namespace {

auto constant(bool v) -> spec_ptr { return v ? always_true() : always_false(); }

// A subclass that forgets to override is_satisfied_by.
class BareSpecification final : public Specification {
public:
  BareSpecification() {}
};

const Candidate kAnyone{{"area", "Tecnologia"}, {"cargo", "Analista"}};

} // namespace

TEST_CASE("constants", "[spec]") {
  REQUIRE(always_true()->is_satisfied_by(kAnyone).value());
  REQUIRE_FALSE(always_false()->is_satisfied_by(kAnyone).value());
  REQUIRE(always_true()->kind() == spec_kind::true_node);
  REQUIRE(always_false()->kind() == spec_kind::false_node);
}

TEST_CASE("binary truth tables", "[spec]") {
  const std::vector<std::pair<bool, bool>> rows{{true, true}, {true, false}, {false, true}, {false, false}};
  for (auto [a, b] : rows) {
    INFO("a=" << a << " b=" << b);
    REQUIRE(and_(constant(a), constant(b))->is_satisfied_by(kAnyone).value() == (a && b));
    REQUIRE(or_(constant(a), constant(b))->is_satisfied_by(kAnyone).value() == (a || b));
    REQUIRE(xor_(constant(a), constant(b))->is_satisfied_by(kAnyone).value() == (a != b));
  }
  REQUIRE_FALSE(xor_(constant(true), constant(true))->is_satisfied_by(kAnyone).value());
  REQUIRE(xor_(constant(true), constant(false))->is_satisfied_by(kAnyone).value());
  REQUIRE(xor_(constant(false), constant(true))->is_satisfied_by(kAnyone).value());
  REQUIRE_FALSE(xor_(constant(false), constant(false))->is_satisfied_by(kAnyone).value());
}

TEST_CASE("negation", "[spec]") {
  for (bool a : {true, false}) {
    auto inner = constant(a);
    auto n = not_(inner);
    REQUIRE(n->kind() == spec_kind::not_node);
    REQUIRE(n->is_satisfied_by(kAnyone).value() == !a);
    REQUIRE(static_cast<const NotSpecification&>(*n).inner() == inner);
  }
}

TEST_CASE("leaf rules compose with constants", "[spec]") {
  REQUIRE(and_(rules::it_department(), always_true())->is_satisfied_by(kAnyone).value());
  REQUIRE_FALSE(and_(rules::it_department(), rules::trainee())->is_satisfied_by(kAnyone).value());
  REQUIRE(or_(rules::trainee(), rules::it_department())->is_satisfied_by(kAnyone).value());
  REQUIRE(xor_(rules::trainee(), rules::it_department())->is_satisfied_by(kAnyone).value());
  REQUIRE(not_(rules::trainee())->is_satisfied_by(kAnyone).value());
}

TEST_CASE("and_ flattens a left And operand in place", "[spec][flatten]") {
  auto a = always_true();
  auto b = always_true();
  auto c = always_false();

  auto ab = and_(a, b);
  REQUIRE(ab->kind() == spec_kind::and_node);
  auto abc = and_(ab, c);

  REQUIRE(abc == ab);  // same node, extended
  const auto& kids = static_cast<const AndSpecification&>(*abc).children();
  REQUIRE(kids.size() == 3);
  REQUIRE(kids[0] == a);
  REQUIRE(kids[1] == b);
  REQUIRE(kids[2] == c);

  auto nested = std::make_shared<AndSpecification>(std::vector<const_spec_ptr>{
      std::make_shared<AndSpecification>(std::vector<const_spec_ptr>{a, b}), c});
  REQUIRE(abc->is_satisfied_by(kAnyone).value() == nested->is_satisfied_by(kAnyone).value());
}

TEST_CASE("and_ of two And nodes concatenates children left then right", "[spec][flatten]") {
  auto p = std::vector<spec_ptr>{always_true(), always_false(), always_true(), always_false()};
  auto left = and_(p[0], p[1]);
  auto right = and_(p[2], p[3]);
  auto both = and_(left, right);

  REQUIRE(both == left);
  const auto& kids = static_cast<const AndSpecification&>(*both).children();
  REQUIRE(kids.size() == 4);
  for (std::size_t i = 0; i < kids.size(); ++i) REQUIRE(kids[i] == p[i]);
  // right operand is left untouched
  REQUIRE(static_cast<const AndSpecification&>(*right).children().size() == 2);
}

TEST_CASE("and_ with a non-And left operand allocates a new node", "[spec][flatten]") {
  auto leaf = always_true();
  auto ab = and_(always_true(), always_true());
  auto combined = and_(leaf, ab);
  REQUIRE(combined != ab);
  const auto& kids = static_cast<const AndSpecification&>(*combined).children();
  REQUIRE(kids.size() == 2);
  REQUIRE(kids[0] == leaf);
  REQUIRE(kids[1] == ab);

  auto x = xor_(always_true(), always_false());
  auto wrapped = and_(x, always_true());
  REQUIRE(wrapped != x);
  REQUIRE(static_cast<const AndSpecification&>(*wrapped).children().size() == 2);
}

TEST_CASE("and_ of a node with itself doubles its clauses", "[spec][flatten]") {
  auto ab = and_(always_true(), always_false());
  auto twice = and_(ab, ab);
  REQUIRE(twice == ab);
  REQUIRE(static_cast<const AndSpecification&>(*twice).children().size() == 4);
}

TEST_CASE("or_ flattens symmetrically", "[spec][flatten]") {
  auto a = always_false();
  auto b = always_false();
  auto c = always_true();
  auto ab = or_(a, b);
  auto abc = or_(ab, c);
  REQUIRE(abc == ab);
  REQUIRE(abc->kind() == spec_kind::or_node);
  REQUIRE(static_cast<const OrSpecification&>(*abc).children().size() == 3);
  REQUIRE(abc->is_satisfied_by(kAnyone).value());

  auto merged = or_(or_(a, b), or_(c, a));
  REQUIRE(static_cast<const OrSpecification&>(*merged).children().size() == 4);

  // Or does not flatten into And and vice versa
  auto mixed = or_(and_(a, b), c);
  REQUIRE(mixed->kind() == spec_kind::or_node);
  REQUIRE(static_cast<const OrSpecification&>(*mixed).children().size() == 2);
}

TEST_CASE("xor_ and not_ never mutate their operands", "[spec]") {
  auto ab = and_(always_true(), always_true());
  auto x = xor_(ab, always_false());
  auto n = not_(ab);
  REQUIRE(x != ab);
  REQUIRE(n != ab);
  REQUIRE(x->kind() == spec_kind::xor_node);
  REQUIRE(static_cast<const AndSpecification&>(*ab).children().size() == 2);
  REQUIRE(static_cast<const XorSpecification&>(*x).left() == ab);
}

TEST_CASE("empty And and Or are invalid compositions", "[spec][errors]") {
  auto empty_and = std::make_shared<AndSpecification>(std::vector<const_spec_ptr>{});
  auto empty_or = std::make_shared<OrSpecification>(std::vector<const_spec_ptr>{});
  REQUIRE(empty_and->is_satisfied_by(kAnyone).error().code == error_code::invalid_composition);
  REQUIRE(empty_or->is_satisfied_by(kAnyone).error().code == error_code::invalid_composition);
  REQUIRE(empty_and->remainder_unsatisfied_by(kAnyone).error().code == error_code::invalid_composition);
}

TEST_CASE("base specification reports unimplemented", "[spec][errors]") {
  auto bare = std::make_shared<BareSpecification>();
  auto r = bare->is_satisfied_by(kAnyone);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::unimplemented);
  REQUIRE(bare->remainder_unsatisfied_by(kAnyone).error().code == error_code::unimplemented);
  REQUIRE(and_(always_true(), bare)->is_satisfied_by(kAnyone).error().code == error_code::unimplemented);
}

TEST_CASE("errors from any clause surface even after a false clause", "[spec][errors]") {
  const Candidate no_area{{"cargo", "Analista"}};
  auto rule = and_(always_false(), rules::it_department());
  REQUIRE(rule->is_satisfied_by(no_area).error().code == error_code::missing_field);
  auto any = or_(always_true(), rules::it_department());
  REQUIRE(any->is_satisfied_by(no_area).error().code == error_code::missing_field);
  REQUIRE(xor_(always_true(), rules::it_department())->is_satisfied_by(no_area).error().code ==
          error_code::missing_field);
  REQUIRE(not_(rules::it_department())->is_satisfied_by(no_area).error().code == error_code::missing_field);
}

TEST_CASE("describe renders the tree", "[spec]") {
  REQUIRE(and_(rules::it_department(), rules::trainee())->describe() == "ITDepartment() And Trainee()");
  REQUIRE(or_(rules::trainee(), rules::director_board())->describe() == "Trainee() Or DirectorBoard()");
  REQUIRE(not_(rules::trainee())->describe() == "Not(Trainee())");
  REQUIRE(xor_(rules::trainee(), always_true())->describe() == "(Trainee() Xor True)");
  REQUIRE(and_(rules::it_department(), or_(rules::trainee(), rules::director_board()))->describe() ==
          "ITDepartment() And (Trainee() Or DirectorBoard())");
}

TEST_CASE("builder assembles a flattened tree", "[spec][builder]") {
  SpecificationBuilder builder(rules::it_department());
  builder.and_with(rules::role_is("analista")).and_with(always_true());
  const_spec_ptr rule = builder.build();

  REQUIRE(rule->kind() == spec_kind::and_node);
  REQUIRE(static_cast<const AndSpecification&>(*rule).children().size() == 3);
  REQUIRE(rule->is_satisfied_by(kAnyone).value());
  REQUIRE(builder.build() == nullptr);

  auto negated = SpecificationBuilder(rules::trainee()).or_with(always_false()).negate().build();
  REQUIRE(negated->kind() == spec_kind::not_node);
  REQUIRE(negated->is_satisfied_by(kAnyone).value());

  auto exclusive = SpecificationBuilder(rules::trainee()).xor_with(rules::it_department()).build();
  REQUIRE(exclusive->is_satisfied_by(kAnyone).value());
}
