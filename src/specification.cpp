#include "eligo/specification.hpp"

#include <algorithm>
#include <utility>

#include "eligo/core/trace.hpp"

namespace eligo {

namespace {

auto is_multary(const Specification& s) noexcept -> bool {
  return s.kind() == spec_kind::and_node || s.kind() == spec_kind::or_node;
}

// Nested And/Or children are parenthesized so "A And (B Or C)" stays readable.
auto describe_operand(const Specification& s) -> std::string {
  return is_multary(s) ? "(" + s.describe() + ")" : s.describe();
}

} // anonymous namespace

// Specification

auto Specification::owning_handle() const -> std::expected<const_spec_ptr, core::error> {
  const_spec_ptr self = weak_from_this().lock();
  if (!self) {
    return core::make_error(core::error_code::invalid_composition,
                            "specification not owned by shared_ptr: " + describe(), "spec");
  }
  return self;
}

auto Specification::is_satisfied_by(const Candidate&) const -> std::expected<bool, core::error> {
  return core::make_error(core::error_code::unimplemented,
                          "is_satisfied_by not implemented by " + describe(), "spec");
}

auto Specification::remainder_unsatisfied_by(const Candidate& candidate) const
    -> std::expected<const_spec_ptr, core::error> {
  auto ok = is_satisfied_by(candidate);
  if (!ok) return std::unexpected(ok.error());
  if (*ok) return const_spec_ptr{};
  return owning_handle();
}

auto Specification::describe() const -> std::string {
  return "Specification";
}

// MultaryCompositeSpecification

auto MultaryCompositeSpecification::absorb(const const_spec_ptr& other) -> void {
  if (other && other->kind() == kind()) {
    // Copy first: other may be this node.
    const auto incoming = static_cast<const MultaryCompositeSpecification&>(*other).children_;
    children_.insert(children_.end(), incoming.begin(), incoming.end());
  } else {
    children_.push_back(other);
  }
}

auto MultaryCompositeSpecification::describe() const -> std::string {
  std::string out;
  for (std::size_t i = 0; i < children_.size(); ++i) {
    if (i) out += separator();
    out += children_[i] ? describe_operand(*children_[i]) : "<null>";
  }
  return out;
}

auto MultaryCompositeSpecification::evaluate_children(const Candidate& candidate) const
    -> std::expected<std::vector<bool>, core::error> {
  if (children_.empty()) {
    return core::make_error(core::error_code::invalid_composition,
                            std::string("cannot evaluate an empty") + separator() + "node", "spec");
  }
  std::vector<bool> results;
  results.reserve(children_.size());
  for (const auto& child : children_) {
    if (!child) {
      return core::make_error(core::error_code::invalid_composition, "null child specification", "spec");
    }
    auto r = child->is_satisfied_by(candidate);
    if (!r) return std::unexpected(r.error());
    results.push_back(*r);
  }
  return results;
}

// AndSpecification

auto AndSpecification::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto results = evaluate_children(candidate);
  if (!results) return std::unexpected(results.error());
  return std::all_of(results->begin(), results->end(), [](bool b) { return b; });
}

auto AndSpecification::remainder_unsatisfied_by(const Candidate& candidate) const
    -> std::expected<const_spec_ptr, core::error> {
  auto results = evaluate_children(candidate);
  if (!results) return std::unexpected(results.error());

  std::vector<const_spec_ptr> failed;
  for (std::size_t i = 0; i < children_.size(); ++i) {
    if (!(*results)[i]) failed.push_back(children_[i]);
  }
  if (core::trace_enabled()) {
    core::trace("remainder", std::to_string(failed.size()) + " of " +
                                 std::to_string(children_.size()) + " clauses unsatisfied");
  }
  if (failed.empty()) return const_spec_ptr{};
  if (failed.size() == 1) return failed.front();
  if (failed.size() == children_.size()) return owning_handle();
  return std::make_shared<AndSpecification>(std::move(failed));
}

// OrSpecification

auto OrSpecification::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  auto results = evaluate_children(candidate);
  if (!results) return std::unexpected(results.error());
  return std::any_of(results->begin(), results->end(), [](bool b) { return b; });
}

// XorSpecification

auto XorSpecification::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  if (!left_ || !right_) {
    return core::make_error(core::error_code::invalid_composition, "Xor requires two operands", "spec");
  }
  auto l = left_->is_satisfied_by(candidate);
  if (!l) return std::unexpected(l.error());
  auto r = right_->is_satisfied_by(candidate);
  if (!r) return std::unexpected(r.error());
  return *l != *r;
}

auto XorSpecification::describe() const -> std::string {
  return "(" + (left_ ? describe_operand(*left_) : "<null>") + " Xor " +
         (right_ ? describe_operand(*right_) : "<null>") + ")";
}

// NotSpecification

auto NotSpecification::is_satisfied_by(const Candidate& candidate) const
    -> std::expected<bool, core::error> {
  if (!inner_) {
    return core::make_error(core::error_code::invalid_composition, "Not requires an operand", "spec");
  }
  auto v = inner_->is_satisfied_by(candidate);
  if (!v) return std::unexpected(v.error());
  return !*v;
}

auto NotSpecification::describe() const -> std::string {
  return "Not(" + (inner_ ? inner_->describe() : "<null>") + ")";
}

// Combinators

auto and_(spec_ptr a, const_spec_ptr b) -> spec_ptr {
  if (a && a->kind() == spec_kind::and_node) {
    static_cast<AndSpecification&>(*a).absorb(b);
    return a;
  }
  return std::make_shared<AndSpecification>(std::vector<const_spec_ptr>{std::move(a), std::move(b)});
}

auto or_(spec_ptr a, const_spec_ptr b) -> spec_ptr {
  if (a && a->kind() == spec_kind::or_node) {
    static_cast<OrSpecification&>(*a).absorb(b);
    return a;
  }
  return std::make_shared<OrSpecification>(std::vector<const_spec_ptr>{std::move(a), std::move(b)});
}

auto xor_(const_spec_ptr a, const_spec_ptr b) -> spec_ptr {
  return std::make_shared<XorSpecification>(std::move(a), std::move(b));
}

auto not_(const_spec_ptr a) -> spec_ptr {
  return std::make_shared<NotSpecification>(std::move(a));
}

auto always_true() -> spec_ptr { return std::make_shared<TrueSpecification>(); }
auto always_false() -> spec_ptr { return std::make_shared<FalseSpecification>(); }

// SpecificationBuilder

auto SpecificationBuilder::and_with(const_spec_ptr other) -> SpecificationBuilder& {
  root_ = and_(std::move(root_), std::move(other));
  return *this;
}

auto SpecificationBuilder::or_with(const_spec_ptr other) -> SpecificationBuilder& {
  root_ = or_(std::move(root_), std::move(other));
  return *this;
}

auto SpecificationBuilder::xor_with(const_spec_ptr other) -> SpecificationBuilder& {
  root_ = xor_(std::move(root_), std::move(other));
  return *this;
}

auto SpecificationBuilder::negate() -> SpecificationBuilder& {
  root_ = not_(std::move(root_));
  return *this;
}

auto SpecificationBuilder::build() -> const_spec_ptr {
  return std::exchange(root_, nullptr);
}

} // namespace eligo
