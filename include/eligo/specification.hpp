#pragma once

/** \file specification.hpp
 *  \brief Composable boolean specifications over a Candidate.
 *
 * A specification tree is built from leaf rules and the combinators and_(),
 * or_(), xor_() and not_(), then evaluated any number of times.
 *
 * Ownership: nodes are owned through std::shared_ptr. spec_ptr is the
 * construction handle; children and published trees are const_spec_ptr.
 * A remainder that would hand back a node not owned by a shared_ptr is
 * reported as error_code::invalid_composition.
 *
 * Thread-safety: and_() and or_() may extend their left operand in place
 * (associative flattening), so a tree must be assembled by a single owner.
 * Once published as const_spec_ptr, is_satisfied_by() and
 * remainder_unsatisfied_by() are pure and may run concurrently.
 *
 * Example usage:
 * ```cpp
 * auto rule = and_(and_(rules::it_department(), rules::salary_greater_than(4)),
 *                  rules::admission_years_less_than(2));
 * auto failed = rule->remainder_unsatisfied_by(candidate);
 * if (failed && *failed) std::cout << (*failed)->describe();
 * ```
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "eligo/candidate.hpp"
#include "eligo/error.hpp"

namespace eligo {

class Specification;
using spec_ptr = std::shared_ptr<Specification>;
using const_spec_ptr = std::shared_ptr<const Specification>;

/** \brief Node variant tag. */
enum class spec_kind : std::uint8_t {
  leaf,
  and_node,
  or_node,
  xor_node,
  not_node,
  true_node,
  false_node,
};

/** \brief Boolean predicate over a Candidate. */
class Specification : public std::enable_shared_from_this<Specification> {
public:
  virtual ~Specification() = default;

  Specification(const Specification&) = delete;
  Specification& operator=(const Specification&) = delete;

  /** \brief Evaluate against one candidate.
   *
   * \return truth value, or the data-contract error raised by a leaf.
   *         The base implementation reports error_code::unimplemented.
   */
  virtual auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error>;

  /** \brief What failed for this candidate.
   *
   * \return nullptr when satisfied; otherwise the node itself. And narrows
   *         this to the failing clauses.
   */
  virtual auto remainder_unsatisfied_by(const Candidate& candidate) const
      -> std::expected<const_spec_ptr, core::error>;

  virtual auto kind() const noexcept -> spec_kind { return spec_kind::leaf; }

  /** \brief Readable rendering, e.g. "SalaryGreaterThan(threshold=4)". */
  virtual auto describe() const -> std::string;

protected:
  Specification() = default;

  /** \brief shared_ptr to this node, or error_code::invalid_composition when
   * the node is not owned by a std::shared_ptr (e.g. a stack instance).
   */
  auto owning_handle() const -> std::expected<const_spec_ptr, core::error>;
};

/** \brief Shared state of And and Or. */
class MultaryCompositeSpecification : public Specification {
public:
  auto children() const noexcept -> const std::vector<const_spec_ptr>& { return children_; }

  /** \brief Append other, or other's children when other is the same kind.
   *
   * Construction-time only: mutates this node.
   */
  auto absorb(const const_spec_ptr& other) -> void;

  auto describe() const -> std::string override;

protected:
  explicit MultaryCompositeSpecification(std::vector<const_spec_ptr> children)
      : children_(std::move(children)) {}

  virtual auto separator() const -> const char* = 0;

  /** \brief Evaluate every child in order; first error wins. */
  auto evaluate_children(const Candidate& candidate) const
      -> std::expected<std::vector<bool>, core::error>;

  std::vector<const_spec_ptr> children_;
};

/** \brief Satisfied iff all children are satisfied. */
class AndSpecification final : public MultaryCompositeSpecification {
public:
  explicit AndSpecification(std::vector<const_spec_ptr> children)
      : MultaryCompositeSpecification(std::move(children)) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;

  /** \brief Failing clauses only.
   *
   * None failing: nullptr. One: that child. All: this node unchanged.
   * Otherwise a new And of the failing children in their original order.
   */
  auto remainder_unsatisfied_by(const Candidate& candidate) const
      -> std::expected<const_spec_ptr, core::error> override;

  auto kind() const noexcept -> spec_kind override { return spec_kind::and_node; }

protected:
  auto separator() const -> const char* override { return " And "; }
};

/** \brief Satisfied iff at least one child is satisfied. */
class OrSpecification final : public MultaryCompositeSpecification {
public:
  explicit OrSpecification(std::vector<const_spec_ptr> children)
      : MultaryCompositeSpecification(std::move(children)) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;

  auto kind() const noexcept -> spec_kind override { return spec_kind::or_node; }

protected:
  auto separator() const -> const char* override { return " Or "; }
};

/** \brief Satisfied iff exactly one of left and right is satisfied. */
class XorSpecification final : public Specification {
public:
  XorSpecification(const_spec_ptr left, const_spec_ptr right)
      : left_(std::move(left)), right_(std::move(right)) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto kind() const noexcept -> spec_kind override { return spec_kind::xor_node; }
  auto describe() const -> std::string override;

  auto left() const noexcept -> const const_spec_ptr& { return left_; }
  auto right() const noexcept -> const const_spec_ptr& { return right_; }

private:
  const_spec_ptr left_;
  const_spec_ptr right_;
};

/** \brief Negation. */
class NotSpecification final : public Specification {
public:
  explicit NotSpecification(const_spec_ptr inner) : inner_(std::move(inner)) {}

  auto is_satisfied_by(const Candidate& candidate) const
      -> std::expected<bool, core::error> override;
  auto kind() const noexcept -> spec_kind override { return spec_kind::not_node; }
  auto describe() const -> std::string override;

  auto inner() const noexcept -> const const_spec_ptr& { return inner_; }

private:
  const_spec_ptr inner_;
};

class TrueSpecification final : public Specification {
public:
  TrueSpecification() = default;
  auto is_satisfied_by(const Candidate&) const -> std::expected<bool, core::error> override {
    return true;
  }
  auto kind() const noexcept -> spec_kind override { return spec_kind::true_node; }
  auto describe() const -> std::string override { return "True"; }
};

class FalseSpecification final : public Specification {
public:
  FalseSpecification() = default;
  auto is_satisfied_by(const Candidate&) const -> std::expected<bool, core::error> override {
    return false;
  }
  auto kind() const noexcept -> spec_kind override { return spec_kind::false_node; }
  auto describe() const -> std::string override { return "False"; }
};

/** \brief a AND b. Extends a in place when a is an And; otherwise a new And(a, b). */
auto and_(spec_ptr a, const_spec_ptr b) -> spec_ptr;

/** \brief a OR b. Extends a in place when a is an Or; otherwise a new Or(a, b). */
auto or_(spec_ptr a, const_spec_ptr b) -> spec_ptr;

/** \brief a XOR b, always a new node. */
auto xor_(const_spec_ptr a, const_spec_ptr b) -> spec_ptr;

/** \brief NOT a, always a new node. */
auto not_(const_spec_ptr a) -> spec_ptr;

auto always_true() -> spec_ptr;
auto always_false() -> spec_ptr;

/** \brief Single-owner assembly of a specification tree.
 *
 * The builder holds the only handle to the root while combining, so in-place
 * flattening cannot reach a node that was already published.
 *
 * ```cpp
 * const_spec_ptr rule = SpecificationBuilder(rules::it_department())
 *                           .and_with(rules::salary_greater_than(4))
 *                           .and_with(rules::admission_years_at_least(3))
 *                           .build();
 * ```
 */
class SpecificationBuilder {
public:
  explicit SpecificationBuilder(spec_ptr root) : root_(std::move(root)) {}

  SpecificationBuilder(SpecificationBuilder&&) noexcept = default;
  SpecificationBuilder& operator=(SpecificationBuilder&&) noexcept = default;
  SpecificationBuilder(const SpecificationBuilder&) = delete;
  SpecificationBuilder& operator=(const SpecificationBuilder&) = delete;

  auto and_with(const_spec_ptr other) -> SpecificationBuilder&;
  auto or_with(const_spec_ptr other) -> SpecificationBuilder&;
  auto xor_with(const_spec_ptr other) -> SpecificationBuilder&;
  auto negate() -> SpecificationBuilder&;

  /** \brief Release the finished tree; the builder is left empty. */
  auto build() -> const_spec_ptr;

private:
  spec_ptr root_;
};

} // namespace eligo
