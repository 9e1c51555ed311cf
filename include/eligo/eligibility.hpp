#pragma once

/** \file eligibility.hpp
 *  \brief Evaluate one specification over a set of identified candidates.
 */

#include <cstdint>
#include <expected>
#include <vector>

#include "eligo/candidate.hpp"
#include "eligo/specification.hpp"

namespace eligo::eligibility {

struct candidate_view { std::uint64_t id; const Candidate* candidate; };

/** \brief Why one candidate was not selected. */
struct failure {
  std::uint64_t id;          /**< candidate id */
  const_spec_ptr remainder;  /**< clauses that failed */
};

// Ids of candidates satisfying spec, in store order; spec==nullptr selects all.
// The first evaluation error aborts the whole selection.
auto select(const Specification* spec, const std::vector<candidate_view>& store)
    -> std::expected<std::vector<std::uint64_t>, core::error>;

// Remainder for every candidate that does not satisfy spec, in store order.
auto explain(const Specification& spec, const std::vector<candidate_view>& store)
    -> std::expected<std::vector<failure>, core::error>;

} // namespace eligo::eligibility
