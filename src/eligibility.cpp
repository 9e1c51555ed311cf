#include "eligo/eligibility.hpp"

#include <string>

namespace eligo::eligibility {

namespace {

auto null_candidate(std::uint64_t id) -> std::unexpected<core::error> {
  return core::make_error(core::error_code::invalid_argument,
                          "candidate " + std::to_string(id) + " is null", "eligibility");
}

} // anonymous namespace

auto select(const Specification* spec, const std::vector<candidate_view>& store)
    -> std::expected<std::vector<std::uint64_t>, core::error> {
  std::vector<std::uint64_t> ids;
  ids.reserve(store.size());
  if (!spec) {
    for (const auto& v : store) ids.push_back(v.id);
    return ids;
  }
  for (const auto& v : store) {
    if (!v.candidate) return null_candidate(v.id);
    auto ok = spec->is_satisfied_by(*v.candidate);
    if (!ok) return std::unexpected(ok.error());
    if (*ok) ids.push_back(v.id);
  }
  return ids;
}

auto explain(const Specification& spec, const std::vector<candidate_view>& store)
    -> std::expected<std::vector<failure>, core::error> {
  std::vector<failure> out;
  for (const auto& v : store) {
    if (!v.candidate) return null_candidate(v.id);
    auto rest = spec.remainder_unsatisfied_by(*v.candidate);
    if (!rest) return std::unexpected(rest.error());
    if (*rest) out.push_back(failure{v.id, std::move(*rest)});
  }
  return out;
}

} // namespace eligo::eligibility
