#pragma once

/** \file candidate.hpp
 *  \brief Read-only employee record evaluated by specifications.
 *
 * A Candidate maps case-sensitive field names to values. Values are held as
 * supplied (text, exact decimal or timestamp) and converted on typed lookup;
 * a text value is parsed when a decimal or timestamp is requested.
 *
 * Thread-safety: const member functions may be called concurrently.
 */

#include <cstddef>
#include <expected>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "eligo/decimal.hpp"
#include "eligo/error.hpp"
#include "eligo/timestamp.hpp"

namespace eligo {

/** \brief Field names recognized by the built-in rules. */
namespace fields {
inline constexpr std::string_view area = "area";                        /**< department, text */
inline constexpr std::string_view role = "cargo";                       /**< role/title, text */
inline constexpr std::string_view gross_salary = "salario_bruto";       /**< exact decimal */
inline constexpr std::string_view admission_date = "data_de_admissao";  /**< date */
} // namespace fields

/** \brief Stored field value. */
using field_value = std::variant<std::string, decimal, timestamp>;

class Candidate {
public:
  Candidate() = default;

  /** \brief Build from textual fields, the shape most data sources deliver.
   *
   * Example:
   * ```cpp
   * Candidate c{{"area", "Tecnologia"}, {"salario_bruto", "5225.00"}};
   * ```
   */
  Candidate(std::initializer_list<std::pair<std::string, std::string>> text_fields);

  auto set_text(std::string key, std::string value) -> Candidate&;
  auto set_decimal(std::string key, decimal value) -> Candidate&;
  auto set_timestamp(std::string key, timestamp value) -> Candidate&;
  auto erase(std::string_view key) -> bool;

  auto contains(std::string_view key) const -> bool;
  auto size() const noexcept -> std::size_t { return fields_.size(); }

  /** \brief Stored value, or error_code::missing_field. */
  auto get(std::string_view key) const -> std::expected<std::reference_wrapper<const field_value>, core::error>;

  /** \brief Text field; decimals and timestamps are not converted to text. */
  auto get_text(std::string_view key) const -> std::expected<std::string, core::error>;

  /** \brief Decimal field, parsing text values. */
  auto get_decimal(std::string_view key) const -> std::expected<decimal, core::error>;

  /** \brief Timestamp field, parsing ISO-8601 text values. */
  auto get_timestamp(std::string_view key) const -> std::expected<timestamp, core::error>;

private:
  std::map<std::string, field_value, std::less<>> fields_;
};

/** \brief Check once, at the boundary, that the four recognized fields are
 * present and readable with their documented types.
 *
 * \return first missing_field or malformed_value error in field order
 *         area, cargo, salario_bruto, data_de_admissao
 */
auto validate_employee(const Candidate& candidate) -> std::expected<void, core::error>;

} // namespace eligo
