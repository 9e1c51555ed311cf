#pragma once

/** \file decimal.hpp
 *  \brief Exact decimal arithmetic for salary amounts and ratio thresholds.
 *
 * Amounts are held as exact rationals so that ratios such as 5225.00 / 1045.00
 * compare exactly against integer or decimal thresholds (no binary rounding).
 */

#include <expected>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "eligo/error.hpp"

namespace eligo {

/** \brief Exact rational number; every finite decimal literal is representable. */
using decimal = boost::multiprecision::cpp_rational;

/** \brief Parse a plain decimal literal: [+-]digits[.digits] or [+-].digits.
 *
 * Surrounding ASCII whitespace is ignored. Exponents, digit separators and
 * locale-specific commas are rejected with error_code::malformed_value.
 */
auto parse_decimal(std::string_view text) -> std::expected<decimal, core::error>;

/** \brief Render a decimal without loss.
 *
 * Values with a terminating decimal expansion print as "5", "-0.25", "4.5";
 * anything else falls back to "num/den".
 */
auto to_string(const decimal& value) -> std::string;

} // namespace eligo
