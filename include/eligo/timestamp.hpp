#pragma once

/** \file timestamp.hpp
 *  \brief UTC timestamps and calendar differences for tenure rules.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "eligo/error.hpp"

namespace eligo {

/** \brief UTC instant with one-second resolution. */
using timestamp = std::chrono::sys_seconds;

/** \brief Parse an ISO-8601 date or date-time.
 *
 * Accepted forms:
 * - YYYY-MM-DD (midnight UTC)
 * - YYYY-MM-DDTHH:MM[:SS[.fraction]] with 'T' or a single space as separator
 * - an optional trailing 'Z', +HH:MM, +HHMM or +HH offset on the date-time form
 *
 * Fractions of a second are truncated. Invalid calendar dates (2023-02-29)
 * and anything else are rejected with error_code::malformed_value.
 */
auto parse_timestamp(std::string_view text) -> std::expected<timestamp, core::error>;

/** \brief Format as YYYY-MM-DDTHH:MM:SSZ. */
auto to_string(timestamp t) -> std::string;

/** \brief Number of complete calendar years between a and b, order-independent.
 *
 * A year is complete once month, day and time of day of the later instant
 * reach those of the earlier one; 2020-02-29 to 2021-02-28 is 0 years.
 */
auto whole_years_between(timestamp a, timestamp b) noexcept -> std::int64_t;

/** \brief Number of complete 24h days between a and b, order-independent. */
auto whole_days_between(timestamp a, timestamp b) noexcept -> std::int64_t;

/** \brief Current wall-clock time truncated to seconds. */
auto now_seconds() noexcept -> timestamp;

} // namespace eligo
