#pragma once

/** \file config.hpp
 *  \brief Process-wide defaults read from the environment.
 *
 * Recognized variables:
 * - ELIGO_BASE_SALARY     decimal, default base salary for salary rules (1045.00)
 * - ELIGO_REFERENCE_TIME  ISO-8601, frozen "now" for tenure rules built without one
 * - ELIGO_TRACE           "1" enables diagnostic lines on stderr
 *
 * Settings only supply defaults at rule construction; evaluation never reads them.
 */

#include <expected>
#include <optional>
#include <string>

#include "eligo/decimal.hpp"
#include "eligo/error.hpp"
#include "eligo/timestamp.hpp"

namespace eligo::core {

inline constexpr const char* kEnvBaseSalary = "ELIGO_BASE_SALARY";
inline constexpr const char* kEnvReferenceTime = "ELIGO_REFERENCE_TIME";
inline constexpr const char* kEnvTrace = "ELIGO_TRACE";

/** \brief Built-in base salary (1045.00) used when nothing overrides it. */
auto standard_base_salary() -> decimal;

struct settings {
  decimal base_salary{standard_base_salary()}; /**< salary ratio denominator */
  std::optional<timestamp> reference_time;      /**< unset: wall clock at construction */
  bool trace{false};                            /**< stderr diagnostics */
};

// Returns std::nullopt if the variable is not set; an empty string if set but empty.
auto safe_getenv(const char* name) -> std::optional<std::string>;

/** \brief Read all settings from the environment.
 *
 * \return settings, or error_code::config_invalid naming the offending variable
 */
auto load_settings() -> std::expected<settings, error>;

/** \brief Base salary for rules constructed without one.
 *
 * Falls back to standard_base_salary() when ELIGO_BASE_SALARY is malformed.
 */
auto configured_base_salary() -> decimal;

/** \brief Frozen reference time for tenure rules constructed without one. */
auto configured_reference_time() -> timestamp;

} // namespace eligo::core
