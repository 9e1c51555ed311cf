#pragma once

/** \file eligo.hpp
 *  \brief Umbrella header.
 */

#include "eligo/error.hpp"
#include "eligo/decimal.hpp"
#include "eligo/timestamp.hpp"
#include "eligo/config.hpp"
#include "eligo/candidate.hpp"
#include "eligo/specification.hpp"
#include "eligo/rules/role_rules.hpp"
#include "eligo/rules/salary_rules.hpp"
#include "eligo/rules/tenure_rules.hpp"
#include "eligo/eligibility.hpp"
