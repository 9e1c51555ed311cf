#pragma once

/** \file trace.hpp
 *  \brief Env-gated diagnostic lines on stderr: "[eligo][<topic>] <message>".
 */

#include <string>
#include <string_view>

namespace eligo::core {

/** \brief True when ELIGO_TRACE starts with '1'; sampled once per process. */
auto trace_enabled() noexcept -> bool;

/** \brief "[eligo][<topic>] <message>\n". */
auto format_trace_line(std::string_view topic, std::string_view message) -> std::string;

/** \brief Emit one line if tracing is enabled.
 *
 * The whole line goes to std::cerr in a single insertion, so lines from
 * concurrent evaluations do not interleave mid-line.
 */
auto trace(std::string_view topic, std::string_view message) -> void;

} // namespace eligo::core
