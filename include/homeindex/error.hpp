#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by the service layer.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <string>
#include <homeindex/expected_polyfill.hpp>

namespace homeindex::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  result_mismatch = 3002,
  precondition_failed = 4001,
  unknown_attribute = 4002,
  invalid_range = 4003,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "search.query_planner" */
};

/** \brief Short stable name for an error code, used in log lines. */
constexpr auto to_string(error_code ec) noexcept -> const char* {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::result_mismatch: return "result_mismatch";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::unknown_attribute: return "unknown_attribute";
    case error_code::invalid_range: return "invalid_range";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "internal";
}

} // namespace homeindex::core
