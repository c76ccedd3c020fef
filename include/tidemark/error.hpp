#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes grouped in bands (1xxx io, 2xxx config, 3xxx integrity,
 *   7xxx availability, 9xxx programming errors) for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tidemark::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  invalid_starting_point = 2002,     /**< starting point policy cannot be satisfied as written */
  data_integrity = 3001,
  duplicate_shard_checkpoint = 3002, /**< two checkpoints for one shard in one aggregate */
  not_found = 6001,
  unavailable = 7001,
  topology_unavailable = 7002,       /**< shard enumeration failed; retry with backoff */
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "topology.finder" */
};

/** \brief True for failures a caller may retry (service or filesystem hiccups). */
constexpr bool is_transient(error_code ec) noexcept {
  switch (ec) {
    case error_code::topology_unavailable:
    case error_code::unavailable:
    case error_code::io_failed:
      return true;
    default:
      return false;
  }
}

/** \brief Stable lowercase name of an error code, e.g. "topology_unavailable". */
std::string_view to_string(error_code ec) noexcept;

} // namespace tidemark::core
