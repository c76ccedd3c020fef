#pragma once

/** \file sequence_number.hpp
 *  \brief Shard sequence numbers and record positions.
 *
 * Sequence numbers are opaque-looking decimal strings that can exceed 64 bits,
 * so they are compared as arbitrary-length unsigned integers:
 * leading zeros ignored, then longer is greater, then lexicographic.
 */

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace tidemark::stream {

/** Arrival time of a record, millisecond resolution since the Unix epoch. */
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/** True if s is a non-empty string of decimal digits. */
[[nodiscard]] bool is_valid_sequence_number(std::string_view s) noexcept;

/** Numeric comparison of two valid sequence numbers. */
[[nodiscard]] std::strong_ordering compare_sequence_numbers(std::string_view a, std::string_view b) noexcept;

/** Position of one user record within a shard. */
struct RecordPosition {
  std::string sequence_number;             /**< service sequence number of the (possibly aggregated) record */
  std::uint64_t sub_sequence_number{0};    /**< index of the user record inside an aggregated record */
  Timestamp arrival{};                     /**< approximate arrival time reported by the service */
};

/** Orders positions by (sequence_number, sub_sequence_number); arrival time is ignored. */
[[nodiscard]] std::strong_ordering compare_positions(std::string_view seq_a, std::uint64_t sub_a,
                                                     std::string_view seq_b, std::uint64_t sub_b) noexcept;

} // namespace tidemark::stream
