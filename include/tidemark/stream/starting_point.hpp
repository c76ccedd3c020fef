#pragma once

/**
 * \file starting_point.hpp
 * \brief Consumer intent for where reading a stream begins.
 *
 * Exactly one variant is active. Validated factories reject inconsistent input
 * with error_code::invalid_starting_point; a constructed StartingPoint is
 * always well formed. Immutable and safe to share across threads.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "tidemark/error.hpp"
#include "tidemark/stream/sequence_number.hpp"

namespace tidemark::stream {

enum class StartingPointKind : std::uint8_t {
  latest,        /**< after the newest record currently in each shard */
  trim_horizon,  /**< at the oldest retained record */
  at_timestamp,  /**< at the first record with arrival time >= timestamp */
  at_sequence,   /**< one shard, at an explicit sequence number (resumption) */
};

class StartingPoint {
public:
  [[nodiscard]] static StartingPoint latest() noexcept { return StartingPoint{StartingPointKind::latest}; }
  [[nodiscard]] static StartingPoint trim_horizon() noexcept { return StartingPoint{StartingPointKind::trim_horizon}; }

  /** Fails if the timestamp lies before the Unix epoch. */
  static auto at_timestamp(Timestamp t) -> std::expected<StartingPoint, core::error>;

  /** Fails on an invalid shard id or a non-decimal sequence number. */
  static auto at_sequence(std::string shard_id, std::string sequence_number)
      -> std::expected<StartingPoint, core::error>;

  StartingPointKind kind() const noexcept { return kind_; }

  /** Engaged only for at_timestamp. */
  const std::optional<Timestamp>& timestamp() const noexcept { return timestamp_; }
  /** Non-empty only for at_sequence. */
  const std::string& shard_id() const noexcept { return shard_id_; }
  /** Non-empty only for at_sequence. */
  const std::string& sequence_number() const noexcept { return sequence_number_; }

  friend bool operator==(const StartingPoint&, const StartingPoint&) = default;

private:
  explicit StartingPoint(StartingPointKind kind) noexcept : kind_(kind) {}

  StartingPointKind kind_{StartingPointKind::latest};
  std::optional<Timestamp> timestamp_;
  std::string shard_id_;
  std::string sequence_number_;
};

/**
 * \brief Parse a configuration spelling.
 *
 * Accepted (keyword case-insensitive):
 *   latest
 *   trim_horizon
 *   at_timestamp:<epoch-millis>
 *   at_sequence:<shard-id>:<sequence-number>
 */
auto parse_starting_point(std::string_view text) -> std::expected<StartingPoint, core::error>;

/** Inverse of parse_starting_point. */
std::string to_string(const StartingPoint& sp);

std::string_view to_string(StartingPointKind kind) noexcept;

} // namespace tidemark::stream
