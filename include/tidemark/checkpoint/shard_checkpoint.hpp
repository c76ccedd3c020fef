#pragma once

/**
 * \file shard_checkpoint.hpp
 * \brief Resumable read position for one shard.
 *
 * A ShardCheckpoint is an immutable value (stream_name, shard_id, position).
 * Position is symbolic (latest, trim_horizon), a timestamp, or a sequence
 * number read either "at" (boundary record re-delivered) or "after" it.
 * Equality and hashing cover every field, so two checkpoints for one shard at
 * different positions are different values.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

#include "tidemark/error.hpp"
#include "tidemark/stream/sequence_number.hpp"
#include "tidemark/stream/starting_point.hpp"
#include "tidemark/stream/stream_client.hpp"

namespace tidemark::checkpoint {

class ShardCheckpoint {
public:
  /**
   * \brief Checkpoint at a starting point.
   * latest / trim_horizon / at_timestamp carry over as is; an at_sequence
   * starting point yields at_sequence_number for its own shard and sequence
   * number; `shard_id` is ignored in that case.
   */
  ShardCheckpoint(std::string stream_name, std::string shard_id, const stream::StartingPoint& starting_point);

  /**
   * \brief Validated factory for arbitrary positions.
   * Sequence types require a decimal sequence_number; at_timestamp requires a
   * timestamp; no type may carry fields it does not use. Sub sequence numbers
   * are only meaningful for sequence types. Fails with invalid_argument.
   */
  static auto create(std::string stream_name, std::string shard_id, stream::ShardIteratorType type,
                     std::optional<std::string> sequence_number = std::nullopt,
                     std::optional<std::uint64_t> sub_sequence_number = std::nullopt,
                     std::optional<stream::Timestamp> timestamp = std::nullopt)
      -> std::expected<ShardCheckpoint, core::error>;

  const std::string& stream_name() const noexcept { return stream_name_; }
  const std::string& shard_id() const noexcept { return shard_id_; }
  stream::ShardIteratorType type() const noexcept { return type_; }
  const std::optional<std::string>& sequence_number() const noexcept { return sequence_number_; }
  const std::optional<std::uint64_t>& sub_sequence_number() const noexcept { return sub_sequence_number_; }
  const std::optional<stream::Timestamp>& timestamp() const noexcept { return timestamp_; }

  /** True for latest and trim_horizon. */
  bool is_symbolic() const noexcept;

  /** Checkpoint reached once `record` has been delivered. */
  [[nodiscard]] ShardCheckpoint move_after(const stream::RecordPosition& record) const;

  /** True if `record` is at or past this checkpoint, i.e. still has to be delivered. */
  [[nodiscard]] bool is_before_or_at(const stream::RecordPosition& record) const;

  /**
   * \brief Ask the client for a cursor at this position.
   *
   * after_sequence_number with a sub sequence number resumes in the middle of
   * an aggregated record: the cursor is taken at_sequence_number and the caller
   * drops already-delivered user records via is_before_or_at.
   * at_timestamp rejected with out_of_range (older than retention) falls back to
   * a trim_horizon cursor.
   */
  auto resolve_cursor(stream::StreamClient& client) const -> std::expected<std::string, core::error>;

  std::string to_string() const;

  friend bool operator==(const ShardCheckpoint&, const ShardCheckpoint&) = default;

private:
  ShardCheckpoint() = default;

  std::string stream_name_;
  std::string shard_id_;
  stream::ShardIteratorType type_{stream::ShardIteratorType::latest};
  std::optional<std::string> sequence_number_;
  std::optional<std::uint64_t> sub_sequence_number_;
  std::optional<stream::Timestamp> timestamp_;
};

} // namespace tidemark::checkpoint

template <>
struct std::hash<tidemark::checkpoint::ShardCheckpoint> {
  std::size_t operator()(const tidemark::checkpoint::ShardCheckpoint& c) const noexcept;
};
