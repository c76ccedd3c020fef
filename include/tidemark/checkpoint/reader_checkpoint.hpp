#pragma once

/**
 * \file reader_checkpoint.hpp
 * \brief Immutable set of per-shard checkpoints for one stream.
 *
 * Keyed by shard id; at most one entry per shard. Equality is structural (set
 * equality of entries plus stream name). Iteration order is unspecified.
 * Values are never mutated: resumption and reconciliation build new ones.
 */

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "tidemark/checkpoint/shard_checkpoint.hpp"
#include "tidemark/error.hpp"

namespace tidemark::checkpoint {

class ReaderCheckpoint {
public:
  using const_iterator = std::vector<ShardCheckpoint>::const_iterator;

  /** Empty checkpoint for an unnamed stream. */
  ReaderCheckpoint() = default;

  /**
   * \brief Build from a list of shard checkpoints.
   * Errors:
   * - duplicate_shard_checkpoint: two entries share a shard id
   * - invalid_argument: empty stream name, or an entry of another stream
   */
  static auto create(std::string stream_name, std::vector<ShardCheckpoint> shards)
      -> std::expected<ReaderCheckpoint, core::error>;

  const std::string& stream_name() const noexcept { return stream_name_; }
  std::size_t size() const noexcept { return shards_.size(); }
  bool empty() const noexcept { return shards_.empty(); }

  /** Value containment: same shard id and same position. */
  [[nodiscard]] bool contains(const ShardCheckpoint& c) const;
  [[nodiscard]] bool contains_shard(std::string_view shard_id) const;
  /** Entry for shard_id or nullptr; valid while this object lives. */
  [[nodiscard]] const ShardCheckpoint* find(std::string_view shard_id) const;
  [[nodiscard]] std::vector<std::string> shard_ids() const;

  /** Entries whose shard id does not appear in `other`. */
  [[nodiscard]] ReaderCheckpoint difference(const ReaderCheckpoint& other) const;

  const_iterator begin() const noexcept { return shards_.begin(); }
  const_iterator end() const noexcept { return shards_.end(); }

  std::string to_string() const;

  friend bool operator==(const ReaderCheckpoint&, const ReaderCheckpoint&) = default;

private:
  ReaderCheckpoint(std::string stream_name, std::vector<ShardCheckpoint> shards)
      : stream_name_(std::move(stream_name)), shards_(std::move(shards)) {}

  std::string stream_name_;
  std::vector<ShardCheckpoint> shards_;   // sorted by shard id; makes == a set comparison
};

} // namespace tidemark::checkpoint
