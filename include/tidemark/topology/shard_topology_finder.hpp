#pragma once

/**
 * \file shard_topology_finder.hpp
 * \brief Resolve a starting point against a stream's shard topology.
 *
 * ShardTopologyFinder is the seam between checkpoint generation and the live
 * shard graph. StartingPointShardsFinder is the default implementation: it
 * collapses paginated list_shards calls into one snapshot and emits one
 * checkpoint per open shard.
 *
 * Thread-safety: finders hold no mutable state; resolve is reentrant as long
 * as the supplied client is.
 */

#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

#include "tidemark/checkpoint/shard_checkpoint.hpp"
#include "tidemark/error.hpp"
#include "tidemark/stream/shard.hpp"
#include "tidemark/stream/starting_point.hpp"
#include "tidemark/stream/stream_client.hpp"

namespace tidemark::topology {

/** \brief Pagination knobs for shard enumeration. */
struct FinderOptions {
  std::size_t max_pages{1024};  /**< give up with topology_unavailable after this many pages */
  std::size_t page_size{0};     /**< page size hint passed to the client; 0 = client default */
};

class ShardTopologyFinder {
public:
  virtual ~ShardTopologyFinder() = default;

  /**
   * \brief Checkpoints for every shard that must be read to honor starting_point.
   * The result has unique shard ids and may be empty.
   * Errors: topology_unavailable (enumeration failed, retryable); client
   * cancellation passes through unchanged.
   */
  virtual auto resolve(stream::StreamClient& client, std::string_view stream_name,
                       const stream::StartingPoint& starting_point) const
      -> std::expected<std::vector<checkpoint::ShardCheckpoint>, core::error> = 0;
};

class StartingPointShardsFinder final : public ShardTopologyFinder {
public:
  explicit StartingPointShardsFinder(FinderOptions options = {}) noexcept : options_(options) {}

  auto resolve(stream::StreamClient& client, std::string_view stream_name,
               const stream::StartingPoint& starting_point) const
      -> std::expected<std::vector<checkpoint::ShardCheckpoint>, core::error> override;

  /**
   * \brief All shards of the stream (open and closed) as one snapshot.
   * Pages are merged in order; a shard id seen twice keeps its first record.
   */
  auto list_all_shards(stream::StreamClient& client, std::string_view stream_name) const
      -> std::expected<std::vector<stream::Shard>, core::error>;

  const FinderOptions& options() const noexcept { return options_; }

private:
  FinderOptions options_;
};

} // namespace tidemark::topology
