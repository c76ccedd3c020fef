#pragma once

/** \file shard.hpp
 *  \brief Shard descriptors as reported by a stream client.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tidemark::stream {

/**
 * \brief One shard of a stream.
 *
 * A split closes one parent and opens two children naming it as parent; a merge
 * closes two parents and opens one child naming both (parent and adjacent parent).
 * A closed shard carries its ending sequence number.
 */
struct Shard {
  std::string shard_id;
  std::optional<std::string> parent_shard_id;
  std::optional<std::string> adjacent_parent_shard_id;
  std::string starting_sequence_number;
  std::optional<std::string> ending_sequence_number;   /**< set once the shard is closed */

  bool is_open() const noexcept { return !ending_sequence_number.has_value(); }

  friend bool operator==(const Shard&, const Shard&) = default;
};

/** \brief Page request for list_shards. */
struct ListShardsRequest {
  std::string next_token;      /**< empty for the first page */
  std::size_t max_results{0};  /**< page size hint; 0 = client default */
};

/** \brief One page of list_shards. An empty next_token marks the last page. */
struct ShardPage {
  std::vector<Shard> shards;
  std::string next_token;
};

} // namespace tidemark::stream
