#pragma once

/**
 * \file stream_client.hpp
 * \brief Capability interface to the stream service.
 *
 * Implementations own transport, authentication, retries and cancellation.
 * The checkpoint layer only issues read-only calls through this interface and
 * never looks a client up through global state; callers pass it in.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "tidemark/error.hpp"
#include "tidemark/stream/sequence_number.hpp"
#include "tidemark/stream/shard.hpp"

namespace tidemark::stream {

/** Cursor flavour requested from the service for one shard. */
enum class ShardIteratorType : std::uint8_t {
  latest,
  trim_horizon,
  at_timestamp,
  at_sequence_number,
  after_sequence_number,
};

std::string_view to_string(ShardIteratorType type) noexcept;

/** Inverse of to_string(ShardIteratorType); nullopt for unknown names. */
std::optional<ShardIteratorType> parse_iterator_type(std::string_view name) noexcept;

/** \brief Request for a shard cursor. sequence_number / timestamp set per type. */
struct CursorRequest {
  std::string stream_name;
  std::string shard_id;
  ShardIteratorType type{ShardIteratorType::latest};
  std::optional<std::string> sequence_number;
  std::optional<Timestamp> timestamp;
};

class StreamClient {
public:
  virtual ~StreamClient() = default;

  /**
   * \brief Fetch one page of the stream's shards.
   *
   * Errors: any error_code; the topology finder reports them as
   * topology_unavailable except cancelled, which passes through unchanged.
   */
  virtual auto list_shards(std::string_view stream_name, const ListShardsRequest& request)
      -> std::expected<ShardPage, core::error> = 0;

  /**
   * \brief Resolve a position to an opaque service cursor.
   *
   * An at_timestamp request older than the stream's retention should fail with
   * error_code::out_of_range.
   */
  virtual auto get_shard_iterator(const CursorRequest& request)
      -> std::expected<std::string, core::error> = 0;
};

} // namespace tidemark::stream
