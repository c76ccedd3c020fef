#include "tidemark/topology/shard_topology_finder.hpp"

#include <iostream>
#include <unordered_set>

#include "tidemark/core/platform_utils.hpp"

namespace tidemark::topology {

using checkpoint::ShardCheckpoint;
using core::error;
using core::error_code;
using stream::StartingPointKind;

namespace {

constexpr const char* kComponent = "topology.finder";

} // namespace

auto StartingPointShardsFinder::list_all_shards(stream::StreamClient& client, std::string_view stream_name) const
    -> std::expected<std::vector<stream::Shard>, error> {
  const bool dbg = core::debug_enabled();
  std::vector<stream::Shard> shards;
  std::unordered_set<std::string> seen_ids;
  std::unordered_set<std::string> seen_tokens;
  stream::ListShardsRequest req{{}, options_.page_size};
  std::size_t pages = 0;
  std::size_t duplicates = 0;

  for (;;) {
    if (pages == options_.max_pages) {
      return std::unexpected(error{error_code::topology_unavailable,
          "shard listing for " + std::string(stream_name) + " exceeded " + std::to_string(options_.max_pages) + " pages",
          kComponent});
    }
    auto page = client.list_shards(stream_name, req);
    ++pages;
    if (!page) {
      if (page.error().code == error_code::cancelled) return std::unexpected(page.error());
      return std::unexpected(error{error_code::topology_unavailable,
          "list_shards failed for " + std::string(stream_name) + ": " + page.error().message, kComponent});
    }
    for (auto& s : page->shards) {
      if (seen_ids.insert(s.shard_id).second) {
        shards.push_back(std::move(s));
      } else {
        ++duplicates;
      }
    }
    if (page->next_token.empty()) break;
    if (!seen_tokens.insert(page->next_token).second) {
      return std::unexpected(error{error_code::topology_unavailable,
          "list_shards for " + std::string(stream_name) + " repeated continuation token " + page->next_token, kComponent});
    }
    req.next_token = std::move(page->next_token);
  }

  if (dbg) {
    std::cerr << "[TIDEMARK][topology.finder] " << stream_name << ": " << shards.size() << " shards in "
              << pages << " page(s), " << duplicates << " duplicate(s) dropped" << std::endl;
  }
  return shards;
}

auto StartingPointShardsFinder::resolve(stream::StreamClient& client, std::string_view stream_name,
                                        const stream::StartingPoint& starting_point) const
    -> std::expected<std::vector<ShardCheckpoint>, error> {
  // Explicit single-shard resumption: no topology scan.
  if (starting_point.kind() == StartingPointKind::at_sequence) {
    return std::vector<ShardCheckpoint>{
        ShardCheckpoint{std::string(stream_name), starting_point.shard_id(), starting_point}};
  }

  auto all = list_all_shards(client, stream_name);
  if (!all) return std::unexpected(all.error());

  // Closed shards are never targeted: their retained data is reachable through
  // open descendants, and a timestamp is resolved per shard by the service.
  std::vector<ShardCheckpoint> out;
  out.reserve(all->size());
  std::size_t closed = 0;
  for (const auto& s : *all) {
    if (!s.is_open()) { ++closed; continue; }
    out.emplace_back(std::string(stream_name), s.shard_id, starting_point);
  }

  if (core::debug_enabled()) {
    std::cerr << "[TIDEMARK][topology.finder] " << stream_name << " at " << stream::to_string(starting_point)
              << ": " << out.size() << " open shard(s), " << closed << " closed skipped" << std::endl;
  }
  return out;
}

} // namespace tidemark::topology
