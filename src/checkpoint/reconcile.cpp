#include "tidemark/checkpoint/reconcile.hpp"

#include <iostream>

#include "tidemark/core/platform_utils.hpp"

namespace tidemark::checkpoint {

auto reconcile(const ReaderCheckpoint& persisted, const ReaderCheckpoint& current)
    -> std::expected<ReconcileResult, core::error> {
  using core::error; using core::error_code;
  if (persisted.stream_name() != current.stream_name()) {
    return std::unexpected(error{error_code::invalid_argument,
        "cannot reconcile stream " + persisted.stream_name() + " with " + current.stream_name(),
        "checkpoint.reconcile"});
  }

  ReconcileResult r;
  std::vector<ShardCheckpoint> merged;
  merged.reserve(current.size());
  for (const auto& c : current) {
    if (const auto* prev = persisted.find(c.shard_id())) {
      merged.push_back(*prev);
      r.kept.push_back(c.shard_id());
    } else {
      merged.emplace_back(c.stream_name(), c.shard_id(), stream::StartingPoint::trim_horizon());
      r.added.push_back(c.shard_id());
    }
  }
  for (const auto& c : persisted.difference(current)) r.removed.push_back(c.shard_id());

  // Unique by construction: every id comes from `current`.
  auto cp = ReaderCheckpoint::create(current.stream_name(), std::move(merged));
  if (!cp) return std::unexpected(cp.error());
  r.checkpoint = std::move(*cp);

  if (core::debug_enabled()) {
    std::cerr << "[TIDEMARK][checkpoint.reconcile] " << current.stream_name() << ": kept=" << r.kept.size()
              << " added=" << r.added.size() << " removed=" << r.removed.size() << std::endl;
  }
  return r;
}

} // namespace tidemark::checkpoint
