#pragma once

/** \file reconcile.hpp
 *  \brief Merge a persisted checkpoint with a freshly resolved topology.
 *
 * Policy, keyed by shard id:
 * - kept    = persisted ∩ current: persisted position is preserved exactly
 * - added   = current − persisted: trim_horizon, so data from a split is never skipped
 * - removed = persisted − current: dropped; descendants in `current` carry their data
 */

#include <expected>
#include <string>
#include <vector>

#include "tidemark/checkpoint/reader_checkpoint.hpp"
#include "tidemark/error.hpp"

namespace tidemark::checkpoint {

struct ReconcileResult {
  ReaderCheckpoint checkpoint;        /**< kept ∪ added */
  std::vector<std::string> kept;      /**< shard ids, sorted */
  std::vector<std::string> added;     /**< shard ids, sorted */
  std::vector<std::string> removed;   /**< shard ids, sorted */
};

/** Fails with invalid_argument when the two checkpoints name different streams. */
auto reconcile(const ReaderCheckpoint& persisted, const ReaderCheckpoint& current)
    -> std::expected<ReconcileResult, core::error>;

} // namespace tidemark::checkpoint
