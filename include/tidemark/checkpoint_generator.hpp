#pragma once

/**
 * \file checkpoint_generator.hpp
 * \brief Produce the ReaderCheckpoint a consumer starts or resumes from.
 *
 * The pipeline runner calls generate() once at start-up (or after a detected
 * topology change) and persists the result. Generators issue read-only client
 * calls, add no retries of their own and never return a partial checkpoint:
 * the result is either a complete ReaderCheckpoint or exactly one error.
 *
 * Generators are immutable after construction and may be shared across threads.
 */

#include <expected>
#include <memory>
#include <string>

#include "tidemark/checkpoint/reader_checkpoint.hpp"
#include "tidemark/config.hpp"
#include "tidemark/error.hpp"
#include "tidemark/stream/starting_point.hpp"
#include "tidemark/stream/stream_client.hpp"
#include "tidemark/topology/shard_topology_finder.hpp"

namespace tidemark {

class CheckpointGenerator {
public:
  virtual ~CheckpointGenerator() = default;

  virtual auto generate(stream::StreamClient& client) const
      -> std::expected<checkpoint::ReaderCheckpoint, core::error> = 0;

  /** Short human-readable description for diagnostics. */
  virtual std::string describe() const = 0;
};

/** \brief Fresh checkpoint from the live topology at a starting point. */
class DynamicCheckpointGenerator final : public CheckpointGenerator {
public:
  DynamicCheckpointGenerator(std::string stream_name, stream::StartingPoint starting_point,
                             std::shared_ptr<const topology::ShardTopologyFinder> finder);
  /** Uses a StartingPointShardsFinder with default options. */
  DynamicCheckpointGenerator(std::string stream_name, stream::StartingPoint starting_point);

  auto generate(stream::StreamClient& client) const
      -> std::expected<checkpoint::ReaderCheckpoint, core::error> override;
  std::string describe() const override;

private:
  std::string stream_name_;
  stream::StartingPoint starting_point_;
  std::shared_ptr<const topology::ShardTopologyFinder> finder_;
};

/** \brief Returns a known checkpoint without touching the client. */
class StaticCheckpointGenerator final : public CheckpointGenerator {
public:
  explicit StaticCheckpointGenerator(checkpoint::ReaderCheckpoint checkpoint)
      : checkpoint_(std::move(checkpoint)) {}

  auto generate(stream::StreamClient& client) const
      -> std::expected<checkpoint::ReaderCheckpoint, core::error> override;
  std::string describe() const override;

private:
  checkpoint::ReaderCheckpoint checkpoint_;
};

/**
 * \brief Resume from a persisted checkpoint across topology changes.
 *
 * Resolves the current open shards and reconciles: surviving shards keep their
 * persisted positions, new shards start at trim_horizon, vanished shards drop.
 */
class ResumingCheckpointGenerator final : public CheckpointGenerator {
public:
  ResumingCheckpointGenerator(checkpoint::ReaderCheckpoint persisted,
                              std::shared_ptr<const topology::ShardTopologyFinder> finder);

  auto generate(stream::StreamClient& client) const
      -> std::expected<checkpoint::ReaderCheckpoint, core::error> override;
  std::string describe() const override;

private:
  checkpoint::ReaderCheckpoint persisted_;
  std::shared_ptr<const topology::ShardTopologyFinder> finder_;
};

/**
 * \brief Pick the generator for a configuration.
 *
 * If config.checkpoint_path names an existing checkpoint file, it is loaded and
 * a ResumingCheckpointGenerator is returned; otherwise a DynamicCheckpointGenerator
 * at config.starting_point. A stored checkpoint for another stream is rejected
 * with config_invalid; load errors other than not_found propagate.
 */
auto make_checkpoint_generator(const CheckpointConfig& config)
    -> std::expected<std::unique_ptr<CheckpointGenerator>, core::error>;

} // namespace tidemark
