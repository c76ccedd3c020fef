#include "tidemark/checkpoint_generator.hpp"

#include <iostream>

#include "tidemark/checkpoint/checkpoint_store.hpp"
#include "tidemark/checkpoint/reconcile.hpp"
#include "tidemark/core/platform_utils.hpp"

namespace tidemark {

using checkpoint::ReaderCheckpoint;
using core::error;
using core::error_code;

DynamicCheckpointGenerator::DynamicCheckpointGenerator(std::string stream_name, stream::StartingPoint starting_point,
                                                       std::shared_ptr<const topology::ShardTopologyFinder> finder)
    : stream_name_(std::move(stream_name)), starting_point_(std::move(starting_point)), finder_(std::move(finder)) {}

DynamicCheckpointGenerator::DynamicCheckpointGenerator(std::string stream_name, stream::StartingPoint starting_point)
    : DynamicCheckpointGenerator(std::move(stream_name), std::move(starting_point),
                                 std::make_shared<topology::StartingPointShardsFinder>()) {}

auto DynamicCheckpointGenerator::generate(stream::StreamClient& client) const
    -> std::expected<ReaderCheckpoint, error> {
  if (!finder_) return std::unexpected(error{error_code::internal, "no topology finder", "checkpoint.generator"});
  auto shards = finder_->resolve(client, stream_name_, starting_point_);
  if (!shards) return std::unexpected(shards.error());
  return ReaderCheckpoint::create(stream_name_, std::move(*shards));
}

std::string DynamicCheckpointGenerator::describe() const {
  return "dynamic(" + stream_name_ + " at " + stream::to_string(starting_point_) + ")";
}

auto StaticCheckpointGenerator::generate(stream::StreamClient& /*client*/) const
    -> std::expected<ReaderCheckpoint, error> {
  return checkpoint_;
}

std::string StaticCheckpointGenerator::describe() const {
  return "static(" + checkpoint_.stream_name() + ", " + std::to_string(checkpoint_.size()) + " shards)";
}

ResumingCheckpointGenerator::ResumingCheckpointGenerator(ReaderCheckpoint persisted,
                                                         std::shared_ptr<const topology::ShardTopologyFinder> finder)
    : persisted_(std::move(persisted)), finder_(std::move(finder)) {}

auto ResumingCheckpointGenerator::generate(stream::StreamClient& client) const
    -> std::expected<ReaderCheckpoint, error> {
  // Positions of surviving shards come from persisted_; new shards get trim_horizon
  // in reconcile, so the policy used to list current shards is irrelevant.
  DynamicCheckpointGenerator current_gen{persisted_.stream_name(), stream::StartingPoint::trim_horizon(), finder_};
  auto current = current_gen.generate(client);
  if (!current) return std::unexpected(current.error());
  auto merged = checkpoint::reconcile(persisted_, *current);
  if (!merged) return std::unexpected(merged.error());
  return std::move(merged->checkpoint);
}

std::string ResumingCheckpointGenerator::describe() const {
  return "resuming(" + persisted_.stream_name() + ", " + std::to_string(persisted_.size()) + " persisted shards)";
}

auto make_checkpoint_generator(const CheckpointConfig& config)
    -> std::expected<std::unique_ptr<CheckpointGenerator>, error> {
  auto finder = std::make_shared<topology::StartingPointShardsFinder>(config.finder);
  std::unique_ptr<CheckpointGenerator> gen;

  if (!config.checkpoint_path.empty()) {
    auto persisted = checkpoint::load_reader_checkpoint(config.checkpoint_path);
    if (persisted) {
      if (persisted->stream_name() != config.stream_name) {
        return std::unexpected(error{error_code::config_invalid,
            "checkpoint at " + config.checkpoint_path.string() + " belongs to stream " + persisted->stream_name(),
            "checkpoint.generator"});
      }
      gen = std::make_unique<ResumingCheckpointGenerator>(std::move(*persisted), finder);
    } else if (persisted.error().code != error_code::not_found) {
      return std::unexpected(persisted.error());
    }
  }
  if (!gen) gen = std::make_unique<DynamicCheckpointGenerator>(config.stream_name, config.starting_point, finder);

  if (core::debug_enabled()) {
    std::cerr << "[TIDEMARK][checkpoint.generator] using " << gen->describe() << std::endl;
  }
  return gen;
}

} // namespace tidemark
