#pragma once

/** \file config.hpp
 *  \brief Checkpoint generation settings with environment overrides.
 *
 * Environment (all optional, applied over the supplied base):
 *   TIDEMARK_STREAM            stream name
 *   TIDEMARK_STARTING_POINT    latest | trim_horizon | at_timestamp:<ms> | at_sequence:<shard>:<seq>
 *   TIDEMARK_MAX_LIST_PAGES    page limit for shard enumeration
 *   TIDEMARK_LIST_PAGE_SIZE    page size hint for shard enumeration
 *   TIDEMARK_CHECKPOINT_PATH   persisted checkpoint file to resume from
 *   TIDEMARK_DEBUG             enable stderr diagnostics (not stored here)
 */

#include <expected>
#include <filesystem>
#include <string>

#include "tidemark/error.hpp"
#include "tidemark/stream/starting_point.hpp"
#include "tidemark/topology/shard_topology_finder.hpp"

namespace tidemark {

struct CheckpointConfig {
  std::string stream_name;
  stream::StartingPoint starting_point{stream::StartingPoint::latest()};
  topology::FinderOptions finder{};
  std::filesystem::path checkpoint_path;   /**< empty = never resume from disk */
};

/**
 * \brief Apply environment overrides to `base` and validate the result.
 * Errors: config_invalid (bad number, empty stream name),
 *         invalid_starting_point (bad TIDEMARK_STARTING_POINT).
 */
auto config_from_env(CheckpointConfig base = {}) -> std::expected<CheckpointConfig, core::error>;

} // namespace tidemark
