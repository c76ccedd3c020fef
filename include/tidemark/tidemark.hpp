#pragma once

/** \file tidemark.hpp
 *  \brief Umbrella header for checkpoint generation APIs.
 *
 *  - Starting points and the stream client capability (stream/)
 *  - Shard and reader checkpoints, reconciliation, persistence (checkpoint/)
 *  - Topology resolution (topology/)
 *  - Generators and configuration
 */

#include "tidemark/error.hpp"
#include "tidemark/stream/sequence_number.hpp"
#include "tidemark/stream/shard.hpp"
#include "tidemark/stream/starting_point.hpp"
#include "tidemark/stream/stream_client.hpp"
#include "tidemark/checkpoint/shard_checkpoint.hpp"
#include "tidemark/checkpoint/reader_checkpoint.hpp"
#include "tidemark/checkpoint/reconcile.hpp"
#include "tidemark/checkpoint/checkpoint_store.hpp"
#include "tidemark/topology/shard_topology_finder.hpp"
#include "tidemark/config.hpp"
#include "tidemark/checkpoint_generator.hpp"
