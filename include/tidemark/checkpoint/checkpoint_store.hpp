#pragma once

/** \file checkpoint_store.hpp
 *  \brief Text encoding and durable file persistence of ReaderCheckpoint.
 *
 * Format (v1):
 *   header: "tidemark-reader-checkpoint v1"\n
 *   stream=<stream-name>\n
 *   lines:  shard=<id> type=<iterator-type> [seq=<digits>] [subseq=<u64>] [ts=<epoch-ms>]\n
 *
 * Shard lines are written in shard-id order. Names use [A-Za-z0-9_.-] only.
 * Lines may end in \r\n.
 *
 * save_reader_checkpoint is atomic: write <file>.tmp, flush and fsync it,
 * rename over the destination, then best-effort fsync the parent directory.
 * On failure the temporary file is removed and io_failed is returned.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "tidemark/checkpoint/reader_checkpoint.hpp"
#include "tidemark/error.hpp"

namespace tidemark::checkpoint {

std::string encode(const ReaderCheckpoint& checkpoint);

/**
 * Errors: data_integrity (bad header, missing stream line, malformed or
 * inconsistent fields; message carries the line number),
 * duplicate_shard_checkpoint (same shard listed twice).
 */
auto decode(std::string_view text) -> std::expected<ReaderCheckpoint, core::error>;

/**
 * invalid_argument (nothing written) when the stream name or a shard id falls
 * outside [A-Za-z0-9_.-]{1,128}; io_failed on filesystem errors.
 */
auto save_reader_checkpoint(const std::filesystem::path& path, const ReaderCheckpoint& checkpoint)
    -> std::expected<void, core::error>;

/** not_found when the file does not exist; otherwise decode errors or io_failed. */
auto load_reader_checkpoint(const std::filesystem::path& path)
    -> std::expected<ReaderCheckpoint, core::error>;

} // namespace tidemark::checkpoint
