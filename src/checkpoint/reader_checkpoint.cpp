#include "tidemark/checkpoint/reader_checkpoint.hpp"

#include <algorithm>

namespace tidemark::checkpoint {

namespace {

constexpr const char* kComponent = "checkpoint.reader";

bool by_shard_id(const ShardCheckpoint& a, const ShardCheckpoint& b) {
  return a.shard_id() < b.shard_id();
}

} // namespace

auto ReaderCheckpoint::create(std::string stream_name, std::vector<ShardCheckpoint> shards)
    -> std::expected<ReaderCheckpoint, core::error> {
  using core::error; using core::error_code;
  if (stream_name.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "reader checkpoint requires a stream name", kComponent});
  }
  for (const auto& c : shards) {
    if (c.stream_name() != stream_name) {
      return std::unexpected(error{error_code::invalid_argument,
          "shard " + c.shard_id() + " belongs to stream " + c.stream_name() + ", expected " + stream_name, kComponent});
    }
  }
  std::sort(shards.begin(), shards.end(), by_shard_id);
  auto dup = std::adjacent_find(shards.begin(), shards.end(),
                                [](const ShardCheckpoint& a, const ShardCheckpoint& b){ return a.shard_id() == b.shard_id(); });
  if (dup != shards.end()) {
    return std::unexpected(error{error_code::duplicate_shard_checkpoint,
        "duplicate checkpoint for shard " + dup->shard_id(), kComponent});
  }
  return ReaderCheckpoint{std::move(stream_name), std::move(shards)};
}

const ShardCheckpoint* ReaderCheckpoint::find(std::string_view shard_id) const {
  auto it = std::lower_bound(shards_.begin(), shards_.end(), shard_id,
                             [](const ShardCheckpoint& c, std::string_view id){ return c.shard_id() < id; });
  if (it == shards_.end() || it->shard_id() != shard_id) return nullptr;
  return &*it;
}

bool ReaderCheckpoint::contains(const ShardCheckpoint& c) const {
  const auto* found = find(c.shard_id());
  return found != nullptr && *found == c;
}

bool ReaderCheckpoint::contains_shard(std::string_view shard_id) const {
  return find(shard_id) != nullptr;
}

std::vector<std::string> ReaderCheckpoint::shard_ids() const {
  std::vector<std::string> ids;
  ids.reserve(shards_.size());
  for (const auto& c : shards_) ids.push_back(c.shard_id());
  return ids;
}

ReaderCheckpoint ReaderCheckpoint::difference(const ReaderCheckpoint& other) const {
  std::vector<ShardCheckpoint> out;
  for (const auto& c : shards_) {
    if (!other.contains_shard(c.shard_id())) out.push_back(c);
  }
  return ReaderCheckpoint{stream_name_, std::move(out)};   // subset of a sorted, unique list
}

std::string ReaderCheckpoint::to_string() const {
  std::string out = "ReaderCheckpoint{" + stream_name_ + ": [";
  bool first = true;
  for (const auto& c : shards_) {
    if (!first) out.append(", ");
    out.append(c.to_string());
    first = false;
  }
  out.append("]}");
  return out;
}

} // namespace tidemark::checkpoint
