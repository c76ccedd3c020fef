#include "tidemark/checkpoint/shard_checkpoint.hpp"

#include <iostream>

#include "tidemark/core/platform_utils.hpp"

namespace tidemark::checkpoint {

using stream::ShardIteratorType;
using stream::StartingPointKind;

namespace {

constexpr const char* kComponent = "checkpoint.shard";

bool is_sequence_type(ShardIteratorType t) noexcept {
  return t == ShardIteratorType::at_sequence_number || t == ShardIteratorType::after_sequence_number;
}

} // namespace

ShardCheckpoint::ShardCheckpoint(std::string stream_name, std::string shard_id,
                                 const stream::StartingPoint& starting_point)
    : stream_name_(std::move(stream_name)), shard_id_(std::move(shard_id)) {
  switch (starting_point.kind()) {
    case StartingPointKind::latest:
      type_ = ShardIteratorType::latest;
      break;
    case StartingPointKind::trim_horizon:
      type_ = ShardIteratorType::trim_horizon;
      break;
    case StartingPointKind::at_timestamp:
      type_ = ShardIteratorType::at_timestamp;
      timestamp_ = starting_point.timestamp();
      break;
    case StartingPointKind::at_sequence:
      type_ = ShardIteratorType::at_sequence_number;
      shard_id_ = starting_point.shard_id();
      sequence_number_ = starting_point.sequence_number();
      break;
  }
}

auto ShardCheckpoint::create(std::string stream_name, std::string shard_id, ShardIteratorType type,
                             std::optional<std::string> sequence_number,
                             std::optional<std::uint64_t> sub_sequence_number,
                             std::optional<stream::Timestamp> timestamp)
    -> std::expected<ShardCheckpoint, core::error> {
  using core::error; using core::error_code;
  if (stream_name.empty() || shard_id.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "stream name and shard id must be non-empty", kComponent});
  }
  if (is_sequence_type(type)) {
    if (!sequence_number || !stream::is_valid_sequence_number(*sequence_number)) {
      return std::unexpected(error{error_code::invalid_argument,
          std::string(stream::to_string(type)) + " requires a decimal sequence number", kComponent});
    }
    if (timestamp) {
      return std::unexpected(error{error_code::invalid_argument, "sequence position cannot carry a timestamp", kComponent});
    }
  } else {
    if (sequence_number || sub_sequence_number) {
      return std::unexpected(error{error_code::invalid_argument,
          std::string(stream::to_string(type)) + " cannot carry a sequence number", kComponent});
    }
    if (type == ShardIteratorType::at_timestamp && !timestamp) {
      return std::unexpected(error{error_code::invalid_argument, "at_timestamp requires a timestamp", kComponent});
    }
    if (timestamp && timestamp->time_since_epoch().count() < 0) {
      return std::unexpected(error{error_code::invalid_argument, "timestamp precedes the Unix epoch", kComponent});
    }
    if (type != ShardIteratorType::at_timestamp && timestamp) {
      return std::unexpected(error{error_code::invalid_argument,
          std::string(stream::to_string(type)) + " cannot carry a timestamp", kComponent});
    }
  }
  ShardCheckpoint c;
  c.stream_name_ = std::move(stream_name);
  c.shard_id_ = std::move(shard_id);
  c.type_ = type;
  c.sequence_number_ = std::move(sequence_number);
  c.sub_sequence_number_ = sub_sequence_number;
  c.timestamp_ = timestamp;
  return c;
}

bool ShardCheckpoint::is_symbolic() const noexcept {
  return type_ == ShardIteratorType::latest || type_ == ShardIteratorType::trim_horizon;
}

ShardCheckpoint ShardCheckpoint::move_after(const stream::RecordPosition& record) const {
  ShardCheckpoint c;
  c.stream_name_ = stream_name_;
  c.shard_id_ = shard_id_;
  c.type_ = ShardIteratorType::after_sequence_number;
  c.sequence_number_ = record.sequence_number;
  c.sub_sequence_number_ = record.sub_sequence_number;
  return c;
}

bool ShardCheckpoint::is_before_or_at(const stream::RecordPosition& record) const {
  if (is_symbolic()) return true; // every record served from a symbolic cursor is new
  if (type_ == ShardIteratorType::at_timestamp) return *timestamp_ <= record.arrival;
  const auto c = stream::compare_positions(*sequence_number_, sub_sequence_number_.value_or(0),
                                           record.sequence_number, record.sub_sequence_number);
  if (c == 0) return type_ == ShardIteratorType::at_sequence_number;
  return c < 0;
}

auto ShardCheckpoint::resolve_cursor(stream::StreamClient& client) const
    -> std::expected<std::string, core::error> {
  stream::CursorRequest req{stream_name_, shard_id_, type_, sequence_number_, timestamp_};
  // Mid-aggregate: re-read the aggregated record, caller filters delivered user records.
  if (type_ == ShardIteratorType::after_sequence_number && sub_sequence_number_.has_value()) {
    req.type = ShardIteratorType::at_sequence_number;
  }
  auto cursor = client.get_shard_iterator(req);
  if (cursor || type_ != ShardIteratorType::at_timestamp
      || cursor.error().code != core::error_code::out_of_range) {
    return cursor;
  }
  if (core::debug_enabled()) {
    std::cerr << "[TIDEMARK][checkpoint.shard] " << stream_name_ << "/" << shard_id_
              << ": timestamp precedes retention, falling back to trim_horizon" << std::endl;
  }
  req.type = ShardIteratorType::trim_horizon;
  req.timestamp.reset();
  return client.get_shard_iterator(req);
}

std::string ShardCheckpoint::to_string() const {
  std::string out = stream_name_ + "/" + shard_id_ + "@" + std::string(stream::to_string(type_));
  if (sequence_number_) out.append(":").append(*sequence_number_);
  if (sub_sequence_number_) out.append(".").append(std::to_string(*sub_sequence_number_));
  if (timestamp_) out.append(":").append(std::to_string(timestamp_->time_since_epoch().count()));
  return out;
}

} // namespace tidemark::checkpoint

std::size_t std::hash<tidemark::checkpoint::ShardCheckpoint>::operator()(
    const tidemark::checkpoint::ShardCheckpoint& c) const noexcept {
  auto mix = [](std::size_t seed, std::size_t v) {
    return seed ^ (v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
  };
  std::size_t h = std::hash<std::string>{}(c.stream_name());
  h = mix(h, std::hash<std::string>{}(c.shard_id()));
  h = mix(h, static_cast<std::size_t>(c.type()));
  if (c.sequence_number()) h = mix(h, std::hash<std::string>{}(*c.sequence_number()));
  if (c.sub_sequence_number()) h = mix(h, std::hash<std::uint64_t>{}(*c.sub_sequence_number()));
  if (c.timestamp()) h = mix(h, std::hash<std::int64_t>{}(c.timestamp()->time_since_epoch().count()));
  return h;
}
