#include "tidemark/stream/stream_client.hpp"

namespace tidemark::stream {

std::string_view to_string(ShardIteratorType type) noexcept {
  switch (type) {
    case ShardIteratorType::latest: return "latest";
    case ShardIteratorType::trim_horizon: return "trim_horizon";
    case ShardIteratorType::at_timestamp: return "at_timestamp";
    case ShardIteratorType::at_sequence_number: return "at_sequence_number";
    case ShardIteratorType::after_sequence_number: return "after_sequence_number";
  }
  return "unknown";
}

std::optional<ShardIteratorType> parse_iterator_type(std::string_view name) noexcept {
  for (auto t : {ShardIteratorType::latest, ShardIteratorType::trim_horizon, ShardIteratorType::at_timestamp,
                 ShardIteratorType::at_sequence_number, ShardIteratorType::after_sequence_number}) {
    if (to_string(t) == name) return t;
  }
  return std::nullopt;
}

} // namespace tidemark::stream
