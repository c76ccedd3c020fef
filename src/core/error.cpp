#include "tidemark/error.hpp"

namespace tidemark::core {

std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::invalid_starting_point: return "invalid_starting_point";
    case error_code::data_integrity: return "data_integrity";
    case error_code::duplicate_shard_checkpoint: return "duplicate_shard_checkpoint";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::topology_unavailable: return "topology_unavailable";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
  }
  return "unknown";
}

} // namespace tidemark::core
