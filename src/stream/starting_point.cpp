#include "tidemark/stream/starting_point.hpp"

#include "tidemark/core/text.hpp"

namespace tidemark::stream {

namespace {

constexpr const char* kComponent = "stream.starting_point";

core::error invalid(std::string message) {
  return core::error{core::error_code::invalid_starting_point, std::move(message), kComponent};
}

} // namespace

auto StartingPoint::at_timestamp(Timestamp t) -> std::expected<StartingPoint, core::error> {
  if (t.time_since_epoch().count() < 0) {
    return std::unexpected(invalid("at_timestamp requires a timestamp at or after the Unix epoch"));
  }
  StartingPoint sp{StartingPointKind::at_timestamp};
  sp.timestamp_ = t;
  return sp;
}

auto StartingPoint::at_sequence(std::string shard_id, std::string sequence_number)
    -> std::expected<StartingPoint, core::error> {
  if (!core::is_valid_name(shard_id)) {
    return std::unexpected(invalid("at_sequence requires a valid shard id, got \"" + shard_id + "\""));
  }
  if (!is_valid_sequence_number(sequence_number)) {
    return std::unexpected(invalid("at_sequence requires a decimal sequence number, got \"" + sequence_number + "\""));
  }
  StartingPoint sp{StartingPointKind::at_sequence};
  sp.shard_id_ = std::move(shard_id);
  sp.sequence_number_ = std::move(sequence_number);
  return sp;
}

auto parse_starting_point(std::string_view text) -> std::expected<StartingPoint, core::error> {
  const auto colon = text.find(':');
  const auto keyword = text.substr(0, colon);
  const auto rest = colon == std::string_view::npos ? std::string_view{} : text.substr(colon + 1);

  if (core::iequals(keyword, "latest") || core::iequals(keyword, "trim_horizon")) {
    if (colon != std::string_view::npos) {
      return std::unexpected(invalid("\"" + std::string(keyword) + "\" takes no argument"));
    }
    return core::iequals(keyword, "latest") ? StartingPoint::latest() : StartingPoint::trim_horizon();
  }
  if (core::iequals(keyword, "at_timestamp")) {
    std::int64_t millis = 0;
    if (colon == std::string_view::npos || !core::parse_i64(rest, millis)) {
      return std::unexpected(invalid("at_timestamp expects at_timestamp:<epoch-millis>"));
    }
    return StartingPoint::at_timestamp(Timestamp{std::chrono::milliseconds{millis}});
  }
  if (core::iequals(keyword, "at_sequence")) {
    const auto sep = rest.find(':');
    if (colon == std::string_view::npos || sep == std::string_view::npos) {
      return std::unexpected(invalid("at_sequence expects at_sequence:<shard-id>:<sequence-number>"));
    }
    return StartingPoint::at_sequence(std::string(rest.substr(0, sep)), std::string(rest.substr(sep + 1)));
  }
  return std::unexpected(invalid("unknown starting point \"" + std::string(text) + "\""));
}

std::string_view to_string(StartingPointKind kind) noexcept {
  switch (kind) {
    case StartingPointKind::latest: return "latest";
    case StartingPointKind::trim_horizon: return "trim_horizon";
    case StartingPointKind::at_timestamp: return "at_timestamp";
    case StartingPointKind::at_sequence: return "at_sequence";
  }
  return "unknown";
}

std::string to_string(const StartingPoint& sp) {
  std::string out(to_string(sp.kind()));
  switch (sp.kind()) {
    case StartingPointKind::at_timestamp:
      out.append(":").append(std::to_string(sp.timestamp()->time_since_epoch().count()));
      break;
    case StartingPointKind::at_sequence:
      out.append(":").append(sp.shard_id()).append(":").append(sp.sequence_number());
      break;
    default:
      break;
  }
  return out;
}

} // namespace tidemark::stream
