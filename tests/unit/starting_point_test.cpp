#include <catch2/catch_test_macros.hpp>

#include <tidemark/stream/starting_point.hpp>

using namespace tidemark;
using stream::StartingPoint;
using stream::StartingPointKind;
using stream::Timestamp;

TEST_CASE("symbolic starting points carry no payload", "[starting_point]") {
  auto latest = StartingPoint::latest();
  REQUIRE(latest.kind() == StartingPointKind::latest);
  REQUIRE_FALSE(latest.timestamp().has_value());
  REQUIRE(latest.shard_id().empty());
  REQUIRE(StartingPoint::trim_horizon().kind() == StartingPointKind::trim_horizon);
  REQUIRE(latest != StartingPoint::trim_horizon());
}

TEST_CASE("at_timestamp validates the timestamp", "[starting_point]") {
  auto ok = StartingPoint::at_timestamp(Timestamp{std::chrono::milliseconds{1'700'000'000'000}});
  REQUIRE(ok.has_value());
  REQUIRE(ok->kind() == StartingPointKind::at_timestamp);
  REQUIRE(ok->timestamp()->time_since_epoch().count() == 1'700'000'000'000);

  auto bad = StartingPoint::at_timestamp(Timestamp{std::chrono::milliseconds{-1}});
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::invalid_starting_point);
}

TEST_CASE("at_sequence validates shard id and sequence number", "[starting_point]") {
  auto ok = StartingPoint::at_sequence("shard-01", "49590338271490256608559692538361571095921575989136588898");
  REQUIRE(ok.has_value());
  REQUIRE(ok->shard_id() == "shard-01");

  REQUIRE(StartingPoint::at_sequence("", "1").error().code == core::error_code::invalid_starting_point);
  REQUIRE(StartingPoint::at_sequence("shard 01", "1").error().code == core::error_code::invalid_starting_point);
  REQUIRE(StartingPoint::at_sequence("shard-01", "").error().code == core::error_code::invalid_starting_point);
  REQUIRE(StartingPoint::at_sequence("shard-01", "12a").error().code == core::error_code::invalid_starting_point);
}

TEST_CASE("parse_starting_point accepts configuration spellings", "[starting_point][config]") {
  REQUIRE(stream::parse_starting_point("latest")->kind() == StartingPointKind::latest);
  REQUIRE(stream::parse_starting_point("TRIM_HORIZON")->kind() == StartingPointKind::trim_horizon);

  auto ts = stream::parse_starting_point("at_timestamp:1500");
  REQUIRE(ts.has_value());
  REQUIRE(ts->timestamp()->time_since_epoch().count() == 1500);

  auto seq = stream::parse_starting_point("at_sequence:shard-07:42");
  REQUIRE(seq.has_value());
  REQUIRE(seq->shard_id() == "shard-07");
  REQUIRE(seq->sequence_number() == "42");
}

TEST_CASE("parse_starting_point rejects malformed input", "[starting_point][config]") {
  for (const char* text : {"", "newest", "latest:1", "at_timestamp", "at_timestamp:", "at_timestamp:abc",
                           "at_timestamp:-5", "at_sequence:shard-01", "at_sequence::1", "at_sequence:shard-01:x"}) {
    INFO(text);
    auto r = stream::parse_starting_point(text);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::invalid_starting_point);
  }
}

TEST_CASE("to_string is the inverse of parse", "[starting_point][config]") {
  for (const char* text : {"latest", "trim_horizon", "at_timestamp:1500", "at_sequence:shard-07:42"}) {
    auto sp = stream::parse_starting_point(text);
    REQUIRE(sp.has_value());
    REQUIRE(stream::to_string(*sp) == text);
  }
}
