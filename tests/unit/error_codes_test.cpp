#include <tidemark/error.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using tidemark::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_starting_point) == 2002u);
  REQUIRE(static_cast<unsigned>(error_code::duplicate_shard_checkpoint) == 3002u);
  REQUIRE(static_cast<unsigned>(error_code::topology_unavailable) == 7002u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("only availability and io failures are transient", "[errors]") {
  using tidemark::core::error_code;
  using tidemark::core::is_transient;
  REQUIRE(is_transient(error_code::topology_unavailable));
  REQUIRE(is_transient(error_code::unavailable));
  REQUIRE(is_transient(error_code::io_failed));
  REQUIRE_FALSE(is_transient(error_code::invalid_starting_point));
  REQUIRE_FALSE(is_transient(error_code::duplicate_shard_checkpoint));
  REQUIRE_FALSE(is_transient(error_code::cancelled));
}

TEST_CASE("error code names", "[errors]") {
  using tidemark::core::error_code;
  REQUIRE(tidemark::core::to_string(error_code::topology_unavailable) == "topology_unavailable");
  REQUIRE(tidemark::core::to_string(error_code::duplicate_shard_checkpoint) == "duplicate_shard_checkpoint");
}
