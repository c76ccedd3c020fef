#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>

#include <tidemark/topology/shard_topology_finder.hpp>
#include <tests/support/fake_stream_client.hpp>

using namespace tidemark;
using checkpoint::ShardCheckpoint;
using stream::ShardIteratorType;
using stream::StartingPoint;
using topology::StartingPointShardsFinder;

namespace {

std::set<std::string> ids_of(const std::vector<ShardCheckpoint>& v) {
  std::set<std::string> out;
  for (const auto& c : v) out.insert(c.shard_id());
  return out;
}

} // namespace

TEST_CASE("latest and trim_horizon map every open shard", "[topology][finder]") {
  test_support::FakeStreamClient client;
  client.shards = test_support::open_shards(5);
  StartingPointShardsFinder finder;

  for (auto sp : {StartingPoint::latest(), StartingPoint::trim_horizon()}) {
    auto r = finder.resolve(client, "stream", sp);
    REQUIRE(r.has_value());
    REQUIRE(r->size() == 5);
    REQUIRE(ids_of(*r) == std::set<std::string>{"shard-01", "shard-02", "shard-03", "shard-04", "shard-05"});
    for (const auto& c : *r) {
      REQUIRE(c.stream_name() == "stream");
      REQUIRE(c == ShardCheckpoint{"stream", c.shard_id(), sp});
    }
  }
}

TEST_CASE("closed parents of a split or merge are not targeted", "[topology][finder]") {
  test_support::FakeStreamClient client;
  client.shards = {
      test_support::closed_shard("shard-00"),
      test_support::open_shard("shard-01", "shard-00"),
      test_support::open_shard("shard-02", "shard-00"),
      test_support::closed_shard("shard-03"),
      test_support::closed_shard("shard-04"),
      test_support::open_shard("shard-05", "shard-03", "shard-04"),
  };
  StartingPointShardsFinder finder;
  auto r = finder.resolve(client, "stream", StartingPoint::trim_horizon());
  REQUIRE(r.has_value());
  REQUIRE(ids_of(*r) == std::set<std::string>{"shard-01", "shard-02", "shard-05"});

  auto all = finder.list_all_shards(client, "stream");
  REQUIRE(all.has_value());
  REQUIRE(all->size() == 6);
}

TEST_CASE("at_timestamp carries the timestamp on every open shard", "[topology][finder]") {
  test_support::FakeStreamClient client;
  client.shards = test_support::open_shards(3);
  client.shards.push_back(test_support::closed_shard("shard-99"));
  auto sp = StartingPoint::at_timestamp(stream::Timestamp{std::chrono::milliseconds{123456}});
  REQUIRE(sp.has_value());

  auto r = StartingPointShardsFinder{}.resolve(client, "stream", *sp);
  REQUIRE(r.has_value());
  REQUIRE(r->size() == 3);
  for (const auto& c : *r) {
    REQUIRE(c.type() == ShardIteratorType::at_timestamp);
    REQUIRE(c.timestamp() == sp->timestamp());
  }
  REQUIRE(client.cursor_requests.empty());   // positions resolve lazily
}

TEST_CASE("at_sequence is a single-shard passthrough", "[topology][finder]") {
  test_support::FakeStreamClient client;
  client.shards = test_support::open_shards(3);
  auto sp = StartingPoint::at_sequence("shard-02", "4711");
  REQUIRE(sp.has_value());

  auto r = StartingPointShardsFinder{}.resolve(client, "stream", *sp);
  REQUIRE(r.has_value());
  REQUIRE(r->size() == 1);
  REQUIRE(r->front().shard_id() == "shard-02");
  REQUIRE(r->front().type() == ShardIteratorType::at_sequence_number);
  REQUIRE(r->front().sequence_number() == std::optional<std::string>("4711"));
  REQUIRE(client.list_calls == 0);
}

TEST_CASE("stream without open shards resolves to an empty set", "[topology][finder]") {
  test_support::FakeStreamClient client;
  auto r = StartingPointShardsFinder{}.resolve(client, "stream", StartingPoint::latest());
  REQUIRE(r.has_value());
  REQUIRE(r->empty());

  client.shards = {test_support::closed_shard("shard-01")};
  r = StartingPointShardsFinder{}.resolve(client, "stream", StartingPoint::latest());
  REQUIRE(r.has_value());
  REQUIRE(r->empty());
}

TEST_CASE("pages are merged into one snapshot and duplicates collapse", "[topology][finder][pagination]") {
  test_support::FakeStreamClient client;
  client.shards = test_support::open_shards(7);
  client.page_size = 2;
  client.duplicate_first_on_each_page = true;

  StartingPointShardsFinder finder{topology::FinderOptions{.max_pages = 16, .page_size = 2}};
  auto r = finder.resolve(client, "stream", StartingPoint::latest());
  REQUIRE(r.has_value());
  REQUIRE(r->size() == 7);
  REQUIRE(ids_of(*r).size() == 7);
  REQUIRE(client.list_calls == 4);
  REQUIRE(std::all_of(client.page_size_hints.begin(), client.page_size_hints.end(),
                      [](std::size_t h){ return h == 2; }));
}

TEST_CASE("enumeration failures surface as topology_unavailable", "[topology][finder][errors]") {
  test_support::FakeStreamClient client;
  client.shards = test_support::open_shards(4);
  client.page_size = 2;
  StartingPointShardsFinder finder;

  SECTION("first page fails") {
    client.list_failures.push_back(core::error{core::error_code::unavailable, "throttled", "fake.client"});
    auto r = finder.resolve(client, "stream", StartingPoint::latest());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::topology_unavailable);
    REQUIRE(r.error().component == "topology.finder");
    REQUIRE(r.error().message.find("throttled") != std::string::npos);
  }
  SECTION("unknown stream") {
    auto r = finder.resolve(client, "missing", StartingPoint::latest());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::topology_unavailable);
  }
  SECTION("cancellation passes through unchanged") {
    client.list_failures.push_back(core::error{core::error_code::cancelled, "deadline", "fake.client"});
    auto r = finder.resolve(client, "stream", StartingPoint::latest());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::cancelled);
    REQUIRE(r.error().component == "fake.client");
  }
}

TEST_CASE("runaway pagination is cut off", "[topology][finder][pagination]") {
  test_support::FakeStreamClient client;
  client.shards = test_support::open_shards(6);
  client.page_size = 1;

  SECTION("page limit") {
    StartingPointShardsFinder finder{topology::FinderOptions{.max_pages = 3, .page_size = 1}};
    auto r = finder.resolve(client, "stream", StartingPoint::latest());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::topology_unavailable);
    REQUIRE(client.list_calls == 3);
  }
  SECTION("repeated continuation token") {
    client.stuck_token = "page-1";
    auto r = StartingPointShardsFinder{}.resolve(client, "stream", StartingPoint::latest());
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::topology_unavailable);
    REQUIRE(client.list_calls == 2);
  }
}

TEST_CASE("resolution is idempotent against a stable topology", "[topology][finder]") {
  test_support::FakeStreamClient client;
  client.shards = test_support::open_shards(9);
  client.page_size = 4;
  StartingPointShardsFinder finder;
  auto a = finder.resolve(client, "stream", StartingPoint::trim_horizon());
  auto b = finder.resolve(client, "stream", StartingPoint::trim_horizon());
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  auto by_id = [](const ShardCheckpoint& x, const ShardCheckpoint& y){ return x.shard_id() < y.shard_id(); };
  std::sort(a->begin(), a->end(), by_id);
  std::sort(b->begin(), b->end(), by_id);
  REQUIRE(*a == *b);
  REQUIRE(ids_of(*a) == ids_of(*b));
}
