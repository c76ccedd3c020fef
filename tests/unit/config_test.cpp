#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include <tidemark/config.hpp>

using namespace tidemark;

namespace {

void set_env(const char* name, const char* value) {
#if defined(_WIN32)
  _putenv_s(name, value ? value : "");
#else
  if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

// Clears every TIDEMARK_* knob for the lifetime of a test.
struct EnvGuard {
  static constexpr const char* keys[] = {"TIDEMARK_STREAM", "TIDEMARK_STARTING_POINT", "TIDEMARK_MAX_LIST_PAGES",
                                         "TIDEMARK_LIST_PAGE_SIZE", "TIDEMARK_CHECKPOINT_PATH"};
  EnvGuard() { for (auto k : keys) set_env(k, nullptr); }
  ~EnvGuard() { for (auto k : keys) set_env(k, nullptr); }
};

} // namespace

TEST_CASE("config keeps base values without overrides", "[config]") {
  EnvGuard guard;
  CheckpointConfig base;
  base.stream_name = "orders";
  base.starting_point = stream::StartingPoint::trim_horizon();
  auto cfg = config_from_env(base);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->stream_name == "orders");
  REQUIRE(cfg->starting_point == stream::StartingPoint::trim_horizon());
  REQUIRE(cfg->finder.max_pages == 1024);
  REQUIRE(cfg->finder.page_size == 0);
  REQUIRE(cfg->checkpoint_path.empty());
}

TEST_CASE("config applies environment overrides", "[config]") {
  EnvGuard guard;
  set_env("TIDEMARK_STREAM", "clicks");
  set_env("TIDEMARK_STARTING_POINT", "at_timestamp:1500");
  set_env("TIDEMARK_MAX_LIST_PAGES", "8");
  set_env("TIDEMARK_LIST_PAGE_SIZE", "100");
  set_env("TIDEMARK_CHECKPOINT_PATH", "/var/lib/tidemark/clicks.ckpt");

  auto cfg = config_from_env();
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->stream_name == "clicks");
  REQUIRE(cfg->starting_point.kind() == stream::StartingPointKind::at_timestamp);
  REQUIRE(cfg->finder.max_pages == 8);
  REQUIRE(cfg->finder.page_size == 100);
  REQUIRE(cfg->checkpoint_path == std::filesystem::path("/var/lib/tidemark/clicks.ckpt"));
}

TEST_CASE("config rejects invalid values", "[config][errors]") {
  EnvGuard guard;
  CheckpointConfig base;
  base.stream_name = "orders";

  SECTION("missing stream name") {
    auto cfg = config_from_env();
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == core::error_code::config_invalid);
  }
  SECTION("malformed page limit") {
    set_env("TIDEMARK_MAX_LIST_PAGES", "many");
    REQUIRE(config_from_env(base).error().code == core::error_code::config_invalid);
  }
  SECTION("zero page limit") {
    set_env("TIDEMARK_MAX_LIST_PAGES", "0");
    REQUIRE(config_from_env(base).error().code == core::error_code::config_invalid);
  }
  SECTION("negative page size") {
    set_env("TIDEMARK_LIST_PAGE_SIZE", "-3");
    REQUIRE(config_from_env(base).error().code == core::error_code::config_invalid);
  }
  SECTION("bad starting point") {
    set_env("TIDEMARK_STARTING_POINT", "at_timestamp:soon");
    REQUIRE(config_from_env(base).error().code == core::error_code::invalid_starting_point);
  }
}
