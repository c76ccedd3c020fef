#include "tidemark/config.hpp"

#include "tidemark/core/platform_utils.hpp"
#include "tidemark/core/text.hpp"

namespace tidemark {

namespace {

constexpr const char* kComponent = "config";

auto size_from_env(const char* key, std::size_t& out) -> std::expected<void, core::error> {
  auto v = core::getenv_nonempty(key);
  if (!v) return {};
  std::uint64_t x = 0;
  if (!core::parse_u64(*v, x)) {
    return std::unexpected(core::error{core::error_code::config_invalid,
        std::string(key) + " must be an unsigned integer, got \"" + *v + "\"", kComponent});
  }
  out = static_cast<std::size_t>(x);
  return {};
}

} // namespace

auto config_from_env(CheckpointConfig base) -> std::expected<CheckpointConfig, core::error> {
  using core::error; using core::error_code;
  CheckpointConfig cfg = std::move(base);

  if (auto v = core::getenv_nonempty("TIDEMARK_STREAM")) cfg.stream_name = *v;
  if (auto v = core::getenv_nonempty("TIDEMARK_STARTING_POINT")) {
    auto sp = stream::parse_starting_point(*v);
    if (!sp) return std::unexpected(sp.error());
    cfg.starting_point = *sp;
  }
  if (auto r = size_from_env("TIDEMARK_MAX_LIST_PAGES", cfg.finder.max_pages); !r) return std::unexpected(r.error());
  if (auto r = size_from_env("TIDEMARK_LIST_PAGE_SIZE", cfg.finder.page_size); !r) return std::unexpected(r.error());
  if (auto v = core::getenv_nonempty("TIDEMARK_CHECKPOINT_PATH")) cfg.checkpoint_path = *v;

  if (!core::is_valid_name(cfg.stream_name)) {
    return std::unexpected(error{error_code::config_invalid,
        "stream name \"" + cfg.stream_name + "\" is empty or has characters outside [A-Za-z0-9_.-]", kComponent});
  }
  if (cfg.finder.max_pages == 0) {
    return std::unexpected(error{error_code::config_invalid, "max list pages must be positive", kComponent});
  }
  return cfg;
}

} // namespace tidemark
