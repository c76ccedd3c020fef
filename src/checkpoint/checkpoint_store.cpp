#include "tidemark/checkpoint/checkpoint_store.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <vector>

#include "tidemark/core/text.hpp"

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif
#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace tidemark::checkpoint {

namespace {

constexpr const char* kComponent = "checkpoint.store";
constexpr std::string_view kHeader = "tidemark-reader-checkpoint v1";

core::error parse_error(std::size_t line_no, const std::string& what) {
  return core::error{core::error_code::data_integrity,
                     "checkpoint parse error at line " + std::to_string(line_no) + ": " + what, kComponent};
}

auto parse_shard_line(const std::string& stream_name, const std::string& line, std::size_t line_no)
    -> std::expected<ShardCheckpoint, core::error> {
  std::optional<std::string> shard, seq;
  std::optional<stream::ShardIteratorType> type;
  std::optional<std::uint64_t> subseq;
  std::optional<stream::Timestamp> ts;

  std::istringstream iss(line);
  std::string kv;
  while (iss >> kv) {
    const auto eq = kv.find('=');
    if (eq == std::string::npos) return std::unexpected(parse_error(line_no, "expected key=value, got \"" + kv + "\""));
    const auto k = kv.substr(0, eq);
    const auto v = kv.substr(eq + 1);
    auto dup = [&]{ return parse_error(line_no, "repeated field " + k); };
    if (k == "shard") {
      if (shard) return std::unexpected(dup());
      if (!core::is_valid_name(v)) return std::unexpected(parse_error(line_no, "invalid shard id \"" + v + "\""));
      shard = v;
    } else if (k == "type") {
      if (type) return std::unexpected(dup());
      type = stream::parse_iterator_type(v);
      if (!type) return std::unexpected(parse_error(line_no, "unknown type \"" + v + "\""));
    } else if (k == "seq") {
      if (seq) return std::unexpected(dup());
      if (!stream::is_valid_sequence_number(v)) return std::unexpected(parse_error(line_no, "invalid seq=\"" + v + "\""));
      seq = v;
    } else if (k == "subseq") {
      if (subseq) return std::unexpected(dup());
      std::uint64_t x = 0;
      if (!core::parse_u64(v, x)) return std::unexpected(parse_error(line_no, "invalid subseq=\"" + v + "\""));
      subseq = x;
    } else if (k == "ts") {
      if (ts) return std::unexpected(dup());
      std::int64_t ms = 0;
      if (!core::parse_i64(v, ms)) return std::unexpected(parse_error(line_no, "invalid ts=\"" + v + "\""));
      ts = stream::Timestamp{std::chrono::milliseconds{ms}};
    } else {
      return std::unexpected(parse_error(line_no, "unknown field " + k));
    }
  }
  if (!shard || !type) return std::unexpected(parse_error(line_no, "missing required field(s)"));

  auto c = ShardCheckpoint::create(stream_name, *shard, *type, seq, subseq, ts);
  if (!c) return std::unexpected(parse_error(line_no, c.error().message));
  return c;
}

void strip_cr(std::string& line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
}

} // namespace

std::string encode(const ReaderCheckpoint& checkpoint) {
  std::string out;
  out.reserve(64 + checkpoint.size() * 80);
  out.append(kHeader).append("\n");
  out.append("stream=").append(checkpoint.stream_name()).append("\n");
  for (const auto& c : checkpoint) {
    out.append("shard=").append(c.shard_id())
       .append(" type=").append(stream::to_string(c.type()));
    if (c.sequence_number()) out.append(" seq=").append(*c.sequence_number());
    if (c.sub_sequence_number()) out.append(" subseq=").append(std::to_string(*c.sub_sequence_number()));
    if (c.timestamp()) out.append(" ts=").append(std::to_string(c.timestamp()->time_since_epoch().count()));
    out.append("\n");
  }
  return out;
}

auto decode(std::string_view text) -> std::expected<ReaderCheckpoint, core::error> {
  std::istringstream in{std::string(text)};
  std::string header;
  std::getline(in, header);
  strip_cr(header);
  if (header != kHeader) return std::unexpected(parse_error(1, "bad header"));

  std::string line;
  std::size_t line_no = 1;
  std::string stream_name;
  std::vector<ShardCheckpoint> shards;
  while (std::getline(in, line)) {
    ++line_no;
    strip_cr(line);
    if (line.empty()) continue;
    if (stream_name.empty()) {
      if (line.rfind("stream=", 0) != 0) return std::unexpected(parse_error(line_no, "missing stream line"));
      stream_name = line.substr(7);
      if (!core::is_valid_name(stream_name)) {
        return std::unexpected(parse_error(line_no, "invalid stream name \"" + stream_name + "\""));
      }
      continue;
    }
    auto c = parse_shard_line(stream_name, line, line_no);
    if (!c) return std::unexpected(c.error());
    shards.push_back(std::move(*c));
  }
  if (stream_name.empty()) return std::unexpected(parse_error(line_no, "missing stream line"));
  return ReaderCheckpoint::create(std::move(stream_name), std::move(shards));
}

auto save_reader_checkpoint(const std::filesystem::path& path, const ReaderCheckpoint& checkpoint)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  const auto tmp = std::filesystem::path(path.string() + ".tmp");
  const auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
  // Refuse what decode would reject so a saved checkpoint always loads back.
  if (!core::is_valid_name(checkpoint.stream_name())) {
    return std::unexpected(error{error_code::invalid_argument,
        "stream name \"" + checkpoint.stream_name() + "\" cannot be persisted", kComponent});
  }
  for (const auto& c : checkpoint) {
    if (!core::is_valid_name(c.shard_id())) {
      return std::unexpected(error{error_code::invalid_argument,
          "shard id \"" + c.shard_id() + "\" cannot be persisted", kComponent});
    }
  }
  const std::string content = encode(checkpoint);

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) return std::unexpected(error{error_code::io_failed, "checkpoint tmp open failed", kComponent});
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "checkpoint tmp write failed", kComponent});
    }
  }

#if defined(__linux__) || defined(__APPLE__)
  {
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd < 0) {
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "checkpoint tmp fsync open failed", kComponent});
    }
    const int rc = ::fsync(fd);
    (void)::close(fd);
    if (rc != 0) {
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "checkpoint tmp fsync failed", kComponent});
    }
  }
  {
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "checkpoint rename failed: " + ec.message(), kComponent});
    }
    int dfd = ::open(dir.c_str(), O_RDONLY);
    if (dfd >= 0) { (void)::fsync(dfd); (void)::close(dfd); }
  }
#elif defined(_WIN32)
  {
    BOOL ok = ::MoveFileExW(tmp.wstring().c_str(), path.wstring().c_str(),
                            MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH);
    if (!ok) {
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "checkpoint replace failed", kComponent});
    }
  }
#else
  {
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      std::error_code rec; std::filesystem::remove(tmp, rec);
      return std::unexpected(error{error_code::io_failed, "checkpoint rename failed", kComponent});
    }
  }
#endif
  return {};
}

auto load_reader_checkpoint(const std::filesystem::path& path)
    -> std::expected<ReaderCheckpoint, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(error{error_code::not_found, "no checkpoint at " + path.string(), kComponent});
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::io_failed, "checkpoint open failed", kComponent});
  std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) return std::unexpected(error{error_code::io_failed, "checkpoint read failed", kComponent});
  return decode(text);
}

} // namespace tidemark::checkpoint
