#include "tidemark/core/text.hpp"

#include <charconv>

namespace tidemark::core {

bool parse_u64(std::string_view s, std::uint64_t& out) noexcept {
  if (s.empty()) return false;
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

bool parse_i64(std::string_view s, std::int64_t& out) noexcept {
  if (s.empty()) return false;
  const char* beg = s.data(); const char* end = beg + s.size();
  long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end) return false;
  out = static_cast<std::int64_t>(tmp);
  return true;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  auto lower = [](char c){ return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; };
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (lower(a[i]) != lower(b[i])) return false;
  }
  return true;
}

bool is_valid_name(std::string_view s) noexcept {
  if (s.empty() || s.size() > 128) return false;
  for (unsigned char c : s) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                    || c == '_' || c == '.' || c == '-';
    if (!ok) return false;
  }
  return true;
}

} // namespace tidemark::core
