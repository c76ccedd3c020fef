#include "tidemark/stream/sequence_number.hpp"

namespace tidemark::stream {

namespace {

std::string_view strip_leading_zeros(std::string_view s) noexcept {
  std::size_t i = 0;
  while (i + 1 < s.size() && s[i] == '0') ++i;
  return s.substr(i);
}

} // namespace

bool is_valid_sequence_number(std::string_view s) noexcept {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::strong_ordering compare_sequence_numbers(std::string_view a, std::string_view b) noexcept {
  a = strip_leading_zeros(a);
  b = strip_leading_zeros(b);
  if (a.size() != b.size()) return a.size() <=> b.size();
  const int c = a.compare(b);
  if (c < 0) return std::strong_ordering::less;
  if (c > 0) return std::strong_ordering::greater;
  return std::strong_ordering::equal;
}

std::strong_ordering compare_positions(std::string_view seq_a, std::uint64_t sub_a,
                                       std::string_view seq_b, std::uint64_t sub_b) noexcept {
  if (auto c = compare_sequence_numbers(seq_a, seq_b); c != 0) return c;
  return sub_a <=> sub_b;
}

} // namespace tidemark::stream
