#pragma once

/** \file text.hpp
 *  \brief Small non-throwing parsing helpers shared by the config and store layers.
 */

#include <cstdint>
#include <string_view>

namespace tidemark::core {

/** Parse a base-10 unsigned integer spanning the whole input. Rejects signs, blanks and overflow. */
[[nodiscard]] bool parse_u64(std::string_view s, std::uint64_t& out) noexcept;

/** Parse a base-10 signed integer spanning the whole input. */
[[nodiscard]] bool parse_i64(std::string_view s, std::int64_t& out) noexcept;

/** ASCII case-insensitive equality. */
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

/** True if s is 1..128 characters from [A-Za-z0-9_.-] (stream names and shard ids). */
[[nodiscard]] bool is_valid_name(std::string_view s) noexcept;

} // namespace tidemark::core
