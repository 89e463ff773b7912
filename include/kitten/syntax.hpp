#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kitten/response.hpp"
#include "kitten/uid.hpp"

namespace xpto::kitten {

inline constexpr std::string_view identifier_kind{
  "source.lang.swift.syntaxtype.identifier"};

struct syntax_token {
  std::string kind;
  std::int64_t offset;
  std::int64_t length;
};

// Layout of a packed syntax map: a 16-byte header whose second 8 bytes hold
// count * 16, followed by count records of 16 bytes each.
inline constexpr std::size_t syntax_header_size{16};
inline constexpr std::size_t syntax_record_size{16};

/** @brief Decode a packed syntax map into tokens, in stream order.
 *
 * Throws @c malformed_payload when the blob is shorter than its header
 * claims and @c unresolvable_identifier when a token kind has no name.
 */
std::vector<syntax_token> decode_syntax_map(
    std::span<const std::uint8_t> blob, uid_resolver& resolver);

// Start offsets of the identifier tokens of a syntax map
std::vector<std::int64_t> identifier_offsets(
    std::span<const std::uint8_t> blob, uid_resolver& resolver);

// [{"type": ..., "offset": ..., "length": ...}, ...]
response_value tokens_to_response(const std::vector<syntax_token>& tokens);

}  // namespace xpto::kitten
