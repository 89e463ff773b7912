#include "kitten/syntax.hpp"

#include <fmt/format.h>

#include <cstdint>

#include "kitten/errors.hpp"
#include "logger.hpp"

namespace xpto::kitten {

namespace {

template <typename T>
T read_le(std::span<const std::uint8_t> s, std::size_t off) {
  T v{};
  for (std::size_t i = 0; i < sizeof(T); ++i)
    v |= static_cast<T>(s[off + i]) << (8 * i);
  return v;
}

}  // namespace

std::vector<syntax_token> decode_syntax_map(
    std::span<const std::uint8_t> blob, uid_resolver& resolver) {
  if (blob.size() < syntax_header_size)
    throw malformed_payload{
      fmt::format(
          "syntax map of {} bytes is shorter than its {}-byte header",
          blob.size(), syntax_header_size),
      syntax_header_size, blob.size()};

  // The header stores the token count shifted left by 4
  std::uint64_t count = read_le<std::uint64_t>(blob, 8) >> 4;
  std::size_t available = blob.size() - syntax_header_size;
  if (count > available / syntax_record_size) {
    auto declared =
        count > (SIZE_MAX - syntax_header_size) / syntax_record_size
            ? SIZE_MAX
            : syntax_header_size + count * syntax_record_size;
    throw malformed_payload{
      fmt::format(
          "syntax map declares {} tokens but holds only {} bytes", count,
          blob.size()),
      declared, blob.size()};
  }

  LOG_DEBUG("decoding {} syntax tokens", count);

  std::vector<syntax_token> tokens;
  tokens.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    std::size_t base = syntax_header_size + i * syntax_record_size;

    auto uid = read_le<std::uint64_t>(blob, base);
    auto kind = resolver.resolve(uid);
    if (!kind)
      throw unresolvable_identifier{
        fmt::format("syntax token {} has unnamed kind uid {}", i, uid), uid};

    auto offset = read_le<std::uint32_t>(blob, base + 8);
    // Lengths are stored doubled
    auto length = read_le<std::uint32_t>(blob, base + 12) >> 1;

    tokens.push_back(
        {.kind = std::string{*kind},
         .offset = static_cast<std::int64_t>(offset),
         .length = static_cast<std::int64_t>(length)});
  }
  return tokens;
}

std::vector<std::int64_t> identifier_offsets(
    std::span<const std::uint8_t> blob, uid_resolver& resolver) {
  std::vector<std::int64_t> res;
  for (auto&& tok : decode_syntax_map(blob, resolver))
    if (tok.kind == identifier_kind) res.push_back(tok.offset);
  return res;
}

response_value tokens_to_response(const std::vector<syntax_token>& tokens) {
  response_list res;
  res.reserve(tokens.size());
  for (const auto& tok : tokens) {
    res.push_back(response_map{
      {"type", tok.kind},
      {"offset", tok.offset},
      {"length", tok.length},
    });
  }
  return res;
}

}  // namespace xpto::kitten
