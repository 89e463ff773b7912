#include "kitten/docs.hpp"

#include <re2/re2.h>

#include <algorithm>

#include "logger.hpp"

namespace xpto::kitten {

// Doc-comment lines and block comment closers, each up to its newline.
// Latin-1 so that matching is byte-wise and any byte is a `.`
const RE2 r_doc_comment{R"((///.*\n|\*/\n))", RE2::Latin1};

std::vector<std::int64_t> documented_token_offsets(
    std::string_view source_text,
    std::span<const std::int64_t> identifier_offsets) {
  std::vector<std::int64_t> idents(
      identifier_offsets.begin(), identifier_offsets.end());
  std::sort(idents.begin(), idents.end());

  std::vector<std::int64_t> res;
  re2::StringPiece input(source_text.data(), source_text.size());
  re2::StringPiece match;
  while (RE2::FindAndConsume(&input, r_doc_comment, &match)) {
    auto end = static_cast<std::int64_t>(
        match.data() + match.size() - source_text.data());
    auto it = std::lower_bound(idents.begin(), idents.end(), end);
    if (it == idents.end()) {
      LOG_DEBUG("comment ending at {} documents nothing", end);
      continue;
    }
    res.push_back(*it);
  }
  return res;
}

}  // namespace xpto::kitten
