#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace xpto::kitten {

/** @brief Offsets of the identifiers that carry a documentation comment.
 *
 * Every doc-comment line ("///" up to the newline) and every block comment
 * closer directly followed by a newline in @p source_text is attributed to
 * the first identifier starting at or after the end of the match.
 * Consecutive comment lines before one declaration yield that declaration's
 * offset once per line.  Comments with no identifier after them yield
 * nothing.
 */
std::vector<std::int64_t> documented_token_offsets(
    std::string_view source_text,
    std::span<const std::int64_t> identifier_offsets);

}  // namespace xpto::kitten
