#pragma once

#include <functional>
#include <string_view>

#include "kitten/response.hpp"
#include "kitten/service.hpp"
#include "kitten/uid.hpp"

namespace xpto::kitten {

inline constexpr std::string_view decl_kind_prefix{"source.lang.swift.decl."};
inline constexpr std::string_view comment_mark_kind{
  "source.lang.swift.syntaxtype.comment.mark"};

/** @brief A cursorinfo request template plus the means to send it.
 *
 * The walker only touches @c request.offset, once per declaration it
 * enriches.  The comment mark path reads @c request.source_file.
 */
struct supplementary_query {
  cursor_info_request request;
  std::function<response_value(const cursor_info_request&)> send;
};

/** @brief Resolve UIDs in @p tree in place.
 *
 * Every unsigned integer value that names a UID is replaced by its string.
 * When @p query is given, declaration nodes additionally receive the keys
 * of a cursorinfo reply (except @c key.kind), and comment mark nodes get
 * their source text under @c key.name.
 *
 * Throws @c source_read_failure when a comment mark's text can't be read.
 */
void enrich(
    response_map& tree, uid_resolver& resolver,
    supplementary_query* query = nullptr);

}  // namespace xpto::kitten
