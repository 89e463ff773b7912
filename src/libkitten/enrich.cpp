#include "kitten/enrich.hpp"

#include <fmt/std.h>

#include <optional>
#include <string>
#include <utility>

#include "kitten/errors.hpp"
#include "kitten/source.hpp"
#include "logger.hpp"

namespace xpto::kitten {

namespace {

constexpr std::string_view kind_key{"key.kind"};
constexpr std::string_view name_key{"key.name"};
constexpr std::string_view nameoffset_key{"key.nameoffset"};
constexpr std::string_view offset_key{"key.offset"};
constexpr std::string_view length_key{"key.length"};

void walk_map(response_map& node, uid_resolver& r, supplementary_query* q);

void walk(response_value& v, uid_resolver& r, supplementary_query* q) {
  if (auto* m = v.if_map()) {
    walk_map(*m, r, q);
  } else if (auto* l = v.if_list()) {
    for (auto& e : *l) walk(e, r, q);
  }
}

std::optional<std::int64_t> integer_field(
    const response_map& node, std::string_view key) {
  const auto* v = node.find(key);
  if (!v) return std::nullopt;
  if (const auto* i = v->if_int64()) return *i;
  return std::nullopt;
}

// Merge a cursorinfo reply into `node`.  The reply's own key.kind is less
// precise than editor.open's and is dropped.
void merge_cursor_info(response_map& node, response_value reply) {
  auto* m = reply.if_map();
  if (!m) {
    LOG_WARN("cursorinfo reply is a {}, not a map", kind_name(reply));
    return;
  }
  for (auto& [k, v] : *m) {
    if (k == kind_key) continue;
    node.insert_or_assign(k, std::move(v));
  }
}

void add_cursor_info(
    response_map& node, std::int64_t nameoffset, supplementary_query& q) {
  q.request.offset = nameoffset;
  LOG_DEBUG(
      "cursorinfo for {} at offset {}", q.request.source_file.string(),
      nameoffset);
  merge_cursor_info(node, q.send(q.request));
}

void add_mark_name(response_map& node, const supplementary_query& q) {
  auto offset = integer_field(node, offset_key);
  auto length = integer_field(node, length_key);
  if (!offset || !length)
    throw source_read_failure{
      fmt::format(
          "comment mark in {} has no offset/length", q.request.source_file),
      q.request.source_file};
  node.insert_or_assign(
      name_key, read_source_range(q.request.source_file, *offset, *length));
}

void walk_map(response_map& node, uid_resolver& r, supplementary_query* q) {
  // Keys added by a merge below are not revisited
  for (const auto& key : node.keys()) {
    auto* v = node.find(key);
    if (!v) continue;

    if (v->if_list() || v->if_map()) {
      walk(*v, r, q);
      continue;
    }

    auto* uid = v->if_uint64();
    if (!uid) continue;
    auto name = r.resolve(*uid);
    if (!name) continue;

    *v = std::string{*name};

    if (!q || key != kind_key) continue;

    if (name->starts_with(decl_kind_prefix)) {
      auto nameoffset = integer_field(node, nameoffset_key);
      if (nameoffset && *nameoffset >= 0)
        add_cursor_info(node, *nameoffset, *q);
    } else if (*name == comment_mark_kind) {
      add_mark_name(node, *q);
    }
  }
}

}  // namespace

void enrich(
    response_map& tree, uid_resolver& resolver, supplementary_query* query) {
  walk_map(tree, resolver, query);
}

}  // namespace xpto::kitten
