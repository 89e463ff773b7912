#include "kitten/kitten.hpp"

#include <fmt/format.h>

#include <utility>

#include "kitten/docs.hpp"
#include "kitten/enrich.hpp"
#include "kitten/errors.hpp"
#include "kitten/source.hpp"
#include "kitten/syntax.hpp"
#include "logger.hpp"

namespace xpto::kitten {

namespace {

response_map open_as_map(service& svc, const open_request& req) {
  auto reply = svc.editor_open(req);
  auto* m = reply.if_map();
  if (!m)
    throw service_error{
      fmt::format("editor.open replied with a {}, not a map", kind_name(reply)),
      "source.request.editor.open"};
  return std::move(*m);
}

const response_bytes& syntax_map_of(const response_map& reply) {
  const auto* v = reply.find(syntax_map_key);
  const auto* bytes = v ? v->if_bytes() : nullptr;
  if (!bytes)
    throw malformed_payload{"editor.open reply carries no syntax map", 0, 0};
  return *bytes;
}

open_request open_file(const fs::path& file) {
  return {.name = "", .source = file};
}

}  // namespace

response_value structure(
    service& svc, uid_resolver& resolver, const fs::path& file) {
  LOG_INFO("structure of {}", file.string());
  auto reply = open_as_map(svc, open_file(file));
  reply.erase(syntax_map_key);
  enrich(reply, resolver);
  return reply;
}

response_value syntax(
    service& svc, uid_resolver& resolver, const open_request& req) {
  auto reply = open_as_map(svc, req);
  return tokens_to_response(
      decode_syntax_map(syntax_map_of(reply), resolver));
}

std::vector<fs::path> swift_files(std::span<const std::string> args) {
  std::vector<fs::path> res;
  for (const auto& a : args)
    if (a.ends_with(".swift")) res.emplace_back(a);
  return res;
}

response_value docs(
    service& svc, uid_resolver& resolver,
    const std::vector<std::string>& compiler_args) {
  auto files = swift_files(compiler_args);
  LOG_INFO(
      "documenting {} Swift files out of {} compiler arguments", files.size(),
      compiler_args.size());

  supplementary_query query{
    .request = {.source_file = {}, .compiler_args = compiler_args},
    .send = svc.cursor_info};

  response_list res;
  res.reserve(files.size());
  for (const auto& file : files) {
    LOG_DEBUG("documenting {}", file.string());
    query.request.source_file = file;

    auto reply = open_as_map(svc, open_file(file));
    reply.erase(syntax_map_key);
    enrich(reply, resolver, &query);
    res.push_back(std::move(reply));
  }
  return res;
}

std::vector<std::int64_t> documented_token_offsets(
    service& svc, uid_resolver& resolver, const fs::path& file) {
  auto reply = open_as_map(svc, open_file(file));
  auto idents = identifier_offsets(syntax_map_of(reply), resolver);
  LOG_DEBUG("{} has {} identifiers", file.string(), idents.size());
  return documented_token_offsets(read_file(file), idents);
}

}  // namespace xpto::kitten
