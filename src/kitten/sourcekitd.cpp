#include "sourcekitd.hpp"

#include <fmt/format.h>
#include <sourcekitd/sourcekitd.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "../libkitten/logger.hpp"
#include "../libkitten/utils.hpp"
#include "kitten/errors.hpp"

namespace xpto::kitten {

namespace {

sourcekitd_uid_t uid(const char* name) {
  return sourcekitd_uid_get_from_cstr(name);
}

// UIDs travel through response_value as their handle's bits
std::uint64_t uid_to_u64(sourcekitd_uid_t u) {
  return static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(u));
}

sourcekitd_uid_t u64_to_uid(std::uint64_t u) {
  // NOLINTNEXTLINE(performance-no-int-to-ptr)
  return reinterpret_cast<sourcekitd_uid_t>(static_cast<std::uintptr_t>(u));
}

response_value from_variant(sourcekitd_variant_t v);

bool collect_entry(
    sourcekitd_uid_t key, sourcekitd_variant_t value, void* cookie) {
  auto* m = static_cast<response_map*>(cookie);
  m->insert_or_assign(sourcekitd_uid_get_string_ptr(key), from_variant(value));
  return true;
}

bool collect_element(
    size_t /*index*/, sourcekitd_variant_t value, void* cookie) {
  auto* l = static_cast<response_list*>(cookie);
  l->push_back(from_variant(value));
  return true;
}

response_value from_variant(sourcekitd_variant_t v) {
  switch (sourcekitd_variant_get_type(v)) {
    case SOURCEKITD_VARIANT_TYPE_NULL:
      return nullptr;
    case SOURCEKITD_VARIANT_TYPE_DICTIONARY: {
      response_map m;
      sourcekitd_variant_dictionary_apply_f(v, collect_entry, &m);
      return m;
    }
    case SOURCEKITD_VARIANT_TYPE_ARRAY: {
      response_list l;
      sourcekitd_variant_array_apply_f(v, collect_element, &l);
      return l;
    }
    case SOURCEKITD_VARIANT_TYPE_INT64:
      return std::int64_t{sourcekitd_variant_int64_get_value(v)};
    case SOURCEKITD_VARIANT_TYPE_STRING:
      return std::string{
        sourcekitd_variant_string_get_ptr(v),
        sourcekitd_variant_string_get_length(v)};
    case SOURCEKITD_VARIANT_TYPE_UID:
      // The handle itself is the identifier; uid_resolver names it later
      return uid_to_u64(sourcekitd_variant_uid_get_value(v));
    case SOURCEKITD_VARIANT_TYPE_BOOL:
      return static_cast<bool>(sourcekitd_variant_bool_get_value(v));
    case SOURCEKITD_VARIANT_TYPE_DOUBLE:
      return sourcekitd_variant_double_get_value(v);
    case SOURCEKITD_VARIANT_TYPE_DATA: {
      const auto* p =
          static_cast<const std::uint8_t*>(sourcekitd_variant_data_get_ptr(v));
      return response_bytes(p, p + sourcekitd_variant_data_get_size(v));
    }
  }
  utils::throwf<service_error>(
      "unknown sourcekitd variant type {}",
      static_cast<int>(sourcekitd_variant_get_type(v)));
}

// Sends `req`, takes ownership of it, and converts the reply
response_value send(sourcekitd_object_t req, std::string_view kind) {
  KITTEN_AUTO(sourcekitd_request_release(req));

  LOG_DEBUG("sending {}", kind);
  sourcekitd_response_t resp = sourcekitd_send_request_sync(req);
  KITTEN_AUTO(sourcekitd_response_dispose(resp));

  if (sourcekitd_response_is_error(resp))
    throw service_error{
      fmt::format(
          "{} failed: {}", kind,
          sourcekitd_response_error_get_description(resp)),
      std::string{kind}};

  return from_variant(sourcekitd_response_get_value(resp));
}

}  // namespace

sourcekitd::sourcekitd() {
  LOG_DEBUG("initializing sourcekitd");
  sourcekitd_initialize();
}

sourcekitd::~sourcekitd() { sourcekitd_shutdown(); }

const char* sourcekitd::uid_string(std::uint64_t u) {
  return sourcekitd_uid_get_string_ptr(u64_to_uid(u));
}

response_value sourcekitd::editor_open(const open_request& req) {
  constexpr std::string_view kind{"source.request.editor.open"};
  sourcekitd_object_t obj =
      sourcekitd_request_dictionary_create(nullptr, nullptr, 0);
  sourcekitd_request_dictionary_set_uid(
      obj, uid("key.request"), uid(kind.data()));
  sourcekitd_request_dictionary_set_string(
      obj, uid("key.name"), req.name.c_str());
  std::visit(
      [&](const auto& src) {
        using T = std::decay_t<decltype(src)>;
        if constexpr (std::is_same_v<T, fs::path>) {
          sourcekitd_request_dictionary_set_string(
              obj, uid("key.sourcefile"), src.c_str());
        } else {
          sourcekitd_request_dictionary_set_string(
              obj, uid("key.sourcetext"), src.c_str());
        }
      },
      req.source);
  return send(obj, kind);
}

response_value sourcekitd::cursor_info(const cursor_info_request& req) {
  constexpr std::string_view kind{"source.request.cursorinfo"};
  sourcekitd_object_t obj =
      sourcekitd_request_dictionary_create(nullptr, nullptr, 0);
  sourcekitd_request_dictionary_set_uid(
      obj, uid("key.request"), uid(kind.data()));
  sourcekitd_request_dictionary_set_string(
      obj, uid("key.sourcefile"), req.source_file.c_str());
  sourcekitd_request_dictionary_set_int64(obj, uid("key.offset"), req.offset);

  sourcekitd_object_t args = sourcekitd_request_array_create(nullptr, 0);
  for (const auto& a : req.compiler_args)
    sourcekitd_request_array_set_string(
        args, SOURCEKITD_ARRAY_APPEND, a.c_str());
  sourcekitd_request_dictionary_set_value(obj, uid("key.compilerargs"), args);
  sourcekitd_request_release(args);

  return send(obj, kind);
}

service make_service(sourcekitd& skd) {
  return {
    .uid_string = [&skd](std::uint64_t u) { return skd.uid_string(u); },
    .editor_open =
        [&skd](const open_request& r) { return skd.editor_open(r); },
    .cursor_info =
        [&skd](const cursor_info_request& r) { return skd.cursor_info(r); },
  };
}

}  // namespace xpto::kitten
