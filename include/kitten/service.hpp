#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "kitten/response.hpp"

namespace xpto::kitten {

namespace fs = std::filesystem;

// source.request.editor.open, on a file or on inline text
struct open_request {
  std::string name;
  std::variant<fs::path, std::string> source;
};

// source.request.cursorinfo; `offset` is rewritten before every send
struct cursor_info_request {
  fs::path source_file;
  std::vector<std::string> compiler_args;
  std::int64_t offset{};
};

/** @brief The calls the pipeline makes into sourcekitd.
 *
 * Each member is synchronous and blocks until the reply arrives.
 * @c uid_string returns a service-owned string, or nullptr when the UID has
 * no name; callers copy it out before the next call.
 */
struct service {
  std::function<const char*(std::uint64_t)> uid_string;
  std::function<response_value(const open_request&)> editor_open;
  std::function<response_value(const cursor_info_request&)> cursor_info;
};

}  // namespace xpto::kitten
