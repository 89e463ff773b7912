#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "kitten/response.hpp"
#include "kitten/service.hpp"
#include "kitten/uid.hpp"

namespace xpto::kitten {

namespace fs = std::filesystem;

inline constexpr std::string_view syntax_map_key{"key.syntaxmap"};

// editor.open on `file`, syntax map dropped, UIDs resolved
response_value structure(
    service& svc, uid_resolver& resolver, const fs::path& file);

// editor.open on a file or on text, syntax map decoded to a token list
response_value syntax(
    service& svc, uid_resolver& resolver, const open_request& req);

/** @brief Structure of every Swift file in @p compiler_args, with the
 * declarations enriched by cursorinfo.
 *
 * Returns a list holding one map per file, in argument order.
 */
response_value docs(
    service& svc, uid_resolver& resolver,
    const std::vector<std::string>& compiler_args);

std::vector<fs::path> swift_files(std::span<const std::string> args);

std::vector<std::int64_t> documented_token_offsets(
    service& svc, uid_resolver& resolver, const fs::path& file);

}  // namespace xpto::kitten
