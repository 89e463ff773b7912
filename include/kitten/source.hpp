#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace xpto::kitten {

namespace fs = std::filesystem;

std::string read_file(const fs::path& file);

// Exact byte slice [offset, offset + length) of `text`.  Throws
// source_read_failure (attributed to `file`) when the range is out of bounds.
std::string slice(
    std::string_view text, std::int64_t offset, std::int64_t length,
    const fs::path& file = {});

std::string read_source_range(
    const fs::path& file, std::int64_t offset, std::int64_t length);

}  // namespace xpto::kitten
