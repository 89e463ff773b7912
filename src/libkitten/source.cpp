#include "kitten/source.hpp"

#include <fmt/std.h>

#include <fstream>
#include <iterator>

#include "kitten/errors.hpp"
#include "logger.hpp"

namespace xpto::kitten {

std::string read_file(const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in)
    throw source_read_failure{
      fmt::format("could not open source file {}", file), file};
  return std::string{
    std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>()};
}

std::string slice(
    std::string_view text, std::int64_t offset, std::int64_t length,
    const fs::path& file) {
  if (offset < 0 || length < 0 ||
      static_cast<std::uint64_t>(offset) > text.size() ||
      static_cast<std::uint64_t>(length) >
          text.size() - static_cast<std::size_t>(offset))
    throw source_read_failure{
      fmt::format(
          "byte range [{}, +{}) is outside {} ({} bytes)", offset, length,
          file.empty() ? fs::path{"<text>"} : file, text.size()),
      file};
  return std::string{text.substr(offset, length)};
}

std::string read_source_range(
    const fs::path& file, std::int64_t offset, std::int64_t length) {
  LOG_TRACE("reading [{}, +{}) of {}", offset, length, file.string());
  auto text = read_file(file);
  return slice(text, offset, length, file);
}

}  // namespace xpto::kitten
