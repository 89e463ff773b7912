#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace xpto::kitten {

namespace fs = std::filesystem;

struct run_options {
  std::optional<fs::path> structure_file{};
  std::optional<fs::path> syntax_file{};
  std::optional<std::string> syntax_text{};
  std::optional<fs::path> documented_offsets_file{};
  bool docs{};
  std::vector<std::string> compiler_args{};
};

// Returns an exit code when the program should stop right away (help,
// parse errors, no mode given).
std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, run_options& ropts);

}  // namespace xpto::kitten
