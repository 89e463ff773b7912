#include "options.hpp"

#include <CLI/CLI.hpp>
#include <iostream>

namespace xpto::kitten {

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, run_options& ropts) {
  CLI::App app{"Swift structure, syntax and documentation via sourcekitd"};

  auto* structure = app.add_option(
      "--structure", ropts.structure_file,
      "Print the structure of a Swift file as JSON");
  auto* syntax = app.add_option(
      "--syntax", ropts.syntax_file,
      "Print the syntax tokens of a Swift file as JSON");
  auto* syntax_text = app.add_option(
      "--syntax-text", ropts.syntax_text,
      "Print the syntax tokens of inline Swift source as JSON");
  auto* offsets = app.add_option(
      "--documented-offsets", ropts.documented_offsets_file,
      "Print the offsets of documented identifiers of a Swift file");
  auto* docs = app.add_flag(
      "--docs", ropts.docs,
      "Document the Swift files among the compiler arguments after '--'");
  app.add_option(
      "compiler-args", ropts.compiler_args,
      "Swift compiler arguments, for --docs");
  app.add_option(
      "-d,--debug",
      loglevel,
      "Debug log level (3=INFO)")
    ->capture_default_str();

  structure->excludes(syntax, syntax_text, offsets, docs);
  syntax->excludes(syntax_text, offsets, docs);
  syntax_text->excludes(offsets, docs);
  offsets->excludes(docs);

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  bool any_mode = ropts.structure_file || ropts.syntax_file ||
                  ropts.syntax_text || ropts.documented_offsets_file ||
                  ropts.docs;
  if (!any_mode) {
    std::cerr << app.help();
    return 1;
  }
  return std::nullopt;
}

}  // namespace xpto::kitten
