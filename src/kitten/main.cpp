#include <boost/json.hpp>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <typeinfo>

#include "../libkitten/logger.hpp"
#include "../libkitten/utils.hpp"
#include "kitten/json.hpp"
#include "kitten/kitten.hpp"
#include "kitten/uid.hpp"
#include "options.hpp"
#include "sourcekitd.hpp"

namespace kitten = xpto::kitten;
namespace json = boost::json;

namespace {

json::object error_to_json(const std::exception& e) {
  json::object res;
  res["error"] = kitten::utils::demangle_symbol(typeid(e).name());
  res["details"] = e.what();
  return res;
}

std::string run(kitten::service& svc, kitten::run_options& ropts) {
  kitten::uid_resolver resolver{svc.uid_string};

  if (ropts.structure_file) {
    return kitten::serialize(
        kitten::structure(svc, resolver, *ropts.structure_file));
  } else if (ropts.syntax_file) {
    return kitten::serialize(kitten::syntax(
        svc, resolver, {.name = "", .source = *ropts.syntax_file}));
  } else if (ropts.syntax_text) {
    return kitten::serialize(kitten::syntax(
        svc, resolver, {.name = "", .source = *ropts.syntax_text}));
  } else if (ropts.documented_offsets_file) {
    auto offsets = kitten::documented_token_offsets(
        svc, resolver, *ropts.documented_offsets_file);
    return kitten::pretty_print(json::array(offsets.begin(), offsets.end()));
  } else {
    return kitten::serialize(kitten::docs(svc, resolver, ropts.compiler_args));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  kitten::run_options ropts{};
  int loglevel{3};

  auto done = kitten::parse_options(std::span(argv, argc), loglevel, ropts);
  if (done) return done.value();

  xpto::logger::set_level(loglevel);
  LOG_DEBUG("loglevel={}", loglevel);

  if (ropts.docs && kitten::swift_files(ropts.compiler_args).empty())
    LOG_WARN("--docs given, but no .swift file among the compiler arguments");

  try {
    kitten::sourcekitd skd;
    auto svc = kitten::make_service(skd);
    std::cout << run(svc, ropts) << "\n";
    return 0;
  } catch (const std::exception& e) {
    LOG_ERROR("{}", e.what());
    std::cerr << json::serialize(error_to_json(e)) << "\n";
    return 1;
  }
}
