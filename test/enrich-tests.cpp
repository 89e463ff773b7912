#include <doctest/doctest.h>

#include <filesystem>

#include "fake_service.hpp"
#include "kitten/enrich.hpp"
#include "kitten/errors.hpp"
#include "test_config.h"

namespace fs = std::filesystem;

using kitten::response_list;
using kitten::response_map;
using kitten::response_value;

namespace {

struct walker_fixture {
  fake_service fake;
  kitten::service svc{fake.make()};
  kitten::uid_resolver resolver{svc.uid_string};

  kitten::supplementary_query query(const fs::path& file = "main.swift") {
    return {
      .request = {.source_file = file, .compiler_args = {"-sdk", "/sdk"}},
      .send = svc.cursor_info};
  }
};

}  // namespace

TEST_CASE("enrich-resolves-nested-uids") {
  walker_fixture f;

  response_map tree{
    {"key.offset", std::int64_t{0}},
    {"key.length", std::int64_t{30}},
    {"key.diagnostic_stage", std::uint64_t{12}},
    {"key.substructure",
     response_list{
       response_map{
         {"key.kind", uids::decl_struct},
         {"key.name", "S"},
         {"key.substructure",
          response_list{response_map{
            {"key.kind", uids::decl_var_instance},
            {"key.name", "v"},
          }}},
       },
     }},
  };

  kitten::enrich(tree, f.resolver);

  CHECK(*tree.at("key.offset").if_int64() == 0);
  // Below the UID range: left as a number
  CHECK(*tree.at("key.diagnostic_stage").if_uint64() == 12);

  auto& outer = (*tree.at("key.substructure").if_list())[0];
  CHECK(*outer.if_map()->at("key.kind").if_string() ==
        "source.lang.swift.decl.struct");
  auto& inner = (*outer.if_map()->at("key.substructure").if_list())[0];
  CHECK(*inner.if_map()->at("key.kind").if_string() ==
        "source.lang.swift.decl.var.instance");

  CHECK(f.fake.cursor_infos.empty());
}

TEST_CASE("enrich-leaves-unnamed-uids") {
  walker_fixture f;
  response_map tree{{"key.kind", uids::unnamed}};

  kitten::enrich(tree, f.resolver);
  CHECK(*tree.at("key.kind").if_uint64() == uids::unnamed);
}

TEST_CASE("enrich-is-idempotent-on-resolved-trees") {
  walker_fixture f;

  response_map tree{
    {"key.kind", uids::decl_function_free},
    {"key.nameoffset", std::int64_t{5}},
    {"key.attributes", response_list{true, 1.5, nullptr}},
    {"key.substructure", response_list{response_map{{"key.kind", uids::decl_struct}}}},
  };
  kitten::enrich(tree, f.resolver);

  auto before = tree;
  auto lookups = f.fake.uid_lookups;
  kitten::enrich(tree, f.resolver);

  CHECK(tree == before);
  CHECK(f.fake.uid_lookups == lookups);
}

TEST_CASE("enrich-declaration-merges-cursor-info-but-not-kind") {
  walker_fixture f;
  f.fake.on_cursor_info = [](const kitten::cursor_info_request&) {
    return response_value{response_map{
      {"key.kind", "something-else"},
      {"key.typename", "Int"},
    }};
  };
  auto q = f.query();

  response_map tree{{"key.substructure",
                     response_list{response_map{
                       {"key.kind", uids::decl_function_free},
                       {"key.nameoffset", std::int64_t{42}},
                     }}}};

  kitten::enrich(tree, f.resolver, &q);

  const auto& node =
      *(*tree.at("key.substructure").if_list())[0].if_map();
  CHECK(*node.at("key.kind").if_string() ==
        "source.lang.swift.decl.function.free");
  CHECK(*node.at("key.typename").if_string() == "Int");
  CHECK(node.keys() ==
        std::vector<std::string>{"key.kind", "key.nameoffset", "key.typename"});

  REQUIRE(f.fake.cursor_infos.size() == 1);
  CHECK(f.fake.cursor_infos[0].offset == 42);
  CHECK(f.fake.cursor_infos[0].source_file == "main.swift");
  CHECK(
      f.fake.cursor_infos[0].compiler_args ==
      std::vector<std::string>{"-sdk", "/sdk"});
  CHECK(q.request.offset == 42);
}

TEST_CASE("enrich-cursor-info-overwrites-other-keys") {
  // Only key.kind is protected from the merge
  walker_fixture f;
  f.fake.on_cursor_info = [](const kitten::cursor_info_request&) {
    return response_value{response_map{
      {"key.name", "f(_:)"},
      {"key.offset", std::int64_t{99}},
    }};
  };
  auto q = f.query();

  response_map tree{
    {"key.kind", uids::decl_function_free},
    {"key.name", "f"},
    {"key.offset", std::int64_t{0}},
    {"key.nameoffset", std::int64_t{5}},
  };
  kitten::enrich(tree, f.resolver, &q);

  CHECK(*tree.at("key.name").if_string() == "f(_:)");
  CHECK(*tree.at("key.offset").if_int64() == 99);
}

TEST_CASE("enrich-declaration-nameoffset-rules") {
  walker_fixture f;
  auto q = f.query();

  SUBCASE("zero offset is queried") {
    response_map tree{
      {"key.kind", uids::decl_struct}, {"key.nameoffset", std::int64_t{0}}};
    kitten::enrich(tree, f.resolver, &q);
    REQUIRE(f.fake.cursor_infos.size() == 1);
    CHECK(f.fake.cursor_infos[0].offset == 0);
  }
  SUBCASE("negative offset is skipped") {
    response_map tree{
      {"key.kind", uids::decl_struct}, {"key.nameoffset", std::int64_t{-1}}};
    kitten::enrich(tree, f.resolver, &q);
    CHECK(f.fake.cursor_infos.empty());
    CHECK(*tree.at("key.kind").if_string() == "source.lang.swift.decl.struct");
  }
  SUBCASE("missing offset is skipped") {
    response_map tree{{"key.kind", uids::decl_struct}};
    kitten::enrich(tree, f.resolver, &q);
    CHECK(f.fake.cursor_infos.empty());
  }
  SUBCASE("no query, no cursor info") {
    response_map tree{
      {"key.kind", uids::decl_struct}, {"key.nameoffset", std::int64_t{3}}};
    kitten::enrich(tree, f.resolver);
    CHECK(f.fake.cursor_infos.empty());
  }
  SUBCASE("only the kind key triggers it") {
    response_map tree{
      {"key.typekind", uids::decl_struct}, {"key.nameoffset", std::int64_t{3}}};
    kitten::enrich(tree, f.resolver, &q);
    CHECK(f.fake.cursor_infos.empty());
    CHECK(*tree.at("key.typekind").if_string() == "source.lang.swift.decl.struct");
  }
}

TEST_CASE("enrich-queries-in-visit-order") {
  walker_fixture f;
  auto q = f.query();

  response_map tree{{"key.substructure",
                     response_list{
                       response_map{
                         {"key.kind", uids::decl_struct},
                         {"key.nameoffset", std::int64_t{7}},
                         {"key.substructure",
                          response_list{response_map{
                            {"key.kind", uids::decl_var_instance},
                            {"key.nameoffset", std::int64_t{20}},
                          }}},
                       },
                       response_map{
                         {"key.kind", uids::decl_function_free},
                         {"key.nameoffset", std::int64_t{40}},
                       },
                     }}};

  kitten::enrich(tree, f.resolver, &q);

  REQUIRE(f.fake.cursor_infos.size() == 3);
  CHECK(f.fake.cursor_infos[0].offset == 7);
  CHECK(f.fake.cursor_infos[1].offset == 20);
  CHECK(f.fake.cursor_infos[2].offset == 40);
}

TEST_CASE("enrich-comment-mark-gets-its-text") {
  walker_fixture f;
  auto q = f.query(fs::path{TEST_FIXTURE_DIR} / "mark.swift");

  // "/// Hello\nfunc f() {}"
  response_map tree{{"key.substructure",
                     response_list{response_map{
                       {"key.kind", uids::comment_mark},
                       {"key.offset", std::int64_t{0}},
                       {"key.length", std::int64_t{10}},
                     }}}};

  kitten::enrich(tree, f.resolver, &q);

  const auto& node = *(*tree.at("key.substructure").if_list())[0].if_map();
  CHECK(*node.at("key.kind").if_string() ==
        "source.lang.swift.syntaxtype.comment.mark");
  CHECK(*node.at("key.name").if_string() == "/// Hello\n");
  CHECK(f.fake.cursor_infos.empty());
}

TEST_CASE("enrich-comment-mark-without-query-is-left-alone") {
  walker_fixture f;
  response_map tree{
    {"key.kind", uids::comment_mark},
    {"key.offset", std::int64_t{0}},
    {"key.length", std::int64_t{10}},
  };
  kitten::enrich(tree, f.resolver);
  CHECK_FALSE(tree.contains("key.name"));
}

TEST_CASE("enrich-comment-mark-read-failures") {
  walker_fixture f;

  SUBCASE("range past the end of the file") {
    auto q = f.query(fs::path{TEST_FIXTURE_DIR} / "mark.swift");
    response_map tree{
      {"key.kind", uids::comment_mark},
      {"key.offset", std::int64_t{5}},
      {"key.length", std::int64_t{1000}},
    };
    CHECK_THROWS_AS(
        kitten::enrich(tree, f.resolver, &q), kitten::source_read_failure);
  }
  SUBCASE("missing file") {
    auto q = f.query(fs::path{TEST_FIXTURE_DIR} / "no-such-file.swift");
    response_map tree{
      {"key.kind", uids::comment_mark},
      {"key.offset", std::int64_t{0}},
      {"key.length", std::int64_t{1}},
    };
    CHECK_THROWS_AS(
        kitten::enrich(tree, f.resolver, &q), kitten::source_read_failure);
  }
  SUBCASE("no length") {
    auto q = f.query(fs::path{TEST_FIXTURE_DIR} / "mark.swift");
    response_map tree{
      {"key.kind", uids::comment_mark}, {"key.offset", std::int64_t{0}}};
    CHECK_THROWS_AS(
        kitten::enrich(tree, f.resolver, &q), kitten::source_read_failure);
  }
}

TEST_CASE("enrich-descends-into-maps-and-nested-lists") {
  walker_fixture f;
  auto q = f.query();

  response_map tree{
    {"key.extra",
     response_map{
       {"key.kind", uids::decl_struct},
       {"key.nameoffset", std::int64_t{11}},
     }},
    {"key.l",
     response_list{response_list{response_map{{"key.kind", uids::keyword}}}}},
  };

  kitten::enrich(tree, f.resolver, &q);

  const auto& extra = *tree.at("key.extra").if_map();
  CHECK(*extra.at("key.kind").if_string() == "source.lang.swift.decl.struct");

  const auto& inner = *(*tree.at("key.l").if_list())[0].if_list();
  CHECK(*inner[0].if_map()->at("key.kind").if_string() ==
        "source.lang.swift.syntaxtype.keyword");

  // The declaration in the directly nested map got its cursorinfo
  REQUIRE(f.fake.cursor_infos.size() == 1);
  CHECK(f.fake.cursor_infos[0].offset == 11);
}
