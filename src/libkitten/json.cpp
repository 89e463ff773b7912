#include "kitten/json.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string_view>
#include <type_traits>
#include <variant>

#include "kitten/errors.hpp"
#include "utils.hpp"

namespace xpto::kitten {

namespace {

json::value to_json_at(const response_value& v, std::string& where) {
  return std::visit(
      [&](const auto& w) -> json::value {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return nullptr;
        } else if constexpr (
            std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t> ||
            std::is_same_v<T, std::uint64_t>) {
          return w;
        } else if constexpr (std::is_same_v<T, double>) {
          if (!std::isfinite(w))
            utils::throwf<serialization_error>(
                "non-finite number {} at '{}'", w,
                where.empty() ? "<root>" : where);
          return w;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return json::string{w};
        } else if constexpr (std::is_same_v<T, response_bytes>) {
          utils::throwf<serialization_error>(
              "undecoded {}-byte blob at '{}'", w.size(),
              where.empty() ? "<root>" : where);
        } else if constexpr (std::is_same_v<T, response_list>) {
          json::array arr;
          arr.reserve(w.size());
          auto mark = where.size();
          for (std::size_t i = 0; i < w.size(); ++i) {
            where += fmt::format("[{}]", i);
            arr.push_back(to_json_at(w[i], where));
            where.resize(mark);
          }
          return arr;
        } else {
          static_assert(std::is_same_v<T, response_map>);
          json::object obj;
          obj.reserve(w.size());
          auto mark = where.size();
          for (const auto& [k, e] : w) {
            if (!where.empty()) where += '/';
            where += k;
            obj[k] = to_json_at(e, where);
            where.resize(mark);
          }
          return obj;
        }
      },
      v.storage);
}

void indent(std::string& out, int depth) { out.append(2 * depth, ' '); }

void pretty_print_to(std::string& out, const json::value& jv, int depth) {
  switch (jv.kind()) {
    case json::kind::object: {
      const auto& obj = jv.get_object();
      if (obj.empty()) {
        out += "{}";
        return;
      }
      out += "{\n";
      bool first = true;
      for (const auto& kv : obj) {
        if (!first) out += ",\n";
        first = false;
        indent(out, depth + 1);
        out += json::serialize(json::string{kv.key()});
        out += " : ";
        pretty_print_to(out, kv.value(), depth + 1);
      }
      out += '\n';
      indent(out, depth);
      out += '}';
      return;
    }
    case json::kind::array: {
      const auto& arr = jv.get_array();
      if (arr.empty()) {
        out += "[]";
        return;
      }
      out += "[\n";
      bool first = true;
      for (const auto& e : arr) {
        if (!first) out += ",\n";
        first = false;
        indent(out, depth + 1);
        pretty_print_to(out, e, depth + 1);
      }
      out += '\n';
      indent(out, depth);
      out += ']';
      return;
    }
    case json::kind::double_:
      // Shortest form that reads back to the same double, e.g. 0.25
      out += fmt::format("{}", jv.get_double());
      return;
    default:
      out += json::serialize(jv);
  }
}

}  // namespace

json::value to_json(const response_value& v) {
  std::string where;
  return to_json_at(v, where);
}

std::string pretty_print(const json::value& jv) {
  std::string out;
  pretty_print_to(out, jv, 0);
  return out;
}

std::string serialize(const response_value& v) {
  return pretty_print(to_json(v));
}

}  // namespace xpto::kitten
