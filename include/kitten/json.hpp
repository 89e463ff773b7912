#pragma once

#include <boost/json.hpp>
#include <string>

#include "kitten/response.hpp"

namespace xpto::kitten {

namespace json = boost::json;

// Throws serialization_error on a byte blob, naming where it was found.
json::value to_json(const response_value& v);

// Two-space indented, `"key" : value` members, no trailing newline.
std::string pretty_print(const json::value& jv);

std::string serialize(const response_value& v);

}  // namespace xpto::kitten
