#include "kitten/response.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils.hpp"

namespace xpto::kitten {

response_map::response_map(std::initializer_list<entry> init) {
  for (const auto& [k, v] : init) insert_or_assign(k, v);
}

response_value* response_map::find(std::string_view key) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](auto& e) {
    return e.first == key;
  });
  return it == entries_.end() ? nullptr : &it->second;
}

const response_value* response_map::find(std::string_view key) const {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](auto& e) {
    return e.first == key;
  });
  return it == entries_.end() ? nullptr : &it->second;
}

response_value& response_map::at(std::string_view key) {
  if (auto* v = find(key)) return *v;
  utils::throwf<std::out_of_range>("no key '{}' in response map", key);
}

const response_value& response_map::at(std::string_view key) const {
  if (const auto* v = find(key)) return *v;
  utils::throwf<std::out_of_range>("no key '{}' in response map", key);
}

response_value& response_map::operator[](std::string_view key) {
  if (auto* v = find(key)) return *v;
  return entries_.emplace_back(std::string{key}, response_value{}).second;
}

void response_map::insert_or_assign(
    std::string_view key, response_value value) {
  (*this)[key] = std::move(value);
}

bool response_map::erase(std::string_view key) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](auto& e) {
    return e.first == key;
  });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

std::vector<std::string> response_map::keys() const {
  std::vector<std::string> res;
  res.reserve(entries_.size());
  for (const auto& e : entries_) res.push_back(e.first);
  return res;
}

bool operator==(const response_map& a, const response_map& b) {
  return a.entries_ == b.entries_;
}

std::string_view kind_name(const response_value& v) {
  return std::visit(
      [](const auto& w) -> std::string_view {
        using T = std::decay_t<decltype(w)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return "bool";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return "int64";
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
          return "uint64";
        } else if constexpr (std::is_same_v<T, double>) {
          return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "string";
        } else if constexpr (std::is_same_v<T, response_bytes>) {
          return "bytes";
        } else if constexpr (std::is_same_v<T, response_list>) {
          return "list";
        } else {
          static_assert(std::is_same_v<T, response_map>);
          return "map";
        }
      },
      v.storage);
}

}  // namespace xpto::kitten
