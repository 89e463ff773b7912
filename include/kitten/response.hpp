#pragma once

/**
 * @file response.hpp
 * @brief In-memory shape of a sourcekitd reply.
 *
 * A @c response_value is a tagged union over everything the service can
 * send back: null, booleans, signed and unsigned 64-bit integers, doubles,
 * strings, opaque byte blobs, ordered lists and ordered maps.  Unsigned
 * integers are UID handles that have not been resolved to names yet.
 */

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace xpto::kitten {

struct response_value;

using response_bytes = std::vector<std::uint8_t>;
using response_list = std::vector<response_value>;

/** @brief Insertion-ordered string-keyed map with unique keys.
 *
 * Assigning to an existing key keeps its position, new keys are appended.
 */
class response_map {
 public:
  using entry = std::pair<std::string, response_value>;
  using container_t = std::vector<entry>;
  using iterator = container_t::iterator;
  using const_iterator = container_t::const_iterator;

  response_map() = default;
  response_map(std::initializer_list<entry> init);

  response_value* find(std::string_view key);
  const response_value* find(std::string_view key) const;
  bool contains(std::string_view key) const { return find(key) != nullptr; }

  response_value& at(std::string_view key);
  const response_value& at(std::string_view key) const;

  // Inserts a null value when the key is missing.
  response_value& operator[](std::string_view key);

  void insert_or_assign(std::string_view key, response_value value);
  bool erase(std::string_view key);

  std::vector<std::string> keys() const;

  std::size_t size() const;
  bool empty() const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;

  friend bool operator==(const response_map&, const response_map&);

 private:
  container_t entries_;
};

struct response_value {
  using storage_t = std::variant<
      std::nullptr_t, bool, std::int64_t, std::uint64_t, double, std::string,
      response_bytes, response_list, response_map>;

  storage_t storage{nullptr};

  response_value() = default;

  template <typename T>
    requires(
        !std::same_as<std::remove_cvref_t<T>, response_value> &&
        std::constructible_from<storage_t, T &&>)
  response_value(T&& v)  // NOLINT(google-explicit-constructor)
      : storage(std::forward<T>(v)) {}

  bool is_null() const {
    return std::holds_alternative<std::nullptr_t>(storage);
  }

  bool* if_bool() { return std::get_if<bool>(&storage); }
  std::int64_t* if_int64() { return std::get_if<std::int64_t>(&storage); }
  std::uint64_t* if_uint64() { return std::get_if<std::uint64_t>(&storage); }
  double* if_double() { return std::get_if<double>(&storage); }
  std::string* if_string() { return std::get_if<std::string>(&storage); }
  response_bytes* if_bytes() { return std::get_if<response_bytes>(&storage); }
  response_list* if_list() { return std::get_if<response_list>(&storage); }
  response_map* if_map() { return std::get_if<response_map>(&storage); }

  const bool* if_bool() const { return std::get_if<bool>(&storage); }
  const std::int64_t* if_int64() const {
    return std::get_if<std::int64_t>(&storage);
  }
  const std::uint64_t* if_uint64() const {
    return std::get_if<std::uint64_t>(&storage);
  }
  const double* if_double() const { return std::get_if<double>(&storage); }
  const std::string* if_string() const {
    return std::get_if<std::string>(&storage);
  }
  const response_bytes* if_bytes() const {
    return std::get_if<response_bytes>(&storage);
  }
  const response_list* if_list() const {
    return std::get_if<response_list>(&storage);
  }
  const response_map* if_map() const {
    return std::get_if<response_map>(&storage);
  }

  friend bool operator==(const response_value& a, const response_value& b) {
    return a.storage == b.storage;
  }
};

inline std::size_t response_map::size() const { return entries_.size(); }
inline bool response_map::empty() const { return entries_.empty(); }
inline response_map::iterator response_map::begin() { return entries_.begin(); }
inline response_map::iterator response_map::end() { return entries_.end(); }
inline response_map::const_iterator response_map::begin() const {
  return entries_.begin();
}
inline response_map::const_iterator response_map::end() const {
  return entries_.end();
}

// Name of the active alternative, for diagnostics
std::string_view kind_name(const response_value& v);

}  // namespace xpto::kitten
