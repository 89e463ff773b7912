#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace xpto::kitten {

// UIDs handed out by sourcekitd are always above this value.  Anything lower
// is a plain integer and must never be passed to the service's lookup.
inline constexpr std::uint64_t min_uid_value{4'300'000'000};

/** @brief Memoizing UID-to-name cache.
 *
 * Construct one per process (or per test) and pass it by reference to
 * whatever needs names.  Entries are never evicted.  Not thread-safe.
 */
class uid_resolver {
 public:
  // Returns the service-owned name for a UID, or nullptr
  using lookup_fn = std::function<const char*(std::uint64_t)>;

  explicit uid_resolver(lookup_fn lookup) : lookup_{std::move(lookup)} {}

  uid_resolver(const uid_resolver&) = delete;
  uid_resolver& operator=(const uid_resolver&) = delete;
  uid_resolver(uid_resolver&&) = default;
  uid_resolver& operator=(uid_resolver&&) = default;
  ~uid_resolver() = default;

  /** @brief Name of @p uid, or nullopt when it has none.
   *
   * The returned view stays valid for the lifetime of the resolver.
   */
  std::optional<std::string_view> resolve(std::uint64_t uid);

  std::size_t size() const { return cache_.size(); }

 private:
  lookup_fn lookup_;
  std::unordered_map<std::uint64_t, std::string> cache_;
};

}  // namespace xpto::kitten
