#include "kitten/uid.hpp"

#include "logger.hpp"

namespace xpto::kitten {

std::optional<std::string_view> uid_resolver::resolve(std::uint64_t uid) {
  if (uid < min_uid_value) return std::nullopt;

  if (auto it = cache_.find(uid); it != cache_.end()) return it->second;

  const char* name = lookup_ ? lookup_(uid) : nullptr;
  if (!name) {
    LOG_TRACE("uid {} has no name", uid);
    return std::nullopt;
  }
  auto [it, inserted] = cache_.emplace(uid, name);
  LOG_TRACE("uid {} -> '{}'", uid, it->second);
  return it->second;
}

}  // namespace xpto::kitten
