#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace xpto::kitten {

namespace fs = std::filesystem;

// A token kind UID that the service could not name.
struct unresolvable_identifier : std::runtime_error {
  unresolvable_identifier(const std::string& desc, std::uint64_t u)
      : std::runtime_error{desc}, uid{u} {}
  std::uint64_t uid;
};

// A binary payload too short for what its header declares.
struct malformed_payload : std::runtime_error {
  malformed_payload(
      const std::string& desc, std::size_t declared_bytes,
      std::size_t available_bytes)
      : std::runtime_error{desc},
        declared{declared_bytes},
        available{available_bytes} {}
  std::size_t declared;
  std::size_t available;
};

struct source_read_failure : std::runtime_error {
  source_read_failure(const std::string& desc, fs::path p)
      : std::runtime_error{desc}, file{std::move(p)} {}
  fs::path file;
};

// A value the JSON serializer has no rendering for.  Always a bug upstream.
struct serialization_error : std::logic_error {
  using std::logic_error::logic_error;
};

struct service_error : std::runtime_error {
  service_error(const std::string& desc, std::string kind)
      : std::runtime_error{desc}, request_kind{std::move(kind)} {}
  std::string request_kind;
};

}  // namespace xpto::kitten
