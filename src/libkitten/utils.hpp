#pragma once

#include <cxxabi.h>
#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace xpto::kitten::utils {

template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// Readable name of an exception's dynamic type, for error reports
inline std::string demangle_symbol(std::string_view mangled) {
  int status = 0;
  std::string result{mangled};
  char* demangled =
      abi::__cxa_demangle(result.c_str(), nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    result = demangled;
    std::free(demangled);  // NOLINT
  }
  return result;
}

// Runs a lambda when leaving scope.  See KITTEN_AUTO below.
template <typename Lam>
class at_scope_exit {
  Lam m_lam;

 public:
  at_scope_exit(const at_scope_exit&) = delete;
  at_scope_exit(at_scope_exit&&) = delete;
  at_scope_exit& operator=(const at_scope_exit&) = delete;
  at_scope_exit& operator=(at_scope_exit&&) = delete;
  explicit at_scope_exit(Lam action) : m_lam(static_cast<Lam&&>(action)) {}
  ~at_scope_exit() { m_lam(); }
};

}  // namespace xpto::kitten::utils

// NOLINTBEGIN(*macro-usage*)
#define KITTEN_TOKEN_PASTEx(x, y) x##y
#define KITTEN_TOKEN_PASTE(x, y) KITTEN_TOKEN_PASTEx(x, y)

#define KITTEN_AUTO_INTERNAL(lname, aname, ...) \
  auto lname = [&]() { __VA_ARGS__; };          \
  xpto::kitten::utils::at_scope_exit aname(lname)

#define KITTEN_AUTO_INTERNAL2(ctr, ...)                     \
  KITTEN_AUTO_INTERNAL(                                     \
      KITTEN_TOKEN_PASTE(kitten_auto_func, ctr),            \
      KITTEN_TOKEN_PASTE(kitten_auto_instance, ctr), __VA_ARGS__)

// KITTEN_AUTO(sourcekitd_response_dispose(resp));
#define KITTEN_AUTO(...) KITTEN_AUTO_INTERNAL2(__COUNTER__, __VA_ARGS__)
// NOLINTEND(*macro-usage*)
