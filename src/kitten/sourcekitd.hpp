#pragma once

#include <cstdint>
#include <string_view>

#include "kitten/response.hpp"
#include "kitten/service.hpp"

namespace xpto::kitten {

/** @brief Owner of an in-process sourcekitd session.
 *
 * Initializes the service on construction and shuts it down on
 * destruction; at most one should exist at a time.  Replies are converted
 * to @c response_value trees: UIDs become unsigned integers holding the
 * UID handle, data blobs become byte vectors.
 */
class sourcekitd {
 public:
  sourcekitd();
  sourcekitd(const sourcekitd&) = delete;
  sourcekitd(sourcekitd&&) = delete;
  sourcekitd& operator=(const sourcekitd&) = delete;
  sourcekitd& operator=(sourcekitd&&) = delete;
  ~sourcekitd();

  const char* uid_string(std::uint64_t uid);
  response_value editor_open(const open_request& req);
  response_value cursor_info(const cursor_info_request& req);
};

service make_service(sourcekitd& skd);

}  // namespace xpto::kitten
