#pragma once

#include <string>

namespace shortener::model {

struct ShortenResult {
  std::string short_url;

  // false when a live short id already existed for the url (any owner)
  bool is_new = false;
};

// Externally visible projection of a live record owned by a user.
// Backends fill short_url with the bare short id; the service rewrites it
// to base_url + "/" + id before handing it out.
struct UserUrl {
  std::string short_url;
  std::string original_url;
};

struct BatchShortenRequest {
  std::string correlation_id;
  std::string original_url;
};

struct BatchShortenResult {
  std::string correlation_id;
  std::string short_url;
};

} // namespace shortener::model
