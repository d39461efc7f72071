#include "short_id_generator.hpp"

#include "internal/util/errors.hpp"

namespace shortener::generator {

RandomShortIdGenerator::RandomShortIdGenerator(std::size_t length)
    : length_(length), rng_(std::random_device{}()), pick_(0, sizeof(kAlphabet) - 2) {
  if (length_ == 0) {
    throw util::InvalidArgument("short id length must be greater than zero");
  }
}

std::string RandomShortIdGenerator::Generate() {
  std::string id(length_, '\0');

  std::lock_guard lock(mutex_);
  for (auto& c : id) {
    c = kAlphabet[pick_(rng_)];
  }
  return id;
}

} // namespace shortener::generator
