#pragma once

#include <cstddef>
#include <mutex>
#include <random>
#include <string>

namespace shortener::generator {

/*
  Produces short ids. No uniqueness guarantee: collisions surface as
  AlreadyExists from the repository.
*/
class ShortIdGenerator {
 public:
  virtual ~ShortIdGenerator() = default;

  virtual std::string Generate() = 0;
};

/*
  Fixed-length ids drawn uniformly from [a-zA-Z0-9].

  The engine is seeded once at construction and guarded by a mutex, so a
  single instance can be shared by all request threads.
*/
class RandomShortIdGenerator final : public ShortIdGenerator {
 public:
  static constexpr std::size_t kDefaultLength = 8;
  static constexpr const char  kAlphabet[]    = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

  explicit RandomShortIdGenerator(std::size_t length = kDefaultLength);

  std::string Generate() override;

  std::size_t Length() const {
    return length_;
  }

 private:
  std::size_t     length_;
  std::mutex      mutex_;
  std::mt19937_64 rng_;

  std::uniform_int_distribution<std::size_t> pick_;
};

} // namespace shortener::generator
