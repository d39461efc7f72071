#include "internal/generator/short_id_generator.hpp"

#include <cassert>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using shortener::generator::RandomShortIdGenerator;

bool IsAlphanumeric(const std::string& id) {
  for (char c : id) {
    if (std::strchr(RandomShortIdGenerator::kAlphabet, c) == nullptr || c == '\0') return false;
  }
  return true;
}

void TestDefaultLengthIsEight() {
  RandomShortIdGenerator generator;
  const auto             id = generator.Generate();
  assert(generator.Length() == 8);
  assert(id.size() == 8);
  assert(IsAlphanumeric(id));
}

void TestCustomLength() {
  RandomShortIdGenerator generator(16);
  for (int i = 0; i < 100; ++i) {
    const auto id = generator.Generate();
    assert(id.size() == 16);
    assert(IsAlphanumeric(id));
  }
}

void TestAlphabetHasSixtyTwoSymbols() {
  assert(std::strlen(RandomShortIdGenerator::kAlphabet) == 62);
}

void TestZeroLengthIsRejected() {
  bool threw = false;
  try {
    RandomShortIdGenerator generator(0);
  } catch (const shortener::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestIdsAreNotRepeatedAcrossCalls() {
  RandomShortIdGenerator generator;
  std::set<std::string>  seen;
  for (int i = 0; i < 1000; ++i) seen.insert(generator.Generate());
  // 62^8 ids: a repeat in 1000 draws means the engine is not advancing
  assert(seen.size() == 1000);
}

void TestConcurrentGenerateIsSafe() {
  RandomShortIdGenerator   generator;
  std::mutex               mutex;
  std::vector<std::string> ids;

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 200; ++i) {
        auto id = generator.Generate();
        assert(id.size() == 8);
        std::lock_guard lock(mutex);
        ids.push_back(std::move(id));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  const std::set<std::string> unique(ids.begin(), ids.end());
  assert(ids.size() == 1600);
  assert(unique.size() == ids.size());
}

} // namespace

int main() {
  TestDefaultLengthIsEight();
  TestCustomLength();
  TestAlphabetHasSixtyTwoSymbols();
  TestZeroLengthIsRejected();
  TestIdsAreNotRepeatedAcrossCalls();
  TestConcurrentGenerateIsSafe();

  std::cout << "short_id_generator_test: pass\n";
  return 0;
}
