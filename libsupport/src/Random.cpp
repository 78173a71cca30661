#include "integra/Random.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <string_view>

#include "integra/Logging.h"

namespace {

constexpr std::string_view kAlphanumeric =
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

/// Seeds for per thread generators come from one process generator so that
/// threads started together do not share a sequence.
integra::RandGenerator
MakeProcessGenerator() {
  try {
    std::random_device device;
    std::array<std::seed_seq::result_type, integra::RandGenerator::state_size>
        seed;
    std::generate(seed.begin(), seed.end(), std::ref(device));
    std::seed_seq seq(seed.begin(), seed.end());
    return integra::RandGenerator(seq);
  } catch (const std::exception& e) {
    INTEGRA_LOG_WARN("seeding from the clock: {}", e.what());
  }
  auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  return integra::RandGenerator(
      static_cast<integra::RandGenerator::result_type>(ticks));
}

integra::RandGenerator
MakeThreadGenerator() {
  static std::mutex lock;
  static integra::RandGenerator process_gen = MakeProcessGenerator();

  std::array<std::seed_seq::result_type, 8> seed;
  {
    std::lock_guard<std::mutex> guard(lock);
    std::generate(seed.begin(), seed.end(), std::ref(process_gen));
  }
  std::seed_seq seq(seed.begin(), seed.end());
  return integra::RandGenerator(seq);
}

}  // namespace

integra::RandGenerator&
integra::GetGenerator() {
  thread_local RandGenerator gen = MakeThreadGenerator();
  return gen;
}

std::string
integra::RandomAlphanumericString(uint64_t len, RandGenerator* gen) {
  RandGenerator& g = gen == nullptr ? GetGenerator() : *gen;
  std::uniform_int_distribution<size_t> pick(0, kAlphanumeric.size() - 1);
  std::string result(len, '\0');
  for (char& c : result) {
    c = kAlphanumeric[pick(g)];
  }
  return result;
}

std::vector<uint8_t>
integra::RandomBytes(uint64_t len, RandGenerator* gen) {
  RandGenerator& g = gen == nullptr ? GetGenerator() : *gen;
  std::uniform_int_distribution<int> byte(0, 255);
  std::vector<uint8_t> result(len);
  for (uint8_t& b : result) {
    b = static_cast<uint8_t>(byte(g));
  }
  return result;
}
