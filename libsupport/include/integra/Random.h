#ifndef INTEGRA_LIBSUPPORT_INTEGRA_RANDOM_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_RANDOM_H_

#include <cstdint>
#include <random>
#include <string>
#include <type_traits>
#include <vector>

#include "integra/config.h"

/// Non-cryptographic randomness for upload ids of the in-memory store, test
/// payloads and injected delays.
///
/// \file Random.h

namespace integra {

using RandGenerator = std::mt19937;

/// GetGenerator is the calling thread's generator, seeded on first use.
INTEGRA_EXPORT RandGenerator& GetGenerator();

/// A string of len characters from [0-9A-Za-z]; gen defaults to GetGenerator.
INTEGRA_EXPORT std::string RandomAlphanumericString(
    uint64_t len, RandGenerator* gen = nullptr);

/// len random bytes; gen defaults to GetGenerator.
INTEGRA_EXPORT std::vector<uint8_t> RandomBytes(
    uint64_t len, RandGenerator* gen = nullptr);

/// A uniformly distributed integer in [min_val, max_val].
template <typename T>
T
RandomInRange(T min_val, T max_val) {
  static_assert(std::is_integral_v<T>, "RandomInRange requires an integer");
  std::uniform_int_distribution<T> distribution(min_val, max_val);
  return distribution(GetGenerator());
}

}  // namespace integra

#endif
