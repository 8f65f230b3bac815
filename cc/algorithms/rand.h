//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//


#ifndef PRIVACY_RELEASE_ALGORITHMS_RAND_H_
#define PRIVACY_RELEASE_ALGORITHMS_RAND_H_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace privacy_release {

// Where noise comes from. A RandomSource hands out uniformly distributed
// 64-bit words and is a UniformRandomBitGenerator, so absl::Bernoulli and
// friends accept it directly. Implementations are thread-safe.
//
// Callers create the source and pass it to every call that draws noise.
class RandomSource {
 public:
  using result_type = uint64_t;

  virtual ~RandomSource() = default;

  static constexpr result_type min() { return 0; }
  static constexpr result_type max() {
    return std::numeric_limits<result_type>::max();
  }

  virtual result_type operator()() = 0;
};

// Draws from OpenSSL's CSPRNG. Words are fetched a few thousand at a time.
class SecureRandomSource : public RandomSource {
 public:
  SecureRandomSource();
  SecureRandomSource(const SecureRandomSource&) = delete;
  SecureRandomSource& operator=(const SecureRandomSource&) = delete;

  result_type operator()() override ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  void Refill() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  absl::Mutex mutex_;
  std::vector<result_type> words_ ABSL_GUARDED_BY(mutex_);
  size_t next_ ABSL_GUARDED_BY(mutex_);
};

// Reproducible source for tests. Anyone who knows the seed can subtract the
// noise again, so it must never be used to release data.
class SeededRandomSource : public RandomSource {
 public:
  explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}
  SeededRandomSource(const SeededRandomSource&) = delete;
  SeededRandomSource& operator=(const SeededRandomSource&) = delete;

  result_type operator()() override ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  absl::Mutex mutex_;
  std::mt19937_64 engine_ ABSL_GUARDED_BY(mutex_);
};

// Returns a double in [0, 1), distributed as a uniform real number rounded
// down to the next double. Every double in the range can occur, including the
// tiny ones a fixed-point construction would never produce.
double UniformDouble(RandomSource& random);

}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_ALGORITHMS_RAND_H_
