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


#include "algorithms/rand.h"

#include <cmath>
#include <cstddef>
#include <cstdint>

#include "absl/base/const_init.h"
#include "absl/numeric/bits.h"
#include "absl/synchronization/mutex.h"
#include "openssl/rand.h"
#include "base/logging.h"

namespace privacy_release {
namespace {

constexpr size_t kWordsPerRefill = 4096;
constexpr int kFractionBits = 52;
// Below this the result would be subnormal; returning zero there changes the
// distribution by less than 2^-1000.
constexpr int kMinExponent = -1022;

// Older OpenSSL releases do not make RAND_bytes thread-safe.
ABSL_CONST_INIT absl::Mutex openssl_mutex(absl::kConstInit);

}  // namespace

double UniformDouble(RandomSource& random) {
  // Each leading zero bit of a uniform bit stream halves the binade: the
  // result lies in [1/2, 1) with probability 1/2, in [1/4, 1/2) with
  // probability 1/4, and so on.
  int exponent = -1;
  uint64_t bits = random();
  while (bits == 0) {
    exponent -= 64;
    if (exponent < kMinExponent) return 0.0;
    bits = random();
  }
  exponent -= absl::countl_zero(bits);
  if (exponent < kMinExponent) return 0.0;

  const uint64_t fraction = random() >> (64 - kFractionBits);
  const double significand =
      1.0 + std::ldexp(static_cast<double>(fraction), -kFractionBits);
  return std::ldexp(significand, exponent);
}

SecureRandomSource::SecureRandomSource()
    : words_(kWordsPerRefill), next_(kWordsPerRefill) {}

SecureRandomSource::result_type SecureRandomSource::operator()() {
  absl::MutexLock lock(&mutex_);
  if (next_ == words_.size()) Refill();
  return words_[next_++];
}

void SecureRandomSource::Refill() {
  int rc;
  {
    absl::MutexLock lock(&openssl_mutex);
    rc = RAND_bytes(reinterpret_cast<unsigned char*>(words_.data()),
                    static_cast<int>(words_.size() * sizeof(result_type)));
  }
  CHECK_EQ(rc, 1) << "RAND_bytes failed to produce random bytes";
  next_ = 0;
}

SeededRandomSource::result_type SeededRandomSource::operator()() {
  absl::MutexLock lock(&mutex_);
  return engine_();
}

}  // namespace privacy_release
