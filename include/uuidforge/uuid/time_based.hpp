#pragma once

#include "uuidforge/core/error.hpp"
#include "uuidforge/entropy/entropy_source.hpp"
#include "uuidforge/uuid/uuid.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace uuidforge {

// Packs a v7 layout (RFC 9562 section 5.7), most significant first:
//   unix_ts_ms:48 | ver=0111 | rand_a:12 | var=10 | rand_b:62
// rand_a is bits[0..12) and rand_b is bits[12..74) of `random`.
// Error::InvalidArgument if `random` holds fewer than 74 bits,
// Error::ClockOutOfRange if unix_ms is negative or wider than 48 bits.
[[nodiscard]] auto construct_v7(std::int64_t unix_ms, const BitSequence &random)
    -> Result<Uuid>;

// Time-ordered UUID generator. Each identifier reads the clock once and draws
// 74 fresh bits from the entropy source; nothing is cached between calls.
// The generator holds no mutable state of its own, so one instance may be
// shared between threads as long as the source supports concurrent draws.
class V7Generator {
public:
  // Returns Unix milliseconds.
  using Clock = std::function<std::int64_t()>;

  explicit V7Generator(EntropySource &source);
  V7Generator(EntropySource &source, Clock clock);

  [[nodiscard]] auto generate() const -> Result<Uuid>;

  // Fails fast: the first failed draw fails the whole batch. count <= 0 is
  // Error::InvalidArgument.
  [[nodiscard]] auto generate_batch(std::int64_t count) const
      -> Result<std::vector<Uuid>>;

private:
  EntropySource &source_;
  Clock clock_;
};

} // namespace uuidforge
