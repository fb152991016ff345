#include "uuidforge/uuid/time_based.hpp"

#include "uuidforge/core/constants.hpp"
#include "uuidforge/util/log.hpp"
#include "uuidforge/util/time.hpp"

#include <utility>

namespace uuidforge {

auto construct_v7(std::int64_t unix_ms, const BitSequence &random)
    -> Result<Uuid> {
  if (unix_ms < 0 ||
      static_cast<std::uint64_t>(unix_ms) > layout::kMaxTimestampMs) {
    return fail(Error::ClockOutOfRange);
  }
  if (random.size() < layout::kV7RandomBits) {
    return fail(Error::InvalidArgument);
  }

  const auto ts = static_cast<std::uint64_t>(unix_ms);
  const auto rand_a = bits_to_uint(random, 0, layout::kRandABits);
  const auto rand_b =
      bits_to_uint(random, layout::kRandABits, layout::kRandBBits);

  const std::uint64_t hi = (ts << 16) |
                           (std::uint64_t{layout::kVersionV7} << 12) | rand_a;
  const std::uint64_t lo =
      (std::uint64_t{layout::kVariantRfc} << 62) | rand_b;

  Uuid::Bytes out{};
  for (std::size_t i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
    out[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
  }
  return ok(Uuid{out});
}

V7Generator::V7Generator(EntropySource &source)
    : V7Generator(source, &util::now_unix_millis) {}

V7Generator::V7Generator(EntropySource &source, Clock clock)
    : source_(source), clock_(std::move(clock)) {}

auto V7Generator::generate() const -> Result<Uuid> {
  const auto now_ms = clock_();
  if (now_ms < 0 ||
      static_cast<std::uint64_t>(now_ms) > layout::kMaxTimestampMs) {
    log::error("Clock reading {} ms does not fit the 48-bit v7 timestamp",
               now_ms);
    return fail(Error::ClockOutOfRange);
  }

  auto bits = source_.random_bits(layout::kV7RandomBits);
  if (!bits) {
    return fail(bits.error());
  }
  if (bits->size() != layout::kV7RandomBits) {
    log::error("Entropy source '{}' returned {} bits, expected {}",
               source_.name(), bits->size(), layout::kV7RandomBits);
    return fail(Error::EntropyUnavailable);
  }
  return construct_v7(now_ms, *bits);
}

auto V7Generator::generate_batch(std::int64_t count) const
    -> Result<std::vector<Uuid>> {
  if (count <= 0) {
    return fail(Error::InvalidArgument);
  }
  std::vector<Uuid> out;
  out.reserve(static_cast<std::size_t>(count));
  for (std::int64_t i = 0; i < count; ++i) {
    auto id = generate();
    if (!id) {
      log::warn("v7 batch aborted at {}/{}: {}", i, count,
                id.error().message());
      return fail(id.error());
    }
    out.push_back(*id);
  }
  return ok(std::move(out));
}

} // namespace uuidforge
