#include "uuidforge/entropy/system_entropy.hpp"

#include "uuidforge/util/log.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <sys/random.h>

#include <array>
#include <cerrno>
#include <climits>
#include <vector>

namespace uuidforge {

LocalEntropySource::LocalEntropySource(std::size_t max_request_bits)
    : max_request_bits_(max_request_bits) {}

auto LocalEntropySource::start() -> Result<void> {
  if (running_.load(std::memory_order_acquire)) {
    return ok();
  }
  if (auto r = probe(); !r) {
    log::error("Entropy source '{}' failed to start: {}", name(),
               r.error().message());
    return fail(Error::EntropyUnavailable);
  }
  running_.store(true, std::memory_order_release);
  log::info("Entropy source '{}' started (max {} bits per request)", name(),
            max_request_bits_);
  return ok();
}

auto LocalEntropySource::stop() noexcept -> void {
  running_.store(false, std::memory_order_release);
}

auto LocalEntropySource::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto LocalEntropySource::random_bits(std::size_t count)
    -> Result<BitSequence> {
  if (count == 0 || count > max_request_bits_) {
    return fail(Error::InvalidArgument);
  }
  if (!running_.load(std::memory_order_acquire)) {
    return fail(Error::EntropyUnavailable);
  }

  // Each request gets its own buffer; nothing is cached between calls.
  std::vector<std::uint8_t> buf((count + CHAR_BIT - 1) / CHAR_BIT);
  if (auto r = fill(buf); !r) {
    log::error("Entropy source '{}' failed to supply {} bits: {}", name(),
               count, r.error().message());
    return fail(Error::EntropyUnavailable);
  }
  auto bits = bits_from_bytes(buf.data(), count);
  OPENSSL_cleanse(buf.data(), buf.size());
  return ok(std::move(bits));
}

auto OpenSslEntropySource::probe() -> Result<void> {
  if (RAND_status() != 1) {
    return fail(Error::EntropyUnavailable);
  }
  return ok();
}

auto OpenSslEntropySource::fill(std::span<std::uint8_t> out) -> Result<void> {
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    std::array<char, 256> err{};
    ERR_error_string_n(ERR_get_error(), err.data(), err.size());
    log::warn("RAND_bytes failed: {}", err.data());
    return fail(Error::EntropyUnavailable);
  }
  return ok();
}

auto GetrandomEntropySource::probe() -> Result<void> {
  // GRND_NONBLOCK fails with EAGAIN until the kernel pool is initialised.
  std::uint8_t byte = 0;
  for (;;) {
    const auto n = ::getrandom(&byte, 1, GRND_NONBLOCK);
    if (n == 1) {
      return ok();
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0) {
      return fail(std::error_code(errno, std::system_category()));
    }
    return fail(Error::EntropyUnavailable);
  }
}

auto GetrandomEntropySource::fill(std::span<std::uint8_t> out)
    -> Result<void> {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const auto n = ::getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(std::error_code(errno, std::system_category()));
    }
    filled += static_cast<std::size_t>(n);
  }
  return ok();
}

auto make_entropy_source(const EntropyConfig &cfg)
    -> std::unique_ptr<EntropySource> {
  switch (cfg.source) {
  case EntropySourceKind::Getrandom:
    return std::make_unique<GetrandomEntropySource>(cfg.max_request_bits);
  case EntropySourceKind::Openssl:
    return std::make_unique<OpenSslEntropySource>(cfg.max_request_bits);
  }
  std::unreachable();
}

} // namespace uuidforge
