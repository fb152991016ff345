#pragma once

#include "uuidforge/config/system_config.hpp"
#include "uuidforge/core/error.hpp"
#include "uuidforge/entropy/entropy_source.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace uuidforge {

// Shared lifecycle and request validation for sources backed by a local
// CSPRNG. Subclasses only fill byte buffers.
class LocalEntropySource : public EntropySource {
public:
  explicit LocalEntropySource(std::size_t max_request_bits);

  [[nodiscard]] auto start() -> Result<void> override;
  auto stop() noexcept -> void override;
  [[nodiscard]] auto is_running() const noexcept -> bool override;
  [[nodiscard]] auto random_bits(std::size_t count)
      -> Result<BitSequence> override;

  [[nodiscard]] auto max_request_bits() const noexcept -> std::size_t {
    return max_request_bits_;
  }

protected:
  [[nodiscard]] virtual auto probe() -> Result<void> = 0;
  [[nodiscard]] virtual auto fill(std::span<std::uint8_t> out)
      -> Result<void> = 0;

private:
  std::size_t max_request_bits_;
  std::atomic<bool> running_{false};
};

// OpenSSL's DRBG (RAND_bytes); thread-safe since OpenSSL 1.1.
class OpenSslEntropySource final : public LocalEntropySource {
public:
  using LocalEntropySource::LocalEntropySource;
  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "openssl";
  }

protected:
  [[nodiscard]] auto probe() -> Result<void> override;
  [[nodiscard]] auto fill(std::span<std::uint8_t> out)
      -> Result<void> override;
};

// Linux getrandom(2) on the kernel urandom pool.
class GetrandomEntropySource final : public LocalEntropySource {
public:
  using LocalEntropySource::LocalEntropySource;
  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "getrandom";
  }

protected:
  [[nodiscard]] auto probe() -> Result<void> override;
  [[nodiscard]] auto fill(std::span<std::uint8_t> out)
      -> Result<void> override;
};

// Builds the source named by cfg.source. The source is returned stopped.
[[nodiscard]] auto make_entropy_source(const EntropyConfig &cfg)
    -> std::unique_ptr<EntropySource>;

} // namespace uuidforge
