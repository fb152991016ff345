#pragma once

#include "uuidforge/core/constants.hpp"
#include "uuidforge/core/error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

struct evp_md_ctx_st;

namespace uuidforge::util {

using Sha1Digest = std::array<std::uint8_t, layout::kSha1DigestSize>;

// Incremental SHA-1 over OpenSSL's EVP interface. Feeding the parts of a
// message through update() yields the digest of their concatenation.
class Sha1 {
public:
  Sha1();
  ~Sha1();

  Sha1(const Sha1 &) = delete;
  auto operator=(const Sha1 &) -> Sha1 & = delete;
  Sha1(Sha1 &&) noexcept;
  auto operator=(Sha1 &&) noexcept -> Sha1 &;

  [[nodiscard]] auto update(std::span<const std::byte> data) -> Result<void>;
  // Further calls after finish() fail with Error::InvalidState.
  [[nodiscard]] auto finish() -> Result<Sha1Digest>;

private:
  struct CtxDeleter {
    auto operator()(evp_md_ctx_st *ctx) const noexcept -> void;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finished_{false};
};

} // namespace uuidforge::util
