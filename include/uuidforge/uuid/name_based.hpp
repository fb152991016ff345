#pragma once

#include "uuidforge/core/constants.hpp"
#include "uuidforge/core/error.hpp"
#include "uuidforge/uuid/namespaces.hpp"
#include "uuidforge/uuid/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace uuidforge {

/**
 * Name-based UUID (version 5, RFC 9562 section 5.5).
 *
 * SHA-1 over `namespace || name`, truncated to 16 bytes, with the version
 * nibble forced to 5 and the variant bits forced to `10`. The result depends
 * only on the input bytes. Text names are hashed as their UTF-8 bytes, with no
 * normalisation, so "Example.com" and "example.com" differ.
 *
 * Fails only with Error::DigestFailed if the SHA-1 primitive itself fails.
 */
[[nodiscard]] auto generate_v5(const Uuid &namespace_id,
                               std::span<const std::byte> name) -> Result<Uuid>;
[[nodiscard]] auto generate_v5(const Uuid &namespace_id, std::string_view name)
    -> Result<Uuid>;

[[nodiscard]] auto generate_v5(Namespace tag, std::span<const std::byte> name)
    -> Result<Uuid>;
[[nodiscard]] auto generate_v5(Namespace tag, std::string_view name)
    -> Result<Uuid>;

// Namespace given as raw bytes; anything other than 16 bytes is rejected with
// Error::InvalidNamespace.
[[nodiscard]] auto generate_v5(std::span<const std::uint8_t> namespace_bytes,
                               std::span<const std::byte> name) -> Result<Uuid>;
[[nodiscard]] auto generate_v5(std::span<const std::uint8_t> namespace_bytes,
                               std::string_view name) -> Result<Uuid>;

// Applies the version-5 and variant bits to the first 16 bytes of a digest.
[[nodiscard]] auto
stamp_v5(std::span<const std::uint8_t, layout::kSha1DigestSize> digest) noexcept
    -> Uuid;

} // namespace uuidforge
