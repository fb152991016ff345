#pragma once

#include <cstddef>
#include <cstdint>

namespace uuidforge {

namespace layout {
constexpr std::size_t kUuidSize = 16;
constexpr std::size_t kSha1DigestSize = 20;

constexpr std::size_t kTimestampBits = 48;
constexpr std::size_t kRandABits = 12;
constexpr std::size_t kRandBBits = 62;
constexpr std::size_t kV7RandomBits = kRandABits + kRandBBits; // 74

constexpr std::uint64_t kMaxTimestampMs = (std::uint64_t{1} << kTimestampBits) - 1;

// Byte offsets of the version nibble and variant bits.
constexpr std::size_t kVersionByte = 6;
constexpr std::size_t kVariantByte = 8;

constexpr std::uint8_t kVersionV5 = 5;
constexpr std::uint8_t kVersionV7 = 7;
constexpr std::uint8_t kVariantRfc = 0b10;
} // namespace layout

namespace entropy {
constexpr std::size_t kDefaultMaxRequestBits = 4096;
constexpr unsigned kDefaultWorkers = 2;
constexpr unsigned kMaxWorkers = 256;
} // namespace entropy

} // namespace uuidforge
