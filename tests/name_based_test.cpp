#include "uuidforge/uuid/name_based.hpp"
#include "uuidforge/uuid/namespaces.hpp"
#include "uuidforge/uuid/render.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

using namespace uuidforge;

namespace {

auto v5_or_die(Namespace tag, std::string_view name) -> Uuid {
  auto r = generate_v5(tag, name);
  EXPECT_TRUE(r.has_value()) << r.error().message();
  return r.value_or(Uuid{});
}

} // namespace

TEST(NameBasedTest, RfcAppendixVector) {
  // RFC 9562 Appendix A.4
  auto id = v5_or_die(Namespace::Dns, "www.example.com");
  EXPECT_EQ(render(id), "2ed6657d-e927-568b-95e1-2665a8aea6a2");
}

TEST(NameBasedTest, MatchesOtherImplementations) {
  // Same value as Python's uuid.uuid5(uuid.NAMESPACE_DNS, "python.org").
  auto id = v5_or_die(Namespace::Dns, "python.org");
  EXPECT_EQ(render(id), "886313e1-3b8a-5372-9b90-0c9aee199e5d");
}

TEST(NameBasedTest, Deterministic) {
  auto first = v5_or_die(Namespace::Dns, "example.com");
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(v5_or_die(Namespace::Dns, "example.com"), first);
  }
}

TEST(NameBasedTest, VersionNibbleInStandardString) {
  auto str = render(v5_or_die(Namespace::Dns, "example.com"));
  ASSERT_EQ(str.size(), 36U);
  EXPECT_EQ(str[14], '5'); // 15th character
}

TEST(NameBasedTest, VersionAndVariantBits) {
  for (auto tag : {Namespace::Dns, Namespace::Url, Namespace::Oid,
                   Namespace::X500}) {
    auto id = v5_or_die(tag, "cn=John Doe");
    EXPECT_EQ(id.version(), 5);
    EXPECT_EQ(id.variant(), 0b10);
    EXPECT_EQ(id.bytes()[6] & 0xF0, 0x50);
    EXPECT_EQ(id.bytes()[8] & 0xC0, 0x80);
  }
}

TEST(NameBasedTest, DifferentNamesDiffer) {
  EXPECT_NE(v5_or_die(Namespace::Dns, "example.com"),
            v5_or_die(Namespace::Dns, "example.org"));
}

TEST(NameBasedTest, NamesAreCaseSensitive) {
  EXPECT_NE(v5_or_die(Namespace::Dns, "Example.Com"),
            v5_or_die(Namespace::Dns, "example.com"));
}

TEST(NameBasedTest, DifferentNamespacesDiffer) {
  std::set<Uuid> ids;
  for (auto tag : {Namespace::Dns, Namespace::Url, Namespace::Oid,
                   Namespace::X500}) {
    ids.insert(v5_or_die(tag, "shared-name"));
  }
  EXPECT_EQ(ids.size(), 4U);
}

TEST(NameBasedTest, TagAndConstantAgree) {
  auto by_tag = generate_v5(Namespace::Url, "https://test.com");
  auto by_uuid = generate_v5(namespace_url(), "https://test.com");
  ASSERT_TRUE(by_tag && by_uuid);
  EXPECT_EQ(*by_tag, *by_uuid);
}

TEST(NameBasedTest, TextAndByteNamesAgree) {
  const std::string name = "\xe4\xbe\x8b\xe3\x81\x88.jp"; // UTF-8 "例え.jp"
  auto by_text = generate_v5(namespace_dns(), name);
  auto by_bytes = generate_v5(
      namespace_dns(),
      std::as_bytes(std::span<const char>{name.data(), name.size()}));
  ASSERT_TRUE(by_text && by_bytes);
  EXPECT_EQ(*by_text, *by_bytes);
}

TEST(NameBasedTest, EmptyAndLongNames) {
  auto empty = generate_v5(Namespace::Dns, "");
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->version(), 5);

  auto long_name = generate_v5(Namespace::Dns, std::string(1000, 'a'));
  ASSERT_TRUE(long_name.has_value());
  EXPECT_NE(*empty, *long_name);
}

TEST(NameBasedTest, CustomNamespaceBytes) {
  const auto &raw = namespace_dns().bytes();
  std::vector<std::uint8_t> ns(raw.begin(), raw.end());
  auto custom = generate_v5(std::span<const std::uint8_t>{ns}, "example.com");
  ASSERT_TRUE(custom.has_value());
  EXPECT_EQ(*custom, v5_or_die(Namespace::Dns, "example.com"));

  ns[15] ^= 0x01;
  auto other = generate_v5(std::span<const std::uint8_t>{ns}, "example.com");
  ASSERT_TRUE(other.has_value());
  EXPECT_NE(*other, *custom);
}

TEST(NameBasedTest, RejectsWrongLengthNamespace) {
  std::vector<std::uint8_t> short_ns(15, 0xAB);
  auto r = generate_v5(std::span<const std::uint8_t>{short_ns}, "name");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidNamespace));
  EXPECT_EQ(r.error(), std::errc::invalid_argument);

  std::vector<std::uint8_t> long_ns(17, 0xAB);
  auto r2 = generate_v5(std::span<const std::uint8_t>{long_ns}, "name");
  ASSERT_FALSE(r2.has_value());
  EXPECT_EQ(r2.error(), make_error_code(Error::InvalidNamespace));

  auto r3 = generate_v5(std::span<const std::uint8_t>{}, "name");
  ASSERT_FALSE(r3.has_value());
  EXPECT_EQ(r3.error(), make_error_code(Error::InvalidNamespace));
}

TEST(NameBasedTest, StampPreservesNonFieldBits) {
  std::array<std::uint8_t, 20> digest{};
  digest.fill(0xFF);
  auto id = stamp_v5(digest);
  EXPECT_EQ(id.bytes()[6], 0x5F);
  EXPECT_EQ(id.bytes()[8], 0xBF);
  for (std::size_t i : {0U, 1U, 2U, 3U, 4U, 5U, 7U, 9U, 15U}) {
    EXPECT_EQ(id.bytes()[i], 0xFF) << "byte " << i;
  }

  digest.fill(0x00);
  auto zero = stamp_v5(digest);
  EXPECT_EQ(zero.bytes()[6], 0x50);
  EXPECT_EQ(zero.bytes()[8], 0x80);
}
