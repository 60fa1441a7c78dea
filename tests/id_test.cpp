#include "typesys/baid58.hpp"
#include "typesys/id.hpp"
#include "typesys/ty.hpp"
#include "typesys/type_system.hpp"

#include <type_traits>

#include <gtest/gtest.h>

using namespace st::typesys;

static_assert(!std::is_convertible_v<SemId, TypeSysId>);
static_assert(!std::is_constructible_v<TypeSysId, SemId>);
static_assert(!std::is_constructible_v<SemId, TypeLibId>);
static_assert(!std::is_convertible_v<Bytes32, SemId>);

namespace {

auto sample_bytes() -> Bytes32 {
  Bytes32 bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<std::uint8_t>(i * 7 + 3);
  }
  return bytes;
}

}  // namespace

TEST(Identity, TaggedHashOfPrimitive) {
  auto id = compute_sem_id(Ty<SemId>::primitive(prim::kU8));
  EXPECT_EQ(id.to_hex(), "77f0d07dccb3bb52a483de90c1e8528ea04e040c04178253411c821e21378f63");
}

TEST(Identity, EmptySystemId) {
  TypeSystem system;
  EXPECT_EQ(system.id().to_hex(), "1324c536a5b1a337ad8fcf232741a5fc2e5edbc125d06a671b7fb18668775f74");
}

TEST(Identity, TagsSeparateDomains) {
  const Bytes content{1, 2, 3};
  EXPECT_NE(SemId::commit(content).bytes(), TypeSysId::commit(content).bytes());
  EXPECT_NE(SemId::commit(content).bytes(), TypeLibId::commit(content).bytes());
  EXPECT_NE(SemId::commit(content).bytes(), ShapeId::commit(content).bytes());
}

TEST(Identity, HexRoundTrip) {
  SemId id(sample_bytes());
  auto parsed = SemId::from_hex(id.to_hex());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, id);

  EXPECT_FALSE(SemId::from_hex("abcd").has_value());
  auto bad = SemId::from_hex(std::string(64, 'g'));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind, ErrorKind::IdParse);
}

TEST(Identity, TextRoundTrip) {
  SemId id(sample_bytes());
  const auto text = id.to_string();
  EXPECT_TRUE(text.starts_with("urn:ubideco:semid:"));
  EXPECT_NE(text.find('#' + id.mnemonic()), std::string::npos);

  auto parsed = SemId::parse(text);
  ASSERT_TRUE(parsed.has_value()) << parsed.error().to_string();
  EXPECT_EQ(*parsed, id);

  auto bare = SemId::parse(id.to_baid58());
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(*bare, id);

  auto with_hri = SemId::parse("semid:" + id.to_baid58());
  ASSERT_TRUE(with_hri.has_value());
  EXPECT_EQ(*with_hri, id);
}

TEST(Identity, MnemonicShape) {
  auto words = SemId(sample_bytes()).mnemonic();
  ASSERT_EQ(words.size(), 11u);
  EXPECT_EQ(words[5], '-');
}

TEST(Identity, RejectsChecksumCorruption) {
  SemId id(sample_bytes());
  auto text = id.to_baid58();
  text.back() = text.back() == '2' ? '3' : '2';
  auto parsed = SemId::parse(text);
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().kind, ErrorKind::IdParse);
}

TEST(Identity, RejectsWrongMnemonic) {
  SemId id(sample_bytes());
  auto words = id.mnemonic();
  words[0] = words[0] == 'b' ? 'd' : 'b';
  auto parsed = SemId::parse(id.to_baid58() + "#" + words);
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().kind, ErrorKind::IdParse);
}

TEST(Identity, RejectsForeignIdKind) {
  TypeSysId sys(sample_bytes());
  auto parsed = SemId::parse(sys.to_string());
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().kind, ErrorKind::IdParse);

  // Same payload, but the checksum is keyed by the id kind.
  EXPECT_NE(sys.to_baid58(), SemId(sample_bytes()).to_baid58());
  EXPECT_FALSE(SemId::parse(sys.to_baid58()).has_value());
}

TEST(Identity, RejectsMalformedText) {
  EXPECT_FALSE(SemId::parse("").has_value());
  EXPECT_FALSE(SemId::parse("urn:ubideco:semid:").has_value());
  EXPECT_FALSE(SemId::parse("urn:ubideco:semid:0OIl").has_value());
  EXPECT_FALSE(SemId::parse("urn:ubideco:semid:2222").has_value());
}

TEST(Base58, KnownValues) {
  const Bytes bytes{0, 0, 1};
  EXPECT_EQ(baid58::base58_encode(bytes), "112");
  auto decoded = baid58::base58_decode("112");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);

  const Bytes hello{'h', 'e', 'l', 'l', 'o'};
  EXPECT_EQ(baid58::base58_encode(hello), "Cn8eVZg");
  EXPECT_FALSE(baid58::base58_decode("0").has_value());
}
