#include "typesys/builder.hpp"
#include "typesys/symbolic.hpp"
#include "typesys/type_system.hpp"

#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

using namespace st::typesys;
using namespace st::typesys::decl;

namespace {

auto make_system() -> TypeSystem {
  LibBuilder lib_builder(LibName::from("Demo"));
  lib_builder.transpile("Flag", Ty<SymRef>::enumerate({enum_variant("off", 0), enum_variant("on", 1)}))
      .transpile("Node", Ty<SymRef>::composition({
                             field("flag", named("Flag")),
                             field("label", unicode()),
                             field("next", option(recursive("Node"))),
                         }))
      .transpile("Index", Ty<SymRef>::map(u16(), named("Node"), Sizing{0, 0xFF}));
  auto lib = lib_builder.compile();
  EXPECT_TRUE(lib.has_value());

  SystemBuilder builder;
  EXPECT_TRUE(builder.import(*lib).has_value());
  auto system = builder.finalize();
  EXPECT_TRUE(system.has_value());
  return std::move(system.value());
}

}  // namespace

TEST(TypeSystem, BinaryRoundTripKeepsId) {
  const auto system = make_system();
  auto bytes = system.encode();
  ASSERT_TRUE(bytes.has_value());

  auto decoded = TypeSystem::decode(*bytes);
  ASSERT_TRUE(decoded.has_value()) << decoded.error().to_string();
  EXPECT_EQ(*decoded, system);
  EXPECT_EQ(decoded->id(), system.id());
  EXPECT_TRUE(decoded->check_completeness().empty());
}

TEST(TypeSystem, DecodeRejectsTrailingBytes) {
  auto bytes = make_system().encode();
  ASSERT_TRUE(bytes.has_value());
  bytes->push_back(0);

  auto decoded = TypeSystem::decode(*bytes);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().kind, ErrorKind::Decode);
}

TEST(TypeSystem, DecodeRejectsTruncatedInput) {
  auto bytes = make_system().encode();
  ASSERT_TRUE(bytes.has_value());
  bytes->resize(bytes->size() - 1);

  auto decoded = TypeSystem::decode(*bytes);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().kind, ErrorKind::Decode);
}

TEST(TypeSystem, DecodeRejectsAlteredStructure) {
  const auto system = make_system();
  auto bytes = system.encode();
  ASSERT_TRUE(bytes.has_value());
  // Library count and ids, member count, then the first member's id and kind.
  const auto offset = 2 + 32 * system.count_libs() + 3 + 32;
  ASSERT_GT(bytes->size(), offset);
  auto& kind = (*bytes)[offset];
  kind = static_cast<std::uint8_t>(kind == 0 ? 1 : 0);

  EXPECT_FALSE(TypeSystem::decode(*bytes).has_value());
}

TEST(TypeSystem, ArmoredRoundTrip) {
  const auto system = make_system();
  auto armored = system.to_armored();
  ASSERT_TRUE(armored.has_value());
  EXPECT_EQ(armored->rfind("-----BEGIN STRICT TYPE SYSTEM-----", 0), 0u);
  EXPECT_NE(armored->find("Id: " + system.id().to_string()), std::string::npos);

  auto restored = TypeSystem::from_armored(*armored);
  ASSERT_TRUE(restored.has_value()) << restored.error().to_string();
  EXPECT_EQ(*restored, system);
}

TEST(TypeSystem, ArmoredIdMustMatchContent) {
  const auto system = make_system();
  auto armored = system.to_armored();
  ASSERT_TRUE(armored.has_value());

  const auto genuine = system.id().to_string();
  const auto foreign = TypeSystem().id().to_string();
  auto pos = armored->find(genuine);
  ASSERT_NE(pos, std::string::npos);
  armored->replace(pos, genuine.size(), foreign);

  auto restored = TypeSystem::from_armored(*armored);
  ASSERT_FALSE(restored.has_value());
  EXPECT_EQ(restored.error().kind, ErrorKind::Decode);
}

TEST(TypeSystem, AtThrowsForAbsentMember) {
  const auto system = make_system();
  const auto absent = compute_sem_id(Ty<SemId>::primitive(prim::kF64));
  EXPECT_EQ(system.get(absent), nullptr);
  EXPECT_THROW(static_cast<void>(system.at(absent)), std::out_of_range);
}

TEST(TypeSystem, MembersAreOrderedById) {
  const auto system = make_system();
  const auto ids = system.sem_ids();
  ASSERT_EQ(ids.size(), system.count_types());
  for (std::size_t i = 1; i < ids.size(); ++i) {
    EXPECT_LT(ids[i - 1], ids[i]);
  }
}

TEST(TypeSystem, RendersEveryMember) {
  const auto system = make_system();
  const auto text = system.to_string();
  EXPECT_EQ(text.rfind("typesys -- " + system.id().to_string() + "\n\n", 0), 0u);
  for (const auto& id : system.sem_ids()) {
    EXPECT_NE(text.find("data " + id.to_string() + " :: "), std::string::npos);
  }
}

TEST(TypeSystem, EmptySystemRoundTrip) {
  TypeSystem empty;
  auto bytes = empty.encode();
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(bytes->size(), 5u);

  auto decoded = TypeSystem::decode(*bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->count_types(), 0u);
  EXPECT_EQ(decoded->id(), empty.id());
}
