#include "stl/stl.hpp"

#include "layout/type_layout.hpp"

#include <gtest/gtest.h>

using namespace st::typesys;

TEST(BuiltinLibs, StdCompiles) {
  const auto& lib = st::stl::std_stl();
  EXPECT_EQ(lib.name().str(), st::stl::kLibNameStd);
  EXPECT_TRUE(lib.dependencies().empty());

  const auto* boolean = lib.lookup(TypeName::from("Bool"));
  ASSERT_NE(boolean, nullptr);
  const auto* ty = lib.types().find(*boolean);
  ASSERT_NE(ty, nullptr);
  EXPECT_EQ(ty->ty.kind(), TyKind::Enum);
}

TEST(BuiltinLibs, StdDeclaresSmallIntegersAndAsciiClasses) {
  const auto& lib = st::stl::std_stl();
  auto variants_of = [&](const char* name) -> std::size_t {
    const auto* id = lib.lookup(TypeName::from(name));
    if (id == nullptr) {
      return 0;
    }
    const auto* ty = lib.types().find(*id);
    const auto* node = ty == nullptr ? nullptr : ty->ty.get<EnumNode>();
    return node == nullptr ? 0 : node->variants.size();
  };
  EXPECT_EQ(variants_of("U2"), 4u);
  EXPECT_EQ(variants_of("U3"), 8u);
  EXPECT_EQ(variants_of("U4"), 16u);
  EXPECT_EQ(variants_of("U5"), 32u);
  EXPECT_EQ(variants_of("U6"), 64u);
  EXPECT_EQ(variants_of("U7"), 128u);
  EXPECT_EQ(variants_of("AsciiSym"), 33u);
  EXPECT_EQ(variants_of("AsciiPrintable"), 95u);
}

TEST(BuiltinLibs, StrictTypesDependsOnStd) {
  const auto& lib = st::stl::strict_types_stl();
  ASSERT_EQ(lib.dependencies().size(), 1u);
  EXPECT_EQ(lib.dependencies().begin()->second, st::stl::std_stl().id());
}

TEST(BuiltinLibs, IdentifierTypesShareOneMember) {
  const auto& lib = st::stl::strict_types_stl();
  const auto* sem_id = lib.lookup(TypeName::from("SemId"));
  ASSERT_NE(sem_id, nullptr);
  for (const auto* name : {"ShapeId", "TypeLibId", "TypeSysId"}) {
    const auto* other = lib.lookup(TypeName::from(name));
    ASSERT_NE(other, nullptr) << name;
    EXPECT_EQ(*other, *sem_id) << name;
  }
  EXPECT_EQ(lib.types().find(*sem_id)->names.size(), 4u);
}

TEST(BuiltinLibs, SingletonsAreStable) {
  EXPECT_EQ(&st::stl::std_stl(), &st::stl::std_stl());
  EXPECT_EQ(&st::stl::builtin_system(), &st::stl::builtin_system());
  EXPECT_EQ(st::stl::std_sym().compile().value(), st::stl::std_stl());
}

TEST(BuiltinLibs, SystemIsComplete) {
  const auto& sys = st::stl::builtin_system();
  EXPECT_TRUE(sys.system().check_completeness().empty());
  EXPECT_EQ(sys.system().count_libs(), 2u);
  EXPECT_NE(sys.resolve("Std.Bool"), nullptr);
  EXPECT_NE(sys.resolve("StrictTypes.TypeSystem"), nullptr);

  auto bytes = sys.system().encode();
  ASSERT_TRUE(bytes.has_value());
  auto decoded = TypeSystem::decode(*bytes);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->id(), sys.id());
}

TEST(BuiltinLibs, TypeLibLayout) {
  const auto& sys = st::stl::builtin_system();
  auto layout = st::layout::flatten(sys, TypeFqn::parse("StrictTypes.TypeLib").value());
  ASSERT_TRUE(layout.has_value());

  auto tree = layout->to_vesper();
  ASSERT_TRUE(tree.has_value()) << tree.error().to_string();
  ASSERT_EQ(tree->children().size(), 3u);
  EXPECT_EQ(tree->children()[0].item().name, "name");
  EXPECT_EQ(tree->children()[1].item().name, "dependencies");
  EXPECT_EQ(tree->children()[2].item().name, "types");
}

TEST(BuiltinLibs, ArmoredLibraryRoundTrip) {
  const auto& lib = st::stl::strict_types_stl();
  auto armored = lib.to_armored();
  ASSERT_TRUE(armored.has_value());
  auto restored = TypeLib::from_armored(*armored);
  ASSERT_TRUE(restored.has_value()) << restored.error().to_string();
  EXPECT_EQ(*restored, lib);
  EXPECT_EQ(restored->id(), lib.id());
}
