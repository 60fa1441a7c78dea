#include "typesys/symbolic.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

using namespace st::typesys;
using namespace st::typesys::decl;

namespace {

auto mentions(const ErrorList& errors, std::string_view text) -> bool {
  return std::any_of(errors.begin(), errors.end(), [&](const TypeError& error) {
    return error.message.find(text) != std::string::npos;
  });
}

auto has_kind(const ErrorList& errors, ErrorKind kind) -> bool {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const TypeError& error) { return error.kind == kind; });
}

auto compile_or_fail(const LibBuilder& builder) -> TypeLib {
  auto lib = builder.compile();
  if (!lib) {
    for (const auto& error : lib.error()) {
      ADD_FAILURE() << error.to_string();
    }
    throw std::runtime_error("library failed to compile");
  }
  return std::move(*lib);
}

}  // namespace

TEST(LibCompiler, SameShapeInTwoLibrariesHasSameId) {
  LibBuilder first(LibName::from("First"));
  first.transpile("u8", Ty<SymRef>::primitive(prim::kU8));
  LibBuilder second(LibName::from("Second"));
  second.transpile("u8", Ty<SymRef>::primitive(prim::kU8));

  auto a = compile_or_fail(first);
  auto b = compile_or_fail(second);
  ASSERT_NE(a.lookup(TypeName::from("u8")), nullptr);
  ASSERT_NE(b.lookup(TypeName::from("u8")), nullptr);
  EXPECT_EQ(*a.lookup(TypeName::from("u8")), *b.lookup(TypeName::from("u8")));
  EXPECT_NE(a.id(), b.id());
}

TEST(LibCompiler, NamesDoNotAffectIdentity) {
  LibBuilder first(LibName::from("First"));
  first.transpile("Point", Ty<SymRef>::composition({field("x", u8()), field("y", u8())}));
  LibBuilder second(LibName::from("Second"));
  second.transpile("Coord", Ty<SymRef>::composition({field("x", u8()), field("y", u8())}));

  auto a = compile_or_fail(first);
  auto b = compile_or_fail(second);
  EXPECT_EQ(*a.lookup(TypeName::from("Point")), *b.lookup(TypeName::from("Coord")));
}

TEST(LibCompiler, UndeclaredNameIsReported) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("A", Ty<SymRef>::composition({field("b", named("B"))}));

  auto lib = builder.compile();
  ASSERT_FALSE(lib.has_value());
  EXPECT_TRUE(mentions(lib.error(), "B"));
}

TEST(LibCompiler, UnresolvedNameInSymbolicLibIsCompileError) {
  std::map<TypeName, Ty<SymRef>> types;
  types.emplace(TypeName::from("A"), Ty<SymRef>::option(named("Demo.B")));
  SymbolicLib lib(LibName::from("Demo"), {}, std::move(types));

  auto compiled = lib.compile();
  ASSERT_FALSE(compiled.has_value());
  ASSERT_EQ(compiled.error().size(), 1u);
  EXPECT_EQ(compiled.error().front().kind, ErrorKind::Compile);
  EXPECT_TRUE(mentions(compiled.error(), "Demo.B"));
}

TEST(LibCompiler, ReportsEveryTranspileProblem) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("A", Ty<SymRef>::composition({field("x", u8()), field("x", u16())}))
      .transpile("B", Ty<SymRef>::array(u8(), 0))
      .transpile("C", Ty<SymRef>::option(named("Other.X")))
      .transpile("A", Ty<SymRef>::unit())
      .transpile("9bad", Ty<SymRef>::unit());

  auto lib = builder.compile_symbols();
  ASSERT_FALSE(lib.has_value());
  EXPECT_EQ(lib.error().size(), 5u);
  EXPECT_TRUE(std::all_of(lib.error().begin(), lib.error().end(),
                          [](const TypeError& e) { return e.kind == ErrorKind::Transpile; }));
  EXPECT_TRUE(mentions(lib.error(), "undeclared dependency 'Other'"));
  EXPECT_TRUE(mentions(lib.error(), "declared twice"));
}

TEST(LibCompiler, DependencyExportsAreChecked) {
  LibBuilder base(LibName::from("Base"));
  base.transpile("Byte", Ty<SymRef>::primitive(prim::kByte));
  auto base_lib = compile_or_fail(base);

  LibBuilder good(LibName::from("App"), {base_lib.to_dependency()});
  good.transpile("Hash", Ty<SymRef>::array(named("Base.Byte"), 32));
  auto app = compile_or_fail(good);
  EXPECT_EQ(app.dependencies().at(LibName::from("Base")), base_lib.id());
  // Dependency types are referenced by id, not copied.
  EXPECT_EQ(app.count_types(), 1u);

  LibBuilder bad(LibName::from("App"), {base_lib.to_dependency()});
  bad.transpile("Hash", Ty<SymRef>::array(named("Base.Missing"), 32));
  auto failed = bad.compile();
  ASSERT_FALSE(failed.has_value());
  EXPECT_TRUE(mentions(failed.error(), "does not export type 'Missing'"));
}

TEST(LibCompiler, DeclarationOrderDoesNotMatter) {
  LibBuilder forward(LibName::from("Demo"));
  forward.transpile("Outer", Ty<SymRef>::composition({field("inner", named("Inner"))}))
      .transpile("Inner", Ty<SymRef>::tuple({u8(), u16()}));
  LibBuilder backward(LibName::from("Demo"));
  backward.transpile("Inner", Ty<SymRef>::tuple({u8(), u16()}))
      .transpile("Outer", Ty<SymRef>::composition({field("inner", named("Inner"))}));

  EXPECT_EQ(compile_or_fail(forward), compile_or_fail(backward));
}

TEST(LibCompiler, InlineTypesBecomeUnnamedMembers) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("Bytes", Ty<SymRef>::list(u8(), Sizing::u8()));
  auto lib = compile_or_fail(builder);

  // The list and its U8 element.
  ASSERT_EQ(lib.count_types(), 2u);
  const auto& list_id = *lib.lookup(TypeName::from("Bytes"));
  const auto* list = lib.types().find(list_id);
  ASSERT_NE(list, nullptr);
  const auto* node = list->ty.get<ListNode<SemId>>();
  ASSERT_NE(node, nullptr);
  const auto* element = lib.types().find(node->ty);
  ASSERT_NE(element, nullptr);
  EXPECT_TRUE(element->names.empty());
  EXPECT_EQ(element->ty, Ty<SemId>::primitive(prim::kU8));
}

TEST(LibCompiler, SharedIdsCollectEveryName) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("Left", Ty<SymRef>::array(byte(), 32))
      .transpile("Right", Ty<SymRef>::array(byte(), 32));
  auto lib = compile_or_fail(builder);
  const auto& id = *lib.lookup(TypeName::from("Left"));
  EXPECT_EQ(id, *lib.lookup(TypeName::from("Right")));
  EXPECT_EQ(lib.types().find(id)->names.size(), 2u);
}

TEST(LibCompiler, NamedCycleIsCompileError) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("A", Ty<SymRef>::composition({field("b", named("B"))}))
      .transpile("B", Ty<SymRef>::composition({field("a", option(named("A")))}));

  auto lib = builder.compile();
  ASSERT_FALSE(lib.has_value());
  EXPECT_TRUE(has_kind(lib.error(), ErrorKind::Compile));
  EXPECT_TRUE(mentions(lib.error(), "Demo.A -> Demo.B -> Demo.A"));
}

TEST(LibCompiler, SelfRecursionCompiles) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("Tree", Ty<SymRef>::composition(
                                {field("value", u8()), field("children", list(recursive("Tree")))}));
  auto lib = compile_or_fail(builder);
  const auto& tree_id = *lib.lookup(TypeName::from("Tree"));

  bool found = false;
  for (const auto& [id, sym] : lib.types()) {
    if (const auto* target = sym.ty.recursive_target()) {
      EXPECT_EQ(*target, tree_id);
      found = true;
    }
  }
  EXPECT_TRUE(found);

  // Stable across builds.
  EXPECT_EQ(compile_or_fail(builder).id(), lib.id());
}

TEST(LibCompiler, MutualRecursionThroughRecursiveNodesCompiles) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("Expr", Ty<SymRef>::union_of({variant("lit", 0, u64()),
                                                  variant("call", 1, recursive("Call"))}))
      .transpile("Call", Ty<SymRef>::composition(
                             {field("name", unicode()), field("args", list(named("Expr")))}));
  auto lib = compile_or_fail(builder);
  EXPECT_NE(lib.lookup(TypeName::from("Expr")), nullptr);
  EXPECT_NE(lib.lookup(TypeName::from("Call")), nullptr);
}

TEST(LibCompiler, RecursiveTargetsBehindRecursiveEdgesKeepDistinctIds) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("Small", Ty<SymRef>::primitive(prim::kU8))
      .transpile("Large", Ty<SymRef>::primitive(prim::kU16))
      .transpile("ToSmall", Ty<SymRef>::composition({field("v", recursive("Small"))}))
      .transpile("ToLarge", Ty<SymRef>::composition({field("v", recursive("Large"))}))
      .transpile("Both", Ty<SymRef>::composition({field("small", recursive("ToSmall")),
                                                  field("large", recursive("ToLarge"))}));
  auto lib = compile_or_fail(builder);

  const auto* to_small = lib.lookup(TypeName::from("ToSmall"));
  const auto* to_large = lib.lookup(TypeName::from("ToLarge"));
  ASSERT_NE(to_small, nullptr);
  ASSERT_NE(to_large, nullptr);
  EXPECT_NE(*to_small, *to_large);

  // One recursive member per distinct target.
  std::set<SemId> targets;
  std::size_t recursive_members = 0;
  for (const auto& [id, sym] : lib.types()) {
    if (const auto* target = sym.ty.recursive_target()) {
      targets.insert(*target);
      ++recursive_members;
    }
  }
  EXPECT_EQ(recursive_members, 4u);
  EXPECT_EQ(targets.size(), 4u);
}

TEST(LibCompiler, CyclesDifferingDeepInsideKeepDistinctIds) {
  // Two three-step cycles that differ only in the leaf of their last step.
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("A1", Ty<SymRef>::composition({field("next", recursive("B1"))}))
      .transpile("B1", Ty<SymRef>::composition({field("next", recursive("C1"))}))
      .transpile("C1", Ty<SymRef>::composition({field("leaf", u8()), field("next", recursive("A1"))}))
      .transpile("A2", Ty<SymRef>::composition({field("next", recursive("B2"))}))
      .transpile("B2", Ty<SymRef>::composition({field("next", recursive("C2"))}))
      .transpile("C2", Ty<SymRef>::composition({field("leaf", u16()), field("next", recursive("A2"))}))
      .transpile("Root", Ty<SymRef>::tuple({recursive("A1"), recursive("A2")}));
  auto lib = compile_or_fail(builder);

  for (const auto* step : {"A", "B", "C"}) {
    const auto* first = lib.lookup(TypeName::from(std::string(step) + "1"));
    const auto* second = lib.lookup(TypeName::from(std::string(step) + "2"));
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(*first, *second) << step;
  }
}

TEST(LibCompiler, IdenticalCyclesShareIds) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("Ping", Ty<SymRef>::composition({field("next", option(recursive("Pong")))}))
      .transpile("Pong", Ty<SymRef>::composition({field("next", option(recursive("Ping")))}))
      .transpile("Loop", Ty<SymRef>::composition({field("next", option(recursive("Loop")))}));
  auto lib = compile_or_fail(builder);

  const auto* ping = lib.lookup(TypeName::from("Ping"));
  const auto* pong = lib.lookup(TypeName::from("Pong"));
  ASSERT_NE(ping, nullptr);
  ASSERT_NE(pong, nullptr);
  EXPECT_EQ(*ping, *pong);
  EXPECT_EQ(lib.types().find(*ping)->names.size(), 2u);
}

TEST(LibCompiler, RecursiveReferenceMustTargetLocalType) {
  LibBuilder base(LibName::from("Base"));
  base.transpile("Node", Ty<SymRef>::primitive(prim::kU8));
  auto base_lib = compile_or_fail(base);

  LibBuilder builder(LibName::from("App"), {base_lib.to_dependency()});
  builder.transpile("Link", Ty<SymRef>::option(recursive("Base.Node")));
  auto lib = builder.compile_symbols();
  ASSERT_FALSE(lib.has_value());
  EXPECT_TRUE(mentions(lib.error(), "must target a type of library 'App'"));
}

TEST(LibCompiler, RendersSymbolicLibrary) {
  LibBuilder builder(LibName::from("Demo"));
  builder.transpile("Point", Ty<SymRef>::composition({field("x", u8()), field("y", named("Coord"))}))
      .transpile("Coord", Ty<SymRef>::primitive(prim::kI32));
  auto lib = builder.compile_symbols();
  ASSERT_TRUE(lib.has_value());
  const auto text = lib->to_string();
  EXPECT_NE(text.find("typelib Demo"), std::string::npos);
  EXPECT_NE(text.find("data Point :: {x U8, y Coord}"), std::string::npos);
  EXPECT_NE(text.find("data Coord :: I32"), std::string::npos);
}
