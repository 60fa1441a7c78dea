#include "layout/type_layout.hpp"
#include "layout/vesper.hpp"
#include "typesys/builder.hpp"
#include "typesys/symbolic.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace st::layout;
using namespace st::typesys;
using namespace st::typesys::decl;

namespace {

auto item(std::string name, std::string descr) -> LayoutItem {
  return LayoutItem{std::move(name), std::move(descr), {}, SemId()};
}

auto sample_tree() -> Vesper {
  Vesper root(item({}, "rec"));
  Vesper header(item("header", "rec"));
  EXPECT_TRUE(header.add_child(Vesper(item("version", "U8"))).has_value());
  EXPECT_TRUE(header.add_child(Vesper(item("flags", "list{0..0xff}"))).has_value());
  EXPECT_TRUE(root.add_child(std::move(header)).has_value());
  EXPECT_TRUE(root.add_child(Vesper(item("payload", "Unicode"))).has_value());
  return root;
}

auto compile_sys(const LibBuilder& lib_builder) -> SymbolicSys {
  auto lib = lib_builder.compile();
  EXPECT_TRUE(lib.has_value());
  SystemBuilder builder;
  EXPECT_TRUE(builder.import(*lib).has_value());
  auto system = builder.finalize_symbolic();
  EXPECT_TRUE(system.has_value());
  return std::move(system.value());
}

}  // namespace

TEST(Vesper, FlattenIsPreorder) {
  const auto entries = sample_tree().flatten();
  ASSERT_EQ(entries.size(), 5u);
  EXPECT_EQ(entries[0].depth, 0u);
  EXPECT_EQ(entries[1].item.name, "header");
  EXPECT_EQ(entries[1].depth, 1u);
  EXPECT_EQ(entries[2].item.name, "version");
  EXPECT_EQ(entries[2].depth, 2u);
  EXPECT_EQ(entries[3].item.name, "flags");
  EXPECT_EQ(entries[4].item.name, "payload");
  EXPECT_EQ(entries[4].depth, 1u);
}

TEST(Vesper, ReconstructsFromFlatLayout) {
  const auto tree = sample_tree();
  auto rebuilt = TypeLayout::from_items(tree.flatten()).to_vesper();
  ASSERT_TRUE(rebuilt.has_value()) << rebuilt.error().to_string();
  EXPECT_EQ(*rebuilt, tree);
}

TEST(Vesper, ReconstructsEveryDepthSequence) {
  const std::vector<std::vector<std::size_t>> sequences{
      {0},
      {0, 1, 1, 1},
      {0, 1, 2, 3, 1, 2},
      {0, 1, 2, 3, 4, 2, 3, 1},
      {0, 1, 1, 1, 2, 3, 3, 2, 1},
      {0, 1, 2, 2, 2, 1, 2, 3, 3, 1},
  };
  for (const auto& depths : sequences) {
    TypeLayout layout;
    for (std::size_t i = 0; i < depths.size(); ++i) {
      layout.push(item(i == 0 ? std::string() : "n" + std::to_string(i), "U8"), depths[i]);
    }
    auto tree = layout.to_vesper();
    ASSERT_TRUE(tree.has_value()) << tree.error().to_string();
    EXPECT_EQ(tree->flatten(), layout.items());
  }
}

TEST(Vesper, PopsSeveralLevelsToTheRightParent) {
  TypeLayout layout;
  layout.push(item({}, "rec"), 0);
  layout.push(item("a", "rec"), 1);
  layout.push(item("b", "rec"), 2);
  layout.push(item("c", "U8"), 3);
  layout.push(item("d", "rec"), 1);
  layout.push(item("e", "U8"), 2);
  layout.push(item("f", "rec"), 2);
  layout.push(item("g", "U8"), 3);

  auto tree = layout.to_vesper();
  ASSERT_TRUE(tree.has_value());
  ASSERT_EQ(tree->children().size(), 2u);

  const auto& a = tree->children()[0];
  EXPECT_EQ(a.item().name, "a");
  ASSERT_EQ(a.children().size(), 1u);
  EXPECT_EQ(a.children()[0].children()[0].item().name, "c");

  const auto& d = tree->children()[1];
  EXPECT_EQ(d.item().name, "d");
  ASSERT_EQ(d.children().size(), 2u);
  EXPECT_EQ(d.children()[0].item().name, "e");
  EXPECT_TRUE(d.children()[0].children().empty());
  EXPECT_EQ(d.children()[1].item().name, "f");
  ASSERT_EQ(d.children()[1].children().size(), 1u);
  EXPECT_EQ(d.children()[1].children()[0].item().name, "g");
}

TEST(Vesper, RendersTwoSpacesPerLevel) {
  const auto text = sample_tree().to_string();
  EXPECT_NE(text.find("\n  header rec\n"), std::string::npos);
  EXPECT_NE(text.find("\n    version U8\n"), std::string::npos);
}

TEST(Vesper, LimitsChildren) {
  Vesper root(item({}, "tuple"));
  for (std::size_t i = 0; i < Vesper::kMaxChildren; ++i) {
    ASSERT_TRUE(root.add_child(Vesper(item("_" + std::to_string(i), "U8"))).has_value());
  }
  auto overflow = root.add_child(Vesper(item("extra", "U8")));
  ASSERT_FALSE(overflow.has_value());
  EXPECT_EQ(overflow.error().kind, ErrorKind::Layout);
  EXPECT_EQ(root.children().size(), Vesper::kMaxChildren);
}

TEST(TypeLayout, RejectsSkippedLevels) {
  TypeLayout layout;
  layout.push(item({}, "rec"), 0);
  layout.push(item("deep", "U8"), 2);

  auto tree = layout.to_vesper();
  ASSERT_FALSE(tree.has_value());
  EXPECT_EQ(tree.error().kind, ErrorKind::Layout);
  EXPECT_NE(tree.error().message.find("skipped levels"), std::string::npos);
}

TEST(TypeLayout, RejectsChildBeforeRoot) {
  TypeLayout layout;
  layout.push(item("orphan", "U8"), 1);
  EXPECT_FALSE(layout.to_vesper().has_value());
}

TEST(TypeLayout, RejectsEmptyLayout) {
  auto tree = TypeLayout().to_vesper();
  ASSERT_FALSE(tree.has_value());
  EXPECT_NE(tree.error().message.find("zero items"), std::string::npos);
}

TEST(TypeLayout, RejectsSecondRoot) {
  TypeLayout layout;
  layout.push(item({}, "rec"), 0);
  layout.push(item({}, "rec"), 0);
  auto tree = layout.to_vesper();
  ASSERT_FALSE(tree.has_value());
  EXPECT_NE(tree.error().message.find("duplicate root"), std::string::npos);
}

TEST(TypeLayout, FlattensNamedComposition) {
  LibBuilder lib_builder(LibName::from("Demo"));
  lib_builder.transpile("Kind", Ty<SymRef>::enumerate({enum_variant("plain", 0), enum_variant("rich", 1)}))
      .transpile("Entry", Ty<SymRef>::composition({
                              field("kind", named("Kind")),
                              field("pair", tuple({u8(), u16()})),
                              field("tags", map(u8(), unicode(), Sizing{0, 0xFF})),
                          }));
  const auto system = compile_sys(lib_builder);

  auto layout = flatten(system, TypeFqn::parse("Demo.Entry").value());
  ASSERT_TRUE(layout.has_value()) << layout.error().to_string();

  const auto& items = layout->items();
  ASSERT_EQ(items.size(), 8u);
  EXPECT_EQ(items[0].item.type_name, "Demo.Entry");
  EXPECT_EQ(items[1].item.name, "kind");
  EXPECT_EQ(items[1].item.type_name, "Demo.Kind");
  EXPECT_EQ(items[2].item.name, "pair");
  EXPECT_EQ(items[3].item.name, "_0");
  EXPECT_EQ(items[3].depth, 2u);
  EXPECT_EQ(items[4].item.name, "_1");
  EXPECT_EQ(items[5].item.name, "tags");
  EXPECT_EQ(items[6].item.name, "key");
  EXPECT_EQ(items[7].item.name, "value");

  auto tree = layout->to_vesper();
  ASSERT_TRUE(tree.has_value());
  EXPECT_EQ(tree->children().size(), 3u);
}

TEST(TypeLayout, RecursiveReferencesAreLeaves) {
  LibBuilder lib_builder(LibName::from("Demo"));
  lib_builder.transpile("Tree", Ty<SymRef>::composition({
                                    field("value", u32()),
                                    field("children", list(recursive("Tree"), Sizing{0, 0xFF})),
                                }));
  const auto system = compile_sys(lib_builder);

  auto layout = flatten(system, TypeFqn::parse("Demo.Tree").value());
  ASSERT_TRUE(layout.has_value());
  ASSERT_EQ(layout->size(), 4u);
  EXPECT_EQ(layout->items()[3].item.descr, "@Demo.Tree");
  EXPECT_EQ(layout->items()[3].depth, 2u);
}

TEST(TypeLayout, UnknownRootIsLayoutError) {
  LibBuilder lib_builder(LibName::from("Demo"));
  lib_builder.transpile("Id", Ty<SymRef>::primitive(prim::kU64));
  const auto system = compile_sys(lib_builder);

  auto layout = flatten(system, TypeFqn::parse("Demo.Missing").value());
  ASSERT_FALSE(layout.has_value());
  EXPECT_EQ(layout.error().kind, ErrorKind::Layout);
}
