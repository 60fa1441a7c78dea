#include "layout/type_layout.hpp"

#include <functional>
#include <optional>

#include <fmt/format.h>

namespace st::layout {

using typesys::ErrorKind;
using typesys::SemId;
using typesys::Ty;

namespace {

auto layout_error(std::string message) -> tl::unexpected<typesys::TypeError> {
  return tl::unexpected(
      typesys::make_error(ErrorKind::Layout, fmt::format("invalid type layout: {}", message)));
}

// Declared name of a member, empty when it has none.
using Namer = std::function<std::string(const SemId&)>;

auto describe(const Ty<SemId>& ty, const Namer& namer) -> std::string {
  return std::visit(
      [&](const auto& node) -> std::string {
        using N = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<N, typesys::PrimitiveNode>) {
          return node.prim.to_string();
        } else if constexpr (std::is_same_v<N, typesys::UnicodeNode>) {
          return "Unicode";
        } else if constexpr (std::is_same_v<N, typesys::EnumNode>) {
          return "enum " + ty.to_string([](const SemId& id) { return id.to_string(); });
        } else if constexpr (std::is_same_v<N, typesys::UnionNode<SemId>>) {
          return "union";
        } else if constexpr (std::is_same_v<N, typesys::TupleNode<SemId>>) {
          return "tuple";
        } else if constexpr (std::is_same_v<N, typesys::StructNode<SemId>>) {
          return "rec";
        } else if constexpr (std::is_same_v<N, typesys::ArrayNode<SemId>>) {
          return fmt::format("array ^ {}", node.len);
        } else if constexpr (std::is_same_v<N, typesys::ListNode<SemId>>) {
          return "list" + node.sizing.to_string();
        } else if constexpr (std::is_same_v<N, typesys::SetNode<SemId>>) {
          return "set" + node.sizing.to_string();
        } else if constexpr (std::is_same_v<N, typesys::MapNode<SemId>>) {
          return "map" + node.sizing.to_string();
        } else if constexpr (std::is_same_v<N, typesys::OptionNode<SemId>>) {
          return "option";
        } else {
          auto name = namer(node.target);
          return "@" + (name.empty() ? node.target.to_string() : name);
        }
      },
      ty.node());
}

class TypeTree {
 public:
  TypeTree(const typesys::TypeSystem& system, Namer namer)
      : system_(system), namer_(std::move(namer)) {}

  auto walk(const SemId& id, std::string name, std::size_t depth) -> void {
    const auto& ty = system_.at(id);
    layout_.push(LayoutItem{std::move(name), describe(ty, namer_), namer_(id), id}, depth);

    std::visit(
        [&](const auto& node) {
          using N = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<N, typesys::UnionNode<SemId>>) {
            for (const auto& variant : node.variants) {
              walk(variant.ty, fmt::format("{}#{}", variant.name, variant.tag), depth + 1);
            }
          } else if constexpr (std::is_same_v<N, typesys::StructNode<SemId>>) {
            for (const auto& field : node.fields) {
              walk(field.ty, field.name.str(), depth + 1);
            }
          } else if constexpr (std::is_same_v<N, typesys::TupleNode<SemId>>) {
            for (std::size_t i = 0; i < node.fields.size(); ++i) {
              walk(node.fields[i], fmt::format("_{}", i), depth + 1);
            }
          } else if constexpr (std::is_same_v<N, typesys::MapNode<SemId>>) {
            walk(node.key, "key", depth + 1);
            walk(node.value, "value", depth + 1);
          } else if constexpr (std::is_same_v<N, typesys::ArrayNode<SemId>> ||
                               std::is_same_v<N, typesys::ListNode<SemId>> ||
                               std::is_same_v<N, typesys::SetNode<SemId>> ||
                               std::is_same_v<N, typesys::OptionNode<SemId>>) {
            walk(node.ty, {}, depth + 1);
          }
        },
        ty.node());
  }

  auto take() && -> TypeLayout { return std::move(layout_); }

 private:
  const typesys::TypeSystem& system_;
  Namer namer_;
  TypeLayout layout_;
};

}  // namespace

auto TypeLayout::from_items(std::vector<LayoutEntry> items) -> TypeLayout {
  TypeLayout layout;
  layout.items_ = std::move(items);
  return layout;
}

auto TypeLayout::push(LayoutItem item, std::size_t depth) -> void {
  items_.push_back(LayoutEntry{std::move(item), depth});
}

auto TypeLayout::to_vesper() const -> typesys::Expected<Vesper> {
  std::optional<Vesper> root;
  std::vector<std::size_t> path;

  for (const auto& [item, depth] : items_) {
    if (depth == 0) {
      if (root) {
        return layout_error(fmt::format("duplicate root '{}'", item.to_string()));
      }
      root.emplace(item);
      continue;
    }
    if (!root) {
      return layout_error(
          fmt::format("skipped levels: item '{}' at depth {} has no root", item.to_string(), depth));
    }
    if (path.size() < depth - 1) {
      return layout_error(fmt::format("skipped levels: item '{}' at depth {} follows depth {}",
                                      item.to_string(), depth, path.size()));
    }
    path.resize(depth - 1);

    Vesper* head = &*root;
    for (auto index : path) {
      head = &head->child(index);
    }
    auto index = head->add_child(Vesper(item));
    if (!index) {
      return tl::unexpected(index.error());
    }
    path.push_back(*index);
  }

  if (!root) {
    return layout_error("zero items");
  }
  return std::move(*root);
}

auto TypeLayout::to_string() const -> std::string {
  auto vesper = to_vesper();
  if (!vesper) {
    return vesper.error().to_string();
  }
  return vesper->to_string();
}

auto flatten(const typesys::TypeSystem& system, const SemId& root) -> TypeLayout {
  TypeTree tree(system, [](const SemId&) { return std::string(); });
  tree.walk(root, {}, 0);
  return std::move(tree).take();
}

auto flatten(const typesys::SymbolicSys& system, const typesys::TypeFqn& root)
    -> typesys::Expected<TypeLayout> {
  const auto* id = system.resolve(root);
  if (id == nullptr) {
    return layout_error(fmt::format("type '{}' is not part of the type system", root));
  }
  TypeTree tree(system.system(), [&](const SemId& member) {
    auto names = system.names_of(member);
    return names.empty() ? std::string() : names.begin()->to_string();
  });
  tree.walk(*id, {}, 0);
  return std::move(tree).take();
}

}  // namespace st::layout
