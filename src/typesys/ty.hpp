#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "typesys/encoding.hpp"
#include "typesys/id.hpp"
#include "typesys/ident.hpp"

namespace st::typesys {

/// Number class in the two high bits, byte size in the six low bits.
class Primitive {
 public:
  enum class NumCls : std::uint8_t {
    Unsigned = 0x00,
    Signed = 0x40,
    NonZero = 0x80,
    Float = 0xC0,
  };

  constexpr Primitive() = default;
  constexpr explicit Primitive(std::uint8_t code) : code_(code) {}
  constexpr Primitive(NumCls cls, std::uint8_t size)
      : code_(static_cast<std::uint8_t>(static_cast<std::uint8_t>(cls) | (size & 0x3F))) {}

  constexpr auto code() const -> std::uint8_t { return code_; }
  constexpr auto cls() const -> NumCls { return static_cast<NumCls>(code_ & 0xC0); }
  constexpr auto size() const -> std::uint8_t { return code_ & 0x3F; }

  auto to_string() const -> std::string;

  constexpr auto operator<=>(const Primitive&) const = default;

 private:
  std::uint8_t code_ = 0;
};

namespace prim {
inline constexpr Primitive kUnit{0x00};
inline constexpr Primitive kU8{0x01};
inline constexpr Primitive kU16{0x02};
inline constexpr Primitive kU24{0x03};
inline constexpr Primitive kU32{0x04};
inline constexpr Primitive kU64{0x08};
inline constexpr Primitive kU128{0x10};
inline constexpr Primitive kU256{0x20};
inline constexpr Primitive kByte{0x40};
inline constexpr Primitive kI8{0x41};
inline constexpr Primitive kI16{0x42};
inline constexpr Primitive kI32{0x44};
inline constexpr Primitive kI64{0x48};
inline constexpr Primitive kI128{0x50};
inline constexpr Primitive kF16{0xC2};
inline constexpr Primitive kF32{0xC4};
inline constexpr Primitive kF64{0xC8};
}  // namespace prim

/// Maximum number of fields or variants in one composite type.
inline constexpr std::size_t kMaxFields = 0xFF;

enum class TyKind : std::uint8_t {
  Primitive = 0,
  Unicode = 1,
  Enum = 2,
  Union = 3,
  Tuple = 4,
  Struct = 5,
  Array = 6,
  List = 7,
  Set = 8,
  Map = 9,
  Option = 10,
  Recursive = 11,
};

auto to_string(TyKind kind) -> std::string_view;

struct EnumVariant {
  FieldName name;
  std::uint8_t tag = 0;

  auto operator==(const EnumVariant&) const -> bool = default;
};

template <typename Ref>
struct Variant {
  FieldName name;
  std::uint8_t tag = 0;
  Ref ty;

  auto operator==(const Variant&) const -> bool = default;
};

template <typename Ref>
struct Field {
  FieldName name;
  Ref ty;

  auto operator==(const Field&) const -> bool = default;
};

struct PrimitiveNode {
  Primitive prim;
  auto operator==(const PrimitiveNode&) const -> bool = default;
};

struct UnicodeNode {
  auto operator==(const UnicodeNode&) const -> bool = default;
};

struct EnumNode {
  std::vector<EnumVariant> variants;
  auto operator==(const EnumNode&) const -> bool = default;
};

template <typename Ref>
struct UnionNode {
  std::vector<Variant<Ref>> variants;
  auto operator==(const UnionNode&) const -> bool = default;
};

template <typename Ref>
struct TupleNode {
  std::vector<Ref> fields;
  auto operator==(const TupleNode&) const -> bool = default;
};

template <typename Ref>
struct StructNode {
  std::vector<Field<Ref>> fields;
  auto operator==(const StructNode&) const -> bool = default;
};

template <typename Ref>
struct ArrayNode {
  Ref ty;
  std::uint16_t len = 0;
  auto operator==(const ArrayNode&) const -> bool = default;
};

template <typename Ref>
struct ListNode {
  Ref ty;
  Sizing sizing;
  auto operator==(const ListNode&) const -> bool = default;
};

template <typename Ref>
struct SetNode {
  Ref ty;
  Sizing sizing;
  auto operator==(const SetNode&) const -> bool = default;
};

template <typename Ref>
struct MapNode {
  Ref key;
  Ref value;
  Sizing sizing;
  auto operator==(const MapNode&) const -> bool = default;
};

template <typename Ref>
struct OptionNode {
  Ref ty;
  auto operator==(const OptionNode&) const -> bool = default;
};

/// Indirection to a named type. This is the only node allowed to close a
/// reference cycle.
template <typename Ref>
struct RecursiveNode {
  Ref target;
  auto operator==(const RecursiveNode&) const -> bool = default;
};

/// Compiled recursive reference. Its identity commits to the target's shape
/// rather than to the target's id, so cycles have well-defined ids. The shape
/// describes everything reachable from the target, with revisits of types
/// still open on the walk written as back-references, so targets of equal
/// shape have equal ids.
template <>
struct RecursiveNode<SemId> {
  SemId target;
  ShapeId shape;
  auto operator==(const RecursiveNode&) const -> bool = default;
};

/// Structural type description, parameterised by how nested types are
/// referenced: by name while symbolic, by `SemId` once compiled.
template <typename Ref>
class Ty {
 public:
  using Node = std::variant<PrimitiveNode, UnicodeNode, EnumNode, UnionNode<Ref>, TupleNode<Ref>,
                            StructNode<Ref>, ArrayNode<Ref>, ListNode<Ref>, SetNode<Ref>,
                            MapNode<Ref>, OptionNode<Ref>, RecursiveNode<Ref>>;

  template <typename N>
    requires std::is_constructible_v<Node, N&&>
  Ty(N&& node) : node_(std::forward<N>(node)) {}

  static auto primitive(Primitive prim) -> Ty { return Ty(PrimitiveNode{prim}); }
  static auto unit() -> Ty { return primitive(prim::kUnit); }
  static auto unicode() -> Ty { return Ty(UnicodeNode{}); }
  static auto enumerate(std::vector<EnumVariant> variants) -> Ty {
    return Ty(EnumNode{std::move(variants)});
  }
  static auto union_of(std::vector<Variant<Ref>> variants) -> Ty {
    return Ty(UnionNode<Ref>{std::move(variants)});
  }
  static auto tuple(std::vector<Ref> fields) -> Ty { return Ty(TupleNode<Ref>{std::move(fields)}); }
  static auto composition(std::vector<Field<Ref>> fields) -> Ty {
    return Ty(StructNode<Ref>{std::move(fields)});
  }
  static auto array(Ref ty, std::uint16_t len) -> Ty {
    return Ty(ArrayNode<Ref>{std::move(ty), len});
  }
  static auto list(Ref ty, Sizing sizing = Sizing::u16()) -> Ty {
    return Ty(ListNode<Ref>{std::move(ty), sizing});
  }
  static auto set(Ref ty, Sizing sizing = Sizing::u16()) -> Ty {
    return Ty(SetNode<Ref>{std::move(ty), sizing});
  }
  static auto map(Ref key, Ref value, Sizing sizing = Sizing::u16()) -> Ty {
    return Ty(MapNode<Ref>{std::move(key), std::move(value), sizing});
  }
  static auto option(Ref ty) -> Ty { return Ty(OptionNode<Ref>{std::move(ty)}); }

  auto kind() const -> TyKind { return static_cast<TyKind>(node_.index()); }
  auto node() const -> const Node& { return node_; }

  template <typename N>
  auto get() const -> const N* {
    return std::get_if<N>(&node_);
  }

  auto is_recursive() const -> bool { return kind() == TyKind::Recursive; }

  /// Recursive target, or null for every other kind.
  auto recursive_target() const -> const Ref* {
    if (const auto* rec = get<RecursiveNode<Ref>>()) {
      return &rec->target;
    }
    return nullptr;
  }

  /// Visit nested type references in declaration order, excluding the target
  /// of a recursive node.
  template <typename Fn>
  auto for_each_child(Fn&& fn) const -> void {
    std::visit(
        [&](const auto& node) {
          using N = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<N, UnionNode<Ref>>) {
            for (const auto& variant : node.variants) fn(variant.ty);
          } else if constexpr (std::is_same_v<N, TupleNode<Ref>>) {
            for (const auto& field : node.fields) fn(field);
          } else if constexpr (std::is_same_v<N, StructNode<Ref>>) {
            for (const auto& field : node.fields) fn(field.ty);
          } else if constexpr (std::is_same_v<N, ArrayNode<Ref>> ||
                               std::is_same_v<N, ListNode<Ref>> ||
                               std::is_same_v<N, SetNode<Ref>> ||
                               std::is_same_v<N, OptionNode<Ref>>) {
            fn(node.ty);
          } else if constexpr (std::is_same_v<N, MapNode<Ref>>) {
            fn(node.key);
            fn(node.value);
          }
        },
        node_);
  }

  /// Type expression with nested references rendered by `render`.
  auto to_string(const std::function<std::string(const Ref&)>& render) const -> std::string;

  auto operator==(const Ty&) const -> bool = default;

 private:
  Node node_;
};

/// Structural problems of a single type node (empty composites, duplicate
/// names or tags, zero-length arrays, inverted size bounds).
template <typename Ref>
auto check_ty(const Ty<Ref>& ty) -> std::vector<std::string>;

/// Rebuild `ty` with every nested reference passed through `fn`, in
/// declaration order. Recursive nodes are rebuilt by `rec`.
template <typename Out, typename Ref, typename Fn, typename RecFn>
auto map_refs(const Ty<Ref>& ty, Fn&& fn, RecFn&& rec) -> Ty<Out>;

enum class EncodeMode {
  /// Full canonical form used for persistence.
  Persist,
  /// Form hashed into the type's own id.
  Commit,
};

template <typename IdT>
auto encode_ty(StrictWriter& writer, const Ty<IdT>& ty, EncodeMode mode) -> void;

/// Decode a persisted compiled type. Failures are recorded in the reader.
auto decode_ty(StrictReader& reader) -> Ty<SemId>;

/// Semantic id of a compiled type.
auto compute_sem_id(const Ty<SemId>& ty) -> SemId;

/// Shape id of a type whose children, recursive targets included, are
/// referenced by shape.
auto compute_shape_id(const Ty<ShapeId>& ty) -> ShapeId;

template <typename Ref>
auto Ty<Ref>::to_string(const std::function<std::string(const Ref&)>& render) const
    -> std::string {
  return std::visit(
      [&](const auto& node) -> std::string {
        using N = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<N, PrimitiveNode>) {
          return node.prim.to_string();
        } else if constexpr (std::is_same_v<N, UnicodeNode>) {
          return "Unicode";
        } else if constexpr (std::is_same_v<N, EnumNode>) {
          std::string out = "(";
          for (std::size_t i = 0; i < node.variants.size(); ++i) {
            if (i > 0) out += " | ";
            out += fmt::format("{}={}", node.variants[i].name, node.variants[i].tag);
          }
          return out + ")";
        } else if constexpr (std::is_same_v<N, UnionNode<Ref>>) {
          std::string out = "(";
          for (std::size_t i = 0; i < node.variants.size(); ++i) {
            if (i > 0) out += " | ";
            const auto& variant = node.variants[i];
            out += fmt::format("{}#{} {}", variant.name, variant.tag, render(variant.ty));
          }
          return out + ")";
        } else if constexpr (std::is_same_v<N, TupleNode<Ref>>) {
          std::string out = "(";
          for (std::size_t i = 0; i < node.fields.size(); ++i) {
            if (i > 0) out += ", ";
            out += render(node.fields[i]);
          }
          return out + ")";
        } else if constexpr (std::is_same_v<N, StructNode<Ref>>) {
          std::string out = "{";
          for (std::size_t i = 0; i < node.fields.size(); ++i) {
            if (i > 0) out += ", ";
            out += fmt::format("{} {}", node.fields[i].name, render(node.fields[i].ty));
          }
          return out + "}";
        } else if constexpr (std::is_same_v<N, ArrayNode<Ref>>) {
          return fmt::format("[{} ^ {}]", render(node.ty), node.len);
        } else if constexpr (std::is_same_v<N, ListNode<Ref>>) {
          return fmt::format("[{}{}]", render(node.ty), node.sizing.to_string());
        } else if constexpr (std::is_same_v<N, SetNode<Ref>>) {
          return fmt::format("{{{}{}}}", render(node.ty), node.sizing.to_string());
        } else if constexpr (std::is_same_v<N, MapNode<Ref>>) {
          return fmt::format("{{{} -> {}{}}}", render(node.key), render(node.value),
                             node.sizing.to_string());
        } else if constexpr (std::is_same_v<N, OptionNode<Ref>>) {
          return render(node.ty) + "?";
        } else {
          return "@" + render(node.target);
        }
      },
      node_);
}

template <typename Ref>
auto check_ty(const Ty<Ref>& ty) -> std::vector<std::string> {
  std::vector<std::string> problems;
  auto check_count = [&](std::size_t count, std::string_view what) {
    if (count == 0) {
      problems.push_back(fmt::format("{} must have at least one member", what));
    } else if (count > kMaxFields) {
      problems.push_back(fmt::format("{} has {} members, at most {} allowed", what, count, kMaxFields));
    }
  };
  auto check_names = [&](const auto& items, std::string_view what) {
    std::set<FieldName> names;
    for (const auto& item : items) {
      if (!names.insert(item.name).second) {
        problems.push_back(fmt::format("duplicate {} name '{}'", what, item.name));
      }
    }
  };
  auto check_tags = [&](const auto& items, std::string_view what) {
    std::set<std::uint8_t> tags;
    for (const auto& item : items) {
      if (!tags.insert(item.tag).second) {
        problems.push_back(fmt::format("duplicate {} tag {}", what, item.tag));
      }
    }
  };
  auto check_sizing = [&](const Sizing& sizing) {
    if (!sizing.is_valid()) {
      problems.push_back(
          fmt::format("size bound minimum {} exceeds maximum {}", sizing.min, sizing.max));
    }
  };

  std::visit(
      [&](const auto& node) {
        using N = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<N, EnumNode>) {
          check_count(node.variants.size(), "enum");
          check_names(node.variants, "enum variant");
          check_tags(node.variants, "enum variant");
        } else if constexpr (std::is_same_v<N, UnionNode<Ref>>) {
          check_count(node.variants.size(), "union");
          check_names(node.variants, "union variant");
          check_tags(node.variants, "union variant");
        } else if constexpr (std::is_same_v<N, TupleNode<Ref>>) {
          check_count(node.fields.size(), "tuple");
        } else if constexpr (std::is_same_v<N, StructNode<Ref>>) {
          check_count(node.fields.size(), "struct");
          check_names(node.fields, "field");
        } else if constexpr (std::is_same_v<N, ArrayNode<Ref>>) {
          if (node.len == 0) {
            problems.push_back("array length must be non-zero");
          }
        } else if constexpr (std::is_same_v<N, ListNode<Ref>> || std::is_same_v<N, SetNode<Ref>> ||
                             std::is_same_v<N, MapNode<Ref>>) {
          check_sizing(node.sizing);
        }
      },
      ty.node());
  return problems;
}

template <typename Out, typename Ref, typename Fn, typename RecFn>
auto map_refs(const Ty<Ref>& ty, Fn&& fn, RecFn&& rec) -> Ty<Out> {
  return std::visit(
      [&](const auto& node) -> Ty<Out> {
        using N = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<N, PrimitiveNode> || std::is_same_v<N, UnicodeNode> ||
                      std::is_same_v<N, EnumNode>) {
          return Ty<Out>(node);
        } else if constexpr (std::is_same_v<N, UnionNode<Ref>>) {
          std::vector<Variant<Out>> variants;
          variants.reserve(node.variants.size());
          for (const auto& variant : node.variants) {
            variants.push_back(Variant<Out>{variant.name, variant.tag, fn(variant.ty)});
          }
          return Ty<Out>::union_of(std::move(variants));
        } else if constexpr (std::is_same_v<N, TupleNode<Ref>>) {
          std::vector<Out> fields;
          fields.reserve(node.fields.size());
          for (const auto& field : node.fields) {
            fields.push_back(fn(field));
          }
          return Ty<Out>::tuple(std::move(fields));
        } else if constexpr (std::is_same_v<N, StructNode<Ref>>) {
          std::vector<Field<Out>> fields;
          fields.reserve(node.fields.size());
          for (const auto& field : node.fields) {
            fields.push_back(Field<Out>{field.name, fn(field.ty)});
          }
          return Ty<Out>::composition(std::move(fields));
        } else if constexpr (std::is_same_v<N, ArrayNode<Ref>>) {
          return Ty<Out>::array(fn(node.ty), node.len);
        } else if constexpr (std::is_same_v<N, ListNode<Ref>>) {
          return Ty<Out>::list(fn(node.ty), node.sizing);
        } else if constexpr (std::is_same_v<N, SetNode<Ref>>) {
          return Ty<Out>::set(fn(node.ty), node.sizing);
        } else if constexpr (std::is_same_v<N, MapNode<Ref>>) {
          auto key = fn(node.key);
          auto value = fn(node.value);
          return Ty<Out>::map(std::move(key), std::move(value), node.sizing);
        } else if constexpr (std::is_same_v<N, OptionNode<Ref>>) {
          return Ty<Out>::option(fn(node.ty));
        } else {
          return Ty<Out>(rec(node));
        }
      },
      ty.node());
}

}  // namespace st::typesys
