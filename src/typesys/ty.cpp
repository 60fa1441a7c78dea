#include "typesys/ty.hpp"

#include <stdexcept>

namespace st::typesys {
namespace {

template <typename IdT>
auto write_ref(StrictWriter& writer, const IdT& id) -> void {
  writer.write_bytes32(id.bytes());
}

auto write_sizing(StrictWriter& writer, const Sizing& sizing) -> void {
  writer.write_u16(sizing.min);
  writer.write_u16(sizing.max);
}

auto read_ref(StrictReader& reader) -> SemId { return SemId(reader.read_bytes32()); }

auto read_sizing(StrictReader& reader) -> Sizing {
  Sizing sizing;
  sizing.min = reader.read_u16();
  sizing.max = reader.read_u16();
  return sizing;
}

auto read_name(StrictReader& reader) -> FieldName {
  auto raw = reader.read_tiny_string();
  if (reader.failed()) {
    return FieldName::from("failed");
  }
  auto name = Ident::parse(raw);
  if (!name) {
    reader.fail(name.error().message);
    return FieldName::from("failed");
  }
  return std::move(*name);
}

}  // namespace

auto Primitive::to_string() const -> std::string {
  if (code_ == prim::kUnit.code()) {
    return "()";
  }
  if (code_ == prim::kByte.code()) {
    return "Byte";
  }
  const auto bits = static_cast<unsigned>(size()) * 8;
  switch (cls()) {
    case NumCls::Unsigned:
      return fmt::format("U{}", bits);
    case NumCls::Signed:
      return fmt::format("I{}", bits);
    case NumCls::NonZero:
      return fmt::format("N{}", bits);
    case NumCls::Float:
      return fmt::format("F{}", bits);
  }
  return fmt::format("Primitive({:#04x})", code_);
}

auto to_string(TyKind kind) -> std::string_view {
  switch (kind) {
    case TyKind::Primitive:
      return "primitive";
    case TyKind::Unicode:
      return "unicode";
    case TyKind::Enum:
      return "enum";
    case TyKind::Union:
      return "union";
    case TyKind::Tuple:
      return "tuple";
    case TyKind::Struct:
      return "rec";
    case TyKind::Array:
      return "array";
    case TyKind::List:
      return "list";
    case TyKind::Set:
      return "set";
    case TyKind::Map:
      return "map";
    case TyKind::Option:
      return "option";
    case TyKind::Recursive:
      return "recursive";
  }
  return "unknown";
}

template <typename IdT>
auto encode_ty(StrictWriter& writer, const Ty<IdT>& ty, EncodeMode mode) -> void {
  writer.write_u8(static_cast<std::uint8_t>(ty.kind()));
  std::visit(
      [&](const auto& node) {
        using N = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<N, PrimitiveNode>) {
          writer.write_u8(node.prim.code());
        } else if constexpr (std::is_same_v<N, UnicodeNode>) {
          // no payload
        } else if constexpr (std::is_same_v<N, EnumNode>) {
          writer.write_len_u8(node.variants.size());
          for (const auto& variant : node.variants) {
            writer.write_tiny_string(variant.name.str());
            writer.write_u8(variant.tag);
          }
        } else if constexpr (std::is_same_v<N, UnionNode<IdT>>) {
          writer.write_len_u8(node.variants.size());
          for (const auto& variant : node.variants) {
            writer.write_tiny_string(variant.name.str());
            writer.write_u8(variant.tag);
            write_ref(writer, variant.ty);
          }
        } else if constexpr (std::is_same_v<N, TupleNode<IdT>>) {
          writer.write_len_u8(node.fields.size());
          for (const auto& field : node.fields) {
            write_ref(writer, field);
          }
        } else if constexpr (std::is_same_v<N, StructNode<IdT>>) {
          writer.write_len_u8(node.fields.size());
          for (const auto& field : node.fields) {
            writer.write_tiny_string(field.name.str());
            write_ref(writer, field.ty);
          }
        } else if constexpr (std::is_same_v<N, ArrayNode<IdT>>) {
          write_ref(writer, node.ty);
          writer.write_u16(node.len);
        } else if constexpr (std::is_same_v<N, ListNode<IdT>> || std::is_same_v<N, SetNode<IdT>>) {
          write_ref(writer, node.ty);
          write_sizing(writer, node.sizing);
        } else if constexpr (std::is_same_v<N, MapNode<IdT>>) {
          write_ref(writer, node.key);
          write_ref(writer, node.value);
          write_sizing(writer, node.sizing);
        } else if constexpr (std::is_same_v<N, OptionNode<IdT>>) {
          write_ref(writer, node.ty);
        } else if constexpr (std::is_same_v<N, RecursiveNode<IdT>>) {
          if constexpr (std::is_same_v<IdT, SemId>) {
            if (mode == EncodeMode::Persist) {
              write_ref(writer, node.target);
            }
            write_ref(writer, node.shape);
          } else {
            write_ref(writer, node.target);
          }
        }
      },
      ty.node());
}

template auto encode_ty<SemId>(StrictWriter&, const Ty<SemId>&, EncodeMode) -> void;
template auto encode_ty<ShapeId>(StrictWriter&, const Ty<ShapeId>&, EncodeMode) -> void;

auto decode_ty(StrictReader& reader) -> Ty<SemId> {
  const auto placeholder = Ty<SemId>::unit();
  const auto tag = reader.read_u8();
  if (reader.failed()) {
    return placeholder;
  }
  if (tag > static_cast<std::uint8_t>(TyKind::Recursive)) {
    reader.fail(fmt::format("unknown type kind {:#04x}", tag));
    return placeholder;
  }

  switch (static_cast<TyKind>(tag)) {
    case TyKind::Primitive:
      return Ty<SemId>::primitive(Primitive(reader.read_u8()));
    case TyKind::Unicode:
      return Ty<SemId>::unicode();
    case TyKind::Enum: {
      std::vector<EnumVariant> variants;
      const auto count = reader.read_u8();
      for (std::uint8_t i = 0; i < count && !reader.failed(); ++i) {
        auto name = read_name(reader);
        auto variant_tag = reader.read_u8();
        variants.push_back(EnumVariant{std::move(name), variant_tag});
      }
      return Ty<SemId>::enumerate(std::move(variants));
    }
    case TyKind::Union: {
      std::vector<Variant<SemId>> variants;
      const auto count = reader.read_u8();
      for (std::uint8_t i = 0; i < count && !reader.failed(); ++i) {
        auto name = read_name(reader);
        auto variant_tag = reader.read_u8();
        auto ref = read_ref(reader);
        variants.push_back(Variant<SemId>{std::move(name), variant_tag, ref});
      }
      return Ty<SemId>::union_of(std::move(variants));
    }
    case TyKind::Tuple: {
      std::vector<SemId> fields;
      const auto count = reader.read_u8();
      for (std::uint8_t i = 0; i < count && !reader.failed(); ++i) {
        fields.push_back(read_ref(reader));
      }
      return Ty<SemId>::tuple(std::move(fields));
    }
    case TyKind::Struct: {
      std::vector<Field<SemId>> fields;
      const auto count = reader.read_u8();
      for (std::uint8_t i = 0; i < count && !reader.failed(); ++i) {
        auto name = read_name(reader);
        auto ref = read_ref(reader);
        fields.push_back(Field<SemId>{std::move(name), ref});
      }
      return Ty<SemId>::composition(std::move(fields));
    }
    case TyKind::Array: {
      auto ref = read_ref(reader);
      auto len = reader.read_u16();
      return Ty<SemId>::array(ref, len);
    }
    case TyKind::List: {
      auto ref = read_ref(reader);
      return Ty<SemId>::list(ref, read_sizing(reader));
    }
    case TyKind::Set: {
      auto ref = read_ref(reader);
      return Ty<SemId>::set(ref, read_sizing(reader));
    }
    case TyKind::Map: {
      auto key = read_ref(reader);
      auto value = read_ref(reader);
      return Ty<SemId>::map(key, value, read_sizing(reader));
    }
    case TyKind::Option:
      return Ty<SemId>::option(read_ref(reader));
    case TyKind::Recursive: {
      auto target = read_ref(reader);
      auto shape = ShapeId(reader.read_bytes32());
      return Ty<SemId>(RecursiveNode<SemId>{target, shape});
    }
  }
  return placeholder;
}

auto compute_sem_id(const Ty<SemId>& ty) -> SemId {
  StrictWriter writer;
  encode_ty(writer, ty, EncodeMode::Commit);
  auto bytes = std::move(writer).finish();
  if (!bytes) {
    // Only reachable for a type with more than 255 members, which every
    // constructor path rejects before an id is requested.
    throw std::logic_error("type commitment failed: " + bytes.error().message);
  }
  return SemId::commit(*bytes);
}

auto compute_shape_id(const Ty<ShapeId>& ty) -> ShapeId {
  StrictWriter writer;
  encode_ty(writer, ty, EncodeMode::Commit);
  auto bytes = std::move(writer).finish();
  if (!bytes) {
    throw std::logic_error("type shape commitment failed: " + bytes.error().message);
  }
  return ShapeId::commit(*bytes);
}

}  // namespace st::typesys
