#include "typesys/type_lib.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "typesys/armor.hpp"

namespace st::typesys {
namespace {

constexpr std::string_view kArmorLabel = "STRICT TYPE LIB";

auto write_fqn(StrictWriter& writer, const TypeFqn& fqn) -> void {
  writer.write_tiny_string(fqn.lib.str());
  writer.write_tiny_string(fqn.name.str());
}

auto read_ident(StrictReader& reader) -> std::optional<Ident> {
  auto raw = reader.read_tiny_string();
  if (reader.failed()) {
    return std::nullopt;
  }
  auto ident = Ident::parse(raw);
  if (!ident) {
    reader.fail(ident.error().message);
    return std::nullopt;
  }
  return std::move(*ident);
}

// Header shared by the persisted form and the id commitment.
auto write_head(StrictWriter& writer, const LibName& name,
                const std::map<LibName, TypeLibId>& dependencies) -> void {
  writer.write_tiny_string(name.str());
  writer.write_len_u8(dependencies.size());
  for (const auto& [dep_name, dep_id] : dependencies) {
    writer.write_tiny_string(dep_name.str());
    writer.write_bytes32(dep_id.bytes());
  }
}

}  // namespace

TypeLib::TypeLib(LibName name, std::map<LibName, TypeLibId> dependencies, LibTypes types)
    : name_(std::move(name)), dependencies_(std::move(dependencies)), types_(std::move(types)) {}

auto TypeLib::exports() const -> std::map<TypeName, SemId> {
  std::map<TypeName, SemId> out;
  for (const auto& [id, sym] : types_) {
    for (const auto& fqn : sym.names) {
      if (fqn.lib == name_) {
        out.emplace(fqn.name, id);
      }
    }
  }
  return out;
}

auto TypeLib::lookup(const TypeName& name) const -> const SemId* {
  for (const auto& [id, sym] : types_) {
    if (sym.names.contains(TypeFqn{name_, name})) {
      return &id;
    }
  }
  return nullptr;
}

auto TypeLib::id() const -> TypeLibId {
  StrictWriter writer;
  write_head(writer, name_, dependencies_);
  writer.write_len_u16(types_.size());
  for (const auto& [id, sym] : types_) {
    writer.write_bytes32(id.bytes());
    writer.write_len_u8(sym.names.size());
    for (const auto& fqn : sym.names) {
      write_fqn(writer, fqn);
    }
  }
  auto bytes = std::move(writer).finish();
  if (!bytes) {
    throw std::logic_error("library commitment failed: " + bytes.error().message);
  }
  return TypeLibId::commit(*bytes);
}

auto TypeLib::to_dependency() const -> Dependency { return Dependency{name_, id(), exports()}; }

auto TypeLib::to_string() const -> std::string {
  std::map<SemId, std::string> names;
  for (const auto& [id, sym] : types_) {
    for (const auto& fqn : sym.names) {
      if (fqn.lib == name_) {
        names.emplace(id, fqn.name.str());
        break;
      }
    }
  }
  auto render = [&](const SemId& id) -> std::string {
    auto it = names.find(id);
    return it == names.end() ? id.to_string() : it->second;
  };

  std::string out = fmt::format("typelib {} -- {}\n", name_, id());
  for (const auto& [dep_name, dep_id] : dependencies_) {
    out += fmt::format("import {} -- {}\n", dep_name, dep_id);
  }
  out += '\n';
  for (const auto& [id, sym] : types_) {
    out += fmt::format("data {} :: {}\n", render(id), sym.ty.to_string(render));
  }
  return out;
}

auto TypeLib::encode() const -> Expected<Bytes> {
  StrictWriter writer(kU24Max);
  write_head(writer, name_, dependencies_);
  writer.write_len_u16(types_.size());
  for (const auto& [id, sym] : types_) {
    writer.write_bytes32(id.bytes());
    encode_ty(writer, sym.ty, EncodeMode::Persist);
    writer.write_len_u8(sym.names.size());
    for (const auto& fqn : sym.names) {
      write_fqn(writer, fqn);
    }
  }
  return std::move(writer).finish();
}

auto TypeLib::decode(std::span<const std::uint8_t> bytes) -> Expected<TypeLib> {
  StrictReader reader(bytes);
  auto name = read_ident(reader);

  std::map<LibName, TypeLibId> dependencies;
  const auto dep_count = reader.read_u8();
  for (std::uint8_t i = 0; i < dep_count && !reader.failed(); ++i) {
    auto dep_name = read_ident(reader);
    auto dep_id = TypeLibId(reader.read_bytes32());
    if (dep_name && !dependencies.emplace(std::move(*dep_name), dep_id).second) {
      reader.fail("duplicate library dependency");
    }
  }

  LibTypes types;
  const auto type_count = reader.read_u16();
  std::optional<SemId> last;
  for (std::uint16_t i = 0; i < type_count && !reader.failed(); ++i) {
    auto id = SemId(reader.read_bytes32());
    auto ty = decode_ty(reader);
    std::set<TypeFqn> names;
    const auto name_count = reader.read_u8();
    for (std::uint8_t n = 0; n < name_count && !reader.failed(); ++n) {
      auto lib = read_ident(reader);
      auto type_name = read_ident(reader);
      if (lib && type_name) {
        names.insert(TypeFqn{std::move(*lib), std::move(*type_name)});
      }
    }
    if (reader.failed()) {
      break;
    }
    if (last && !(*last < id)) {
      reader.fail(fmt::format("library members are not in ascending id order at {}", id));
      break;
    }
    if (compute_sem_id(ty) != id) {
      reader.fail(fmt::format("member {} does not match its type structure", id));
      break;
    }
    last = id;
    auto inserted = types.insert(id, SymTy{std::move(ty), std::move(names)});
    if (!inserted) {
      return tl::unexpected(inserted.error());
    }
  }

  if (auto done = reader.finish(); !done) {
    return tl::unexpected(done.error());
  }
  return TypeLib(std::move(*name), std::move(dependencies), std::move(types));
}

auto TypeLib::to_armored() const -> Expected<std::string> {
  auto bytes = encode();
  if (!bytes) {
    return tl::unexpected(bytes.error());
  }
  std::vector<armor::Header> headers{{"Id", id().to_string()}, {"Name", name_.str()}};
  for (const auto& [dep_name, dep_id] : dependencies_) {
    headers.push_back({"Dependency", fmt::format("{} {}", dep_name, dep_id)});
  }
  return armor::wrap(kArmorLabel, headers, *bytes);
}

auto TypeLib::from_armored(std::string_view text) -> Expected<TypeLib> {
  auto block = armor::unwrap(kArmorLabel, text);
  if (!block) {
    return tl::unexpected(block.error());
  }
  auto lib = decode(block->data);
  if (!lib) {
    return tl::unexpected(lib.error());
  }
  if (const auto* header = block->header("Id")) {
    auto expected_id = TypeLibId::parse(*header);
    if (!expected_id) {
      return tl::unexpected(expected_id.error());
    }
    if (*expected_id != lib->id()) {
      return tl::unexpected(make_error(
          ErrorKind::Decode,
          fmt::format("armored library id {} does not match its content {}", *header, lib->id())));
    }
  }
  return lib;
}

}  // namespace st::typesys
