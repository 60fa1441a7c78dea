#include "typesys/type_system.hpp"

#include <optional>
#include <stdexcept>

#include <fmt/format.h>

#include "common/logging/log.hpp"
#include "typesys/armor.hpp"

namespace st::typesys {
namespace {

constexpr std::string_view kArmorLabel = "STRICT TYPE SYSTEM";

auto dangling(const SemId& missing, const SemId& referrer) -> TypeError {
  return make_error(ErrorKind::Completeness,
                    fmt::format("type {} referenced from {} is not present in the type system",
                                missing, referrer));
}

}  // namespace

auto TypeSystem::at(const SemId& id) const -> const Ty<SemId>& {
  const auto* ty = get(id);
  if (ty == nullptr) {
    throw std::out_of_range(fmt::format("type {} is absent from type system {}", id, this->id()));
  }
  return *ty;
}

auto TypeSystem::sem_ids() const -> std::vector<SemId> {
  std::vector<SemId> ids;
  ids.reserve(types_.size());
  for (const auto& [id, ty] : types_) {
    ids.push_back(id);
  }
  return ids;
}

auto TypeSystem::insert_lib(const TypeLibId& id) -> Expected<void> {
  if (!libs_.contains(id) && libs_.size() >= kMaxLibs) {
    return tl::unexpected(make_error(
        ErrorKind::Bounds, fmt::format("type system already holds {} libraries", kMaxLibs)));
  }
  libs_.insert(id);
  return {};
}

auto TypeSystem::id() const -> TypeSysId { return compute_sys_id(*this); }

auto compute_sys_id(const TypeSystem& system) -> TypeSysId {
  auto engine = TypeSysId::engine();
  engine.commit_u32(static_cast<std::uint32_t>(system.count_libs()));
  for (const auto& lib_id : system.lib_ids()) {
    engine.commit(lib_id.bytes());
  }
  engine.commit_u24(static_cast<std::uint32_t>(system.count_types()));
  for (const auto& [id, ty] : system) {
    engine.commit(id.bytes());
  }
  return TypeSysId(std::move(engine).finish());
}

auto TypeSystem::check_completeness() const -> ErrorList {
  ErrorList errors;
  for (const auto& [id, ty] : types_) {
    ty.for_each_child([&](const SemId& child) {
      if (!contains(child)) {
        errors.push_back(dangling(child, id));
      }
    });
    if (const auto* target = ty.recursive_target(); target && !contains(*target)) {
      errors.push_back(dangling(*target, id));
    }
  }
  return errors;
}

auto TypeSystem::encode() const -> Expected<Bytes> {
  StrictWriter writer(kMaxSerializedSize);
  writer.write_len_u16(libs_.size());
  for (const auto& lib_id : libs_) {
    writer.write_bytes32(lib_id.bytes());
  }
  writer.write_len_u24(types_.size());
  for (const auto& [id, ty] : types_) {
    writer.write_bytes32(id.bytes());
    encode_ty(writer, ty, EncodeMode::Persist);
  }
  return std::move(writer).finish();
}

auto TypeSystem::decode(std::span<const std::uint8_t> bytes) -> Expected<TypeSystem> {
  if (bytes.size() > kMaxSerializedSize) {
    return tl::unexpected(make_error(
        ErrorKind::Bounds, fmt::format("serialized type system of {} bytes exceeds the limit of {}",
                                       bytes.size(), kMaxSerializedSize)));
  }
  StrictReader reader(bytes);
  TypeSystem system;

  const auto lib_count = reader.read_u16();
  std::optional<TypeLibId> last_lib;
  for (std::uint16_t i = 0; i < lib_count && !reader.failed(); ++i) {
    auto lib_id = TypeLibId(reader.read_bytes32());
    if (last_lib && !(*last_lib < lib_id)) {
      reader.fail("library ids are not in ascending order");
      break;
    }
    last_lib = lib_id;
    system.libs_.insert(lib_id);
  }

  const auto type_count = reader.read_u24();
  std::optional<SemId> last;
  for (std::uint32_t i = 0; i < type_count && !reader.failed(); ++i) {
    auto id = SemId(reader.read_bytes32());
    auto ty = decode_ty(reader);
    if (reader.failed()) {
      break;
    }
    if (last && !(*last < id)) {
      reader.fail(fmt::format("type ids are not in ascending order at {}", id));
      break;
    }
    if (auto problems = check_ty(ty); !problems.empty()) {
      reader.fail(fmt::format("type {} is malformed: {}", id, problems.front()));
      break;
    }
    if (compute_sem_id(ty) != id) {
      reader.fail(fmt::format("type {} does not match its structure", id));
      break;
    }
    last = id;
    if (auto inserted = system.insert_unchecked(id, std::move(ty)); !inserted) {
      return tl::unexpected(inserted.error());
    }
  }

  if (auto done = reader.finish(); !done) {
    return tl::unexpected(done.error());
  }
  if (auto errors = system.check_completeness(); !errors.empty()) {
    log::warn("decoded type system is incomplete: {} dangling reference(s)", errors.size());
    return tl::unexpected(errors.front());
  }
  return system;
}

auto TypeSystem::to_string() const -> std::string {
  std::string out = fmt::format("typesys -- {}\n\n", id());
  auto render = [](const SemId& id) { return id.to_string(); };
  for (const auto& [id, ty] : types_) {
    out += fmt::format("data {} :: {}\n", id, ty.to_string(render));
  }
  return out;
}

auto TypeSystem::to_armored() const -> Expected<std::string> {
  auto bytes = encode();
  if (!bytes) {
    return tl::unexpected(bytes.error());
  }
  std::vector<armor::Header> headers{armor::Header{"Id", id().to_string()}};
  return armor::wrap(kArmorLabel, headers, *bytes);
}

auto TypeSystem::from_armored(std::string_view text) -> Expected<TypeSystem> {
  auto block = armor::unwrap(kArmorLabel, text);
  if (!block) {
    return tl::unexpected(block.error());
  }
  auto system = decode(block->data);
  if (!system) {
    return tl::unexpected(system.error());
  }
  const auto* header = block->header("Id");
  if (header == nullptr) {
    return tl::unexpected(make_error(ErrorKind::Decode, "armored type system has no Id header"));
  }
  auto expected_id = TypeSysId::parse(*header);
  if (!expected_id) {
    return tl::unexpected(expected_id.error());
  }
  if (*expected_id != system->id()) {
    return tl::unexpected(make_error(
        ErrorKind::Decode, fmt::format("armored type system id {} does not match its content {}",
                                       *header, system->id())));
  }
  return system;
}

}  // namespace st::typesys
