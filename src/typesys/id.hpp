#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "typesys/baid58.hpp"
#include "typesys/commit.hpp"
#include "typesys/encoding.hpp"
#include "typesys/error.hpp"

namespace st::typesys {

struct SemIdTag {
  static constexpr std::string_view kHri = "semid";
  static constexpr std::string_view kCommitTag = "urn:ubideco:strict-types:typ:v01";
};

struct ShapeIdTag {
  static constexpr std::string_view kHri = "shape";
  static constexpr std::string_view kCommitTag = "urn:ubideco:strict-types:shp:v01";
};

struct TypeLibIdTag {
  static constexpr std::string_view kHri = "stl";
  static constexpr std::string_view kCommitTag = "urn:ubideco:strict-types:lib:v01";
};

struct TypeSysIdTag {
  static constexpr std::string_view kHri = "sts";
  static constexpr std::string_view kCommitTag = "urn:ubideco:strict-types:sys:v02";
};

/// 32-byte content identity. Every id kind is a distinct instantiation, so a
/// semantic id can never be passed where a system id is expected.
template <typename Tag>
class Id {
 public:
  using TagType = Tag;

  Id() = default;
  explicit Id(const Bytes32& bytes) : bytes_(bytes) {}

  auto bytes() const -> const Bytes32& { return bytes_; }

  auto operator<=>(const Id&) const = default;

  /// Start a commitment under this id kind's tag.
  static auto engine() -> CommitEngine { return CommitEngine(Tag::kCommitTag); }

  static auto commit(std::span<const std::uint8_t> content) -> Id {
    auto hasher = engine();
    hasher.commit(content);
    return Id(std::move(hasher).finish());
  }

  auto to_hex() const -> std::string {
    std::string out;
    out.reserve(bytes_.size() * 2);
    for (auto byte : bytes_) {
      fmt::format_to(std::back_inserter(out), "{:02x}", byte);
    }
    return out;
  }

  static auto from_hex(std::string_view hex) -> Expected<Id> {
    if (hex.size() != 64) {
      return tl::unexpected(make_error(
          ErrorKind::IdParse, fmt::format("hex identifier must be 64 chars, got {}", hex.size())));
    }
    Bytes32 bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      auto hi = hex_digit(hex[2 * i]);
      auto lo = hex_digit(hex[2 * i + 1]);
      if (hi < 0 || lo < 0) {
        return tl::unexpected(make_error(
            ErrorKind::IdParse, fmt::format("invalid hex digit in identifier '{}'", hex)));
      }
      bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return Id(bytes);
  }

  /// Checksummed base58 without prefix or mnemonic.
  auto to_baid58() const -> std::string { return baid58::encode(Tag::kHri, bytes_); }

  auto mnemonic() const -> std::string {
    return baid58::mnemonic(baid58::checksum(Tag::kHri, bytes_));
  }

  /// Full `urn:ubideco:<hri>:<baid58>#<mnemonic>` form.
  auto to_string() const -> std::string { return baid58::encode_urn(Tag::kHri, bytes_); }

  static auto parse(std::string_view text) -> Expected<Id> {
    auto bytes = baid58::decode(Tag::kHri, text);
    if (!bytes) {
      return tl::unexpected(bytes.error());
    }
    return Id(*bytes);
  }

 private:
  static auto hex_digit(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  Bytes32 bytes_{};
};

using SemId = Id<SemIdTag>;
using ShapeId = Id<ShapeIdTag>;
using TypeLibId = Id<TypeLibIdTag>;
using TypeSysId = Id<TypeSysIdTag>;

}  // namespace st::typesys

template <typename Tag>
struct fmt::formatter<st::typesys::Id<Tag>> : fmt::formatter<std::string_view> {
  auto format(const st::typesys::Id<Tag>& id, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(id.to_string(), ctx);
  }
};
