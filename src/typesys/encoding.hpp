#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "typesys/error.hpp"

namespace st::typesys {

using Bytes = std::vector<std::uint8_t>;
using Bytes32 = std::array<std::uint8_t, 32>;

inline constexpr std::size_t kNoSizeLimit = std::numeric_limits<std::size_t>::max();
inline constexpr std::uint32_t kU24Max = (1u << 24) - 1;

/// Canonical little-endian writer.
///
/// The writer never throws on oversized input: the first violation is kept and
/// reported by `finish()`, and every later write is ignored.
class StrictWriter {
 public:
  explicit StrictWriter(std::size_t limit = kNoSizeLimit) : limit_(limit) {}

  auto write_u8(std::uint8_t value) -> void;
  auto write_u16(std::uint16_t value) -> void;
  auto write_u24(std::uint32_t value) -> void;
  auto write_u32(std::uint32_t value) -> void;
  auto write_bytes(std::span<const std::uint8_t> bytes) -> void;
  auto write_bytes32(const Bytes32& bytes) -> void { write_bytes(bytes); }

  /// ASCII string prefixed with a single length byte.
  auto write_tiny_string(std::string_view value) -> void;

  /// Collection length prefixes; a length the prefix cannot carry is a bounds error.
  auto write_len_u8(std::size_t len) -> void;
  auto write_len_u16(std::size_t len) -> void;
  auto write_len_u24(std::size_t len) -> void;

  auto fail(ErrorKind kind, std::string message) -> void;
  auto failed() const -> bool { return error_.has_value(); }
  auto size() const -> std::size_t { return bytes_.size(); }

  auto finish() && -> Expected<Bytes>;

 private:
  auto reserve(std::size_t count) -> bool;

  std::size_t limit_;
  Bytes bytes_;
  std::optional<TypeError> error_;
};

/// Reader counterpart of `StrictWriter`. Errors are sticky: after the first
/// failure every read returns zero and `finish()` reports the failure.
class StrictReader {
 public:
  explicit StrictReader(std::span<const std::uint8_t> data) : data_(data) {}

  auto read_u8() -> std::uint8_t;
  auto read_u16() -> std::uint16_t;
  auto read_u24() -> std::uint32_t;
  auto read_u32() -> std::uint32_t;
  auto read_bytes32() -> Bytes32;
  auto read_tiny_string() -> std::string;

  auto fail(std::string message) -> void;
  auto failed() const -> bool { return error_.has_value(); }
  auto remaining() const -> std::size_t { return data_.size() - pos_; }
  auto position() const -> std::size_t { return pos_; }

  /// Succeeds only when no read failed and the whole input was consumed.
  auto finish() const -> Expected<void>;

 private:
  auto take(std::size_t count) -> const std::uint8_t*;

  std::span<const std::uint8_t> data_;
  std::size_t pos_ = 0;
  std::optional<TypeError> error_;
};

}  // namespace st::typesys
