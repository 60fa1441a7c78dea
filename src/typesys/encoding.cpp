#include "typesys/encoding.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace st::typesys {

auto StrictWriter::reserve(std::size_t count) -> bool {
  if (error_) {
    return false;
  }
  if (count > limit_ || bytes_.size() > limit_ - count) {
    fail(ErrorKind::Bounds,
         fmt::format("serialized size exceeds the limit of {} bytes", limit_));
    return false;
  }
  return true;
}

auto StrictWriter::write_u8(std::uint8_t value) -> void {
  if (!reserve(1)) {
    return;
  }
  bytes_.push_back(value);
}

auto StrictWriter::write_u16(std::uint16_t value) -> void {
  if (!reserve(2)) {
    return;
  }
  bytes_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
  bytes_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

auto StrictWriter::write_u24(std::uint32_t value) -> void {
  if (value > kU24Max) {
    fail(ErrorKind::Bounds, fmt::format("value {} does not fit into 24 bits", value));
    return;
  }
  if (!reserve(3)) {
    return;
  }
  bytes_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
  bytes_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
  bytes_.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
}

auto StrictWriter::write_u32(std::uint32_t value) -> void {
  if (!reserve(4)) {
    return;
  }
  std::array<std::uint8_t, 4> bytes{
      static_cast<std::uint8_t>(value & 0xFFu),
      static_cast<std::uint8_t>((value >> 8) & 0xFFu),
      static_cast<std::uint8_t>((value >> 16) & 0xFFu),
      static_cast<std::uint8_t>((value >> 24) & 0xFFu)};
  bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
}

auto StrictWriter::write_bytes(std::span<const std::uint8_t> bytes) -> void {
  if (!reserve(bytes.size())) {
    return;
  }
  bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
}

auto StrictWriter::write_tiny_string(std::string_view value) -> void {
  write_len_u8(value.size());
  if (!reserve(value.size())) {
    return;
  }
  bytes_.insert(bytes_.end(), value.begin(), value.end());
}

auto StrictWriter::write_len_u8(std::size_t len) -> void {
  if (len > 0xFFu) {
    fail(ErrorKind::Bounds, fmt::format("collection of {} items exceeds 255", len));
    return;
  }
  write_u8(static_cast<std::uint8_t>(len));
}

auto StrictWriter::write_len_u16(std::size_t len) -> void {
  if (len > 0xFFFFu) {
    fail(ErrorKind::Bounds, fmt::format("collection of {} items exceeds 65535", len));
    return;
  }
  write_u16(static_cast<std::uint16_t>(len));
}

auto StrictWriter::write_len_u24(std::size_t len) -> void {
  if (len > kU24Max) {
    fail(ErrorKind::Bounds, fmt::format("collection of {} items exceeds {}", len, kU24Max));
    return;
  }
  write_u24(static_cast<std::uint32_t>(len));
}

auto StrictWriter::fail(ErrorKind kind, std::string message) -> void {
  if (!error_) {
    error_ = make_error(kind, std::move(message));
  }
}

auto StrictWriter::finish() && -> Expected<Bytes> {
  if (error_) {
    return tl::unexpected(std::move(*error_));
  }
  return std::move(bytes_);
}

auto StrictReader::take(std::size_t count) -> const std::uint8_t* {
  if (error_) {
    return nullptr;
  }
  if (remaining() < count) {
    fail(fmt::format("unexpected end of data at offset {} (need {} more bytes)", pos_, count));
    return nullptr;
  }
  const auto* ptr = data_.data() + pos_;
  pos_ += count;
  return ptr;
}

auto StrictReader::read_u8() -> std::uint8_t {
  const auto* ptr = take(1);
  return ptr ? ptr[0] : 0;
}

auto StrictReader::read_u16() -> std::uint16_t {
  const auto* ptr = take(2);
  if (!ptr) {
    return 0;
  }
  return static_cast<std::uint16_t>(ptr[0] | (ptr[1] << 8));
}

auto StrictReader::read_u24() -> std::uint32_t {
  const auto* ptr = take(3);
  if (!ptr) {
    return 0;
  }
  return static_cast<std::uint32_t>(ptr[0]) | (static_cast<std::uint32_t>(ptr[1]) << 8) |
         (static_cast<std::uint32_t>(ptr[2]) << 16);
}

auto StrictReader::read_u32() -> std::uint32_t {
  const auto* ptr = take(4);
  if (!ptr) {
    return 0;
  }
  return static_cast<std::uint32_t>(ptr[0]) | (static_cast<std::uint32_t>(ptr[1]) << 8) |
         (static_cast<std::uint32_t>(ptr[2]) << 16) | (static_cast<std::uint32_t>(ptr[3]) << 24);
}

auto StrictReader::read_bytes32() -> Bytes32 {
  Bytes32 out{};
  const auto* ptr = take(out.size());
  if (ptr) {
    std::copy(ptr, ptr + out.size(), out.begin());
  }
  return out;
}

auto StrictReader::read_tiny_string() -> std::string {
  auto len = read_u8();
  const auto* ptr = take(len);
  if (!ptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(ptr), len);
}

auto StrictReader::fail(std::string message) -> void {
  if (!error_) {
    error_ = make_error(ErrorKind::Decode, std::move(message));
  }
}

auto StrictReader::finish() const -> Expected<void> {
  if (error_) {
    return tl::unexpected(*error_);
  }
  if (remaining() != 0) {
    return tl::unexpected(
        make_error(ErrorKind::Decode, fmt::format("{} unparsed trailing bytes", remaining())));
  }
  return {};
}

}  // namespace st::typesys
