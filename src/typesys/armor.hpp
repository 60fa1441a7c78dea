#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "typesys/encoding.hpp"
#include "typesys/error.hpp"

namespace st::typesys::armor {

/// Header line of an armored block.
struct Header {
  std::string name;
  std::string value;
};

/// Standard base64 of `bytes`.
auto base64_encode(std::span<const std::uint8_t> bytes) -> std::string;
auto base64_decode(std::string_view text) -> Expected<Bytes>;

/// `-----BEGIN <label>-----`, the headers, a blank line, base64 in 64-char
/// lines, a blank line and `-----END <label>-----`.
auto wrap(std::string_view label, const std::vector<Header>& headers,
          std::span<const std::uint8_t> bytes) -> std::string;

struct Block {
  std::vector<Header> headers;
  Bytes data;

  auto header(std::string_view name) const -> const std::string*;
};

/// Reverse of `wrap`. Every failure is a decode error.
auto unwrap(std::string_view label, std::string_view text) -> Expected<Block>;

}  // namespace st::typesys::armor
