#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "typesys/encoding.hpp"
#include "typesys/error.hpp"

namespace st::typesys::baid58 {

/// URN namespace every identity string starts with.
inline constexpr std::string_view kUrnPrefix = "urn:ubideco:";

using Checksum = std::array<std::uint8_t, 4>;

auto base58_encode(std::span<const std::uint8_t> bytes) -> std::string;
auto base58_decode(std::string_view text) -> Expected<Bytes>;

/// First four bytes of BLAKE3(payload) keyed with BLAKE3(hri).
auto checksum(std::string_view hri, const Bytes32& payload) -> Checksum;

/// Proquint words for the checksum, e.g. `lusab-babad`.
auto mnemonic(const Checksum& checksum) -> std::string;

/// `base58(payload || checksum)` without prefix or mnemonic.
auto encode(std::string_view hri, const Bytes32& payload) -> std::string;

/// `urn:ubideco:<hri>:<baid58>#<mnemonic>`.
auto encode_urn(std::string_view hri, const Bytes32& payload) -> std::string;

/// Parse any of `urn:ubideco:<hri>:<baid58>[#mnemonic]`,
/// `<hri>:<baid58>[#mnemonic]` or `<baid58>[#mnemonic]`.
auto decode(std::string_view hri, std::string_view text) -> Expected<Bytes32>;

}  // namespace st::typesys::baid58
