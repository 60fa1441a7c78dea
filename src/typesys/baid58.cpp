#include "typesys/baid58.hpp"

#include <algorithm>
#include <tuple>
#include <vector>

#include <fmt/format.h>

#include "typesys/commit.hpp"

namespace st::typesys::baid58 {
namespace {

constexpr std::string_view kAlphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr std::string_view kConsonants = "bdfghjklmnprstvz";
constexpr std::string_view kVowels = "aiou";

auto as_bytes(std::string_view text) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

auto proquint(std::uint16_t word) -> std::string {
  std::string out;
  out.push_back(kConsonants[(word >> 12) & 0x0F]);
  out.push_back(kVowels[(word >> 10) & 0x03]);
  out.push_back(kConsonants[(word >> 6) & 0x0F]);
  out.push_back(kVowels[(word >> 4) & 0x03]);
  out.push_back(kConsonants[word & 0x0F]);
  return out;
}

auto parse_error(std::string message) -> tl::unexpected<TypeError> {
  return tl::unexpected(make_error(ErrorKind::IdParse, std::move(message)));
}

}  // namespace

auto base58_encode(std::span<const std::uint8_t> bytes) -> std::string {
  std::size_t zeros = 0;
  while (zeros < bytes.size() && bytes[zeros] == 0) {
    ++zeros;
  }

  // Base-58 digits, least significant first.
  std::vector<std::uint8_t> digits;
  digits.reserve(bytes.size() * 138 / 100 + 1);
  for (std::size_t i = zeros; i < bytes.size(); ++i) {
    std::uint32_t carry = bytes[i];
    for (auto& digit : digits) {
      carry += static_cast<std::uint32_t>(digit) << 8;
      digit = static_cast<std::uint8_t>(carry % 58);
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(static_cast<std::uint8_t>(carry % 58));
      carry /= 58;
    }
  }

  std::string out(zeros, kAlphabet[0]);
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    out.push_back(kAlphabet[*it]);
  }
  return out;
}

auto base58_decode(std::string_view text) -> Expected<Bytes> {
  std::size_t ones = 0;
  while (ones < text.size() && text[ones] == kAlphabet[0]) {
    ++ones;
  }

  // Base-256 digits, least significant first.
  std::vector<std::uint8_t> bytes;
  for (std::size_t i = ones; i < text.size(); ++i) {
    auto pos = kAlphabet.find(text[i]);
    if (pos == std::string_view::npos) {
      return parse_error(fmt::format("invalid base58 character '{}' at position {}", text[i], i));
    }
    auto carry = static_cast<std::uint32_t>(pos);
    for (auto& byte : bytes) {
      carry += static_cast<std::uint32_t>(byte) * 58;
      byte = static_cast<std::uint8_t>(carry & 0xFFu);
      carry >>= 8;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<std::uint8_t>(carry & 0xFFu));
      carry >>= 8;
    }
  }

  Bytes out(ones, 0);
  out.insert(out.end(), bytes.rbegin(), bytes.rend());
  return out;
}

auto checksum(std::string_view hri, const Bytes32& payload) -> Checksum {
  const auto key = blake3(as_bytes(hri));
  Checksum out{};
  blake3_keyed(key, payload, out);
  return out;
}

auto mnemonic(const Checksum& checksum) -> std::string {
  auto hi = static_cast<std::uint16_t>((checksum[0] << 8) | checksum[1]);
  auto lo = static_cast<std::uint16_t>((checksum[2] << 8) | checksum[3]);
  return proquint(hi) + "-" + proquint(lo);
}

auto encode(std::string_view hri, const Bytes32& payload) -> std::string {
  Bytes data(payload.begin(), payload.end());
  const auto sum = checksum(hri, payload);
  data.insert(data.end(), sum.begin(), sum.end());
  return base58_encode(data);
}

auto encode_urn(std::string_view hri, const Bytes32& payload) -> std::string {
  return fmt::format("{}{}:{}#{}", kUrnPrefix, hri, encode(hri, payload),
                     mnemonic(checksum(hri, payload)));
}

auto decode(std::string_view hri, std::string_view text) -> Expected<Bytes32> {
  if (text.starts_with(kUrnPrefix)) {
    text.remove_prefix(kUrnPrefix.size());
  }
  if (auto colon = text.find(':'); colon != std::string_view::npos) {
    auto found = text.substr(0, colon);
    if (found != hri) {
      return parse_error(fmt::format("unexpected identifier prefix '{}', expected '{}'", found, hri));
    }
    text.remove_prefix(colon + 1);
  }

  std::string_view words;
  if (auto hash = text.find('#'); hash != std::string_view::npos) {
    words = text.substr(hash + 1);
    text = text.substr(0, hash);
  }
  if (text.empty()) {
    return parse_error("empty identifier");
  }

  auto data = base58_decode(text);
  if (!data) {
    return tl::unexpected(data.error());
  }
  constexpr std::size_t kExpected = 32 + std::tuple_size_v<Checksum>;
  if (data->size() != kExpected) {
    return parse_error(
        fmt::format("identifier decodes to {} bytes instead of {}", data->size(), kExpected));
  }

  Bytes32 payload{};
  std::copy_n(data->begin(), payload.size(), payload.begin());
  Checksum found{};
  std::copy_n(data->begin() + static_cast<std::ptrdiff_t>(payload.size()), found.size(),
              found.begin());

  const auto expected = checksum(hri, payload);
  if (found != expected) {
    return parse_error(fmt::format("checksum mismatch in identifier '{}'", text));
  }
  if (!words.empty() && words != mnemonic(expected)) {
    return parse_error(fmt::format("mnemonic '{}' does not match the identifier checksum", words));
  }
  return payload;
}

}  // namespace st::typesys::baid58
