#include "typesys/armor.hpp"

#include <openssl/evp.h>

#include <fmt/format.h>

namespace st::typesys::armor {
namespace {

constexpr std::size_t kLineWidth = 64;

auto decode_error(std::string message) -> tl::unexpected<TypeError> {
  return tl::unexpected(make_error(ErrorKind::Decode, std::move(message)));
}

auto trim(std::string_view line) -> std::string_view {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.remove_suffix(1);
  }
  while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
    line.remove_prefix(1);
  }
  return line;
}

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    auto pos = text.find('\n');
    lines.push_back(trim(text.substr(0, pos)));
    if (pos == std::string_view::npos) {
      break;
    }
    text.remove_prefix(pos + 1);
  }
  return lines;
}

}  // namespace

auto base64_encode(std::span<const std::uint8_t> bytes) -> std::string {
  if (bytes.empty()) {
    return {};
  }
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                      static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

auto base64_decode(std::string_view text) -> Expected<Bytes> {
  if (text.empty()) {
    return Bytes{};
  }
  if (text.size() % 4 != 0) {
    return decode_error(fmt::format("base64 input length {} is not a multiple of 4", text.size()));
  }
  Bytes out(text.size() / 4 * 3);
  const int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (written < 0) {
    return decode_error("invalid base64 data");
  }
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

auto wrap(std::string_view label, const std::vector<Header>& headers,
          std::span<const std::uint8_t> bytes) -> std::string {
  std::string out = fmt::format("-----BEGIN {}-----\n", label);
  for (const auto& header : headers) {
    out += fmt::format("{}: {}\n", header.name, header.value);
  }
  out += '\n';
  const auto encoded = base64_encode(bytes);
  for (std::size_t pos = 0; pos < encoded.size(); pos += kLineWidth) {
    out += encoded.substr(pos, kLineWidth);
    out += '\n';
  }
  out += fmt::format("\n-----END {}-----\n", label);
  return out;
}

auto Block::header(std::string_view name) const -> const std::string* {
  for (const auto& header : headers) {
    if (header.name == name) {
      return &header.value;
    }
  }
  return nullptr;
}

auto unwrap(std::string_view label, std::string_view text) -> Expected<Block> {
  const auto begin = fmt::format("-----BEGIN {}-----", label);
  const auto end = fmt::format("-----END {}-----", label);
  auto lines = split_lines(text);

  std::size_t i = 0;
  while (i < lines.size() && lines[i].empty()) {
    ++i;
  }
  if (i == lines.size() || lines[i] != begin) {
    return decode_error(fmt::format("missing '{}' marker", begin));
  }
  ++i;

  Block block;
  for (; i < lines.size() && !lines[i].empty(); ++i) {
    auto colon = lines[i].find(':');
    if (colon == std::string_view::npos) {
      return decode_error(fmt::format("malformed armor header '{}'", lines[i]));
    }
    block.headers.push_back(Header{std::string(trim(lines[i].substr(0, colon))),
                                   std::string(trim(lines[i].substr(colon + 1)))});
  }

  std::string payload;
  bool closed = false;
  for (; i < lines.size(); ++i) {
    if (lines[i] == end) {
      closed = true;
      break;
    }
    payload += lines[i];
  }
  if (!closed) {
    return decode_error(fmt::format("missing '{}' marker", end));
  }

  auto data = base64_decode(payload);
  if (!data) {
    return tl::unexpected(data.error());
  }
  block.data = std::move(*data);
  return block;
}

}  // namespace st::typesys::armor
