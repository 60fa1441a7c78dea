#include "typesys/commit.hpp"

#include <stdexcept>

#include <openssl/evp.h>

extern "C" {
#include <blake3.h>
}

namespace st::typesys {
namespace {

auto check(int rc, const char* what) -> void {
  if (rc != 1) {
    throw std::runtime_error(what);
  }
}

}  // namespace

auto sha256(std::span<const std::uint8_t> payload) -> Bytes32 {
  Bytes32 digest{};
  unsigned int len = 0;
  check(EVP_Digest(payload.data(), payload.size(), digest.data(), &len, EVP_sha256(), nullptr),
        "EVP_Digest(sha256) failed");
  return digest;
}

auto CommitEngine::CtxDeleter::operator()(evp_md_ctx_st* ctx) const -> void {
  EVP_MD_CTX_free(ctx);
}

CommitEngine::CommitEngine(std::string_view tag) : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  check(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr), "EVP_DigestInit_ex failed");
  const auto tag_hash = sha256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(tag.data()), tag.size()));
  commit(tag_hash);
  commit(tag_hash);
}

CommitEngine::~CommitEngine() = default;

auto CommitEngine::commit(std::span<const std::uint8_t> bytes) -> void {
  check(EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()), "EVP_DigestUpdate failed");
}

auto CommitEngine::commit_u24(std::uint32_t value) -> void {
  std::array<std::uint8_t, 3> bytes{
      static_cast<std::uint8_t>(value & 0xFFu),
      static_cast<std::uint8_t>((value >> 8) & 0xFFu),
      static_cast<std::uint8_t>((value >> 16) & 0xFFu)};
  commit(bytes);
}

auto CommitEngine::commit_u32(std::uint32_t value) -> void {
  std::array<std::uint8_t, 4> bytes{
      static_cast<std::uint8_t>(value & 0xFFu),
      static_cast<std::uint8_t>((value >> 8) & 0xFFu),
      static_cast<std::uint8_t>((value >> 16) & 0xFFu),
      static_cast<std::uint8_t>((value >> 24) & 0xFFu)};
  commit(bytes);
}

auto CommitEngine::finish() && -> Bytes32 {
  Bytes32 digest{};
  unsigned int len = 0;
  check(EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len), "EVP_DigestFinal_ex failed");
  ctx_.reset();
  return digest;
}

auto blake3_keyed(const Bytes32& key, std::span<const std::uint8_t> payload,
                  std::span<std::uint8_t> out) -> void {
  blake3_hasher hasher;
  blake3_hasher_init_keyed(&hasher, key.data());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  blake3_hasher_finalize(&hasher, out.data(), out.size());
}

auto blake3(std::span<const std::uint8_t> payload) -> Bytes32 {
  Bytes32 digest{};
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

}  // namespace st::typesys
