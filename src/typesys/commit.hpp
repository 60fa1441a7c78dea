#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "typesys/encoding.hpp"

struct evp_md_ctx_st;

namespace st::typesys {

/// Plain SHA-256 digest.
auto sha256(std::span<const std::uint8_t> payload) -> Bytes32;

/// Tagged SHA-256 commitment engine.
///
/// The digest is `SHA256(tag_hash || tag_hash || content)` where
/// `tag_hash = SHA256(tag)`, which separates the id spaces of different
/// entity kinds.
class CommitEngine {
 public:
  explicit CommitEngine(std::string_view tag);
  ~CommitEngine();

  CommitEngine(const CommitEngine&) = delete;
  auto operator=(const CommitEngine&) -> CommitEngine& = delete;
  CommitEngine(CommitEngine&&) noexcept = default;
  auto operator=(CommitEngine&&) noexcept -> CommitEngine& = default;

  auto commit(std::span<const std::uint8_t> bytes) -> void;
  auto commit_u24(std::uint32_t value) -> void;
  auto commit_u32(std::uint32_t value) -> void;

  auto finish() && -> Bytes32;

 private:
  struct CtxDeleter {
    auto operator()(evp_md_ctx_st* ctx) const -> void;
  };

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

/// BLAKE3 keyed hash truncated to `out.size()` bytes.
auto blake3_keyed(const Bytes32& key, std::span<const std::uint8_t> payload,
                  std::span<std::uint8_t> out) -> void;

/// Unkeyed BLAKE3 digest.
auto blake3(std::span<const std::uint8_t> payload) -> Bytes32;

}  // namespace st::typesys
