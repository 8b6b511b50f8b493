#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace fmd::db { class Repository; }

namespace fmd::auth {

/*
  Server-issued single-use nonces.

  Issue() stores a random (key, val) pair and hands out
  "key.hex(md5(key.val))". VerifyAndConsume() deletes the row it looks
  up whether or not the checksum matches, so every nonce string is
  checked at most once.

  The MD5 checksum only detects corrupted or hand-edited nonce strings;
  it is not a security boundary. Replay protection comes from the row
  being deleted on first use.
*/
class NonceStore {
 public:
  static constexpr std::chrono::minutes kMaxAge{5};

  explicit NonceStore(std::shared_ptr<db::Repository> repository);

  std::string Issue();

  // true exactly once for a nonce returned by Issue() within kMaxAge.
  // Malformed, unknown, expired, reused or tampered -> false.
  // Throws util::Error(Storage|Timeout) when the store fails.
  bool VerifyAndConsume(const std::string& nonce);

  // Deletes nonces older than kMaxAge. Returns rows removed.
  uint64_t PurgeExpired();

  static std::string Signature(const std::string& key, const std::string& val);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace fmd::auth
