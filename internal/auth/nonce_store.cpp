#include "nonce_store.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/service/db_error.hpp"
#include "internal/util/crypto.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace fmd::auth {

using observability::StringField;

namespace {

int64_t CutoffMillis() {
  return util::NowMillis() - std::chrono::duration_cast<std::chrono::milliseconds>(NonceStore::kMaxAge).count();
}

} // namespace

NonceStore::NonceStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string NonceStore::Signature(const std::string& key, const std::string& val) {
  return util::ToHex(util::Md5(key + "." + val));
}

std::string NonceStore::Issue() {
  db::model::NonceRecord record;
  record.key           = util::NewId();
  record.val           = util::NewId();
  record.created_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  service::ThrowIfDbError(repository_->InsertNonce(*tx, record), "issue_nonce", record.key);
  tx->Commit();

  observability::Metrics::Instance().Increment("nonce.issued");
  return record.key + "." + Signature(record.key, record.val);
}

bool NonceStore::VerifyAndConsume(const std::string& nonce) {
  auto tx = repository_->Begin();
  service::ThrowIfDbError(repository_->DeleteNoncesOlderThan(*tx, CutoffMillis()), "purge_nonces", {});

  const auto dot = nonce.find('.');
  if (dot == std::string::npos) {
    tx->Commit();
    FMD_LOG_WARN("auth", "invalid nonce", {StringField("nonce", nonce)});
    observability::Metrics::Instance().Increment("nonce.rejected");
    return false;
  }

  const std::string key = nonce.substr(0, dot);
  const std::string sig = nonce.substr(dot + 1);

  auto val = repository_->TakeNonce(*tx, key);
  // the row is gone from here on, matched or not
  tx->Commit();

  if (!val.has_value() || !util::ConstantTimeEquals(Signature(key, *val), sig)) {
    observability::Metrics::Instance().Increment("nonce.rejected");
    return false;
  }
  return true;
}

uint64_t NonceStore::PurgeExpired() {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteNoncesOlderThan(*tx, CutoffMillis());
  service::ThrowIfDbError(result, "purge_nonces", {});
  tx->Commit();

  if (result.rows > 0) {
    observability::Metrics::Instance().Increment("gc.nonces.deleted", static_cast<int64_t>(result.rows));
  }
  return result.rows;
}

} // namespace fmd::auth
