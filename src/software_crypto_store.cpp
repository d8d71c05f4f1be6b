#include "ctapauth/software_crypto_store.h"

#include <openssl/crypto.h>
#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "ctapauth/crypto.h"
#include "ctapauth/ctap_error.h"

namespace ctapauth {

static constexpr size_t kCredentialIdLength = 32;
static constexpr int kCredentialIdAttempts = 4;

// 日志里只打印 credential id 的前 8 字节
static auto short_id(const Bytes& id) {
  return spdlog::to_hex(id.begin(), id.begin() + std::min<size_t>(8, id.size()));
}

SoftwareCryptoStore::SoftwareCryptoStore(
    std::unique_ptr<CredentialStorage> storage, AttestationSource attestation,
    Bytes aaguid, AttestationMode mode)
    : storage_(std::move(storage)),
      attestation_(std::move(attestation)),
      aaguid_(std::move(aaguid)),
      mode_(mode) {
  if (!storage_) {
    throw StorageError("未提供凭据存储");
  }
  if (aaguid_.size() != kAaguidLength) {
    throw CtapError(CtapStatus::kOther, "AAGUID 必须是 16 字节");
  }
}

Bytes SoftwareCryptoStore::new_credential_id() {
  for (int attempt = 0; attempt < kCredentialIdAttempts; attempt++) {
    Bytes id = CryptoUtils::random_bytes(kCredentialIdLength);
    if (id.size() != kCredentialIdLength) {
      throw CryptoError("生成 credential id 失败 (随机数源不可用)");
    }
    if (!storage_->contains(id)) {
      return id;
    }
    spdlog::warn("Store: credential id 冲突，重新生成");
  }
  throw CryptoError("无法生成唯一的 credential id");
}

void SoftwareCryptoStore::store(const PrivateKeyCredentialSource& record) {
  if (record.discoverable) {
    storage_->put_discoverable(record);
  } else {
    storage_->put_non_discoverable(record);
  }
}

PrivateKeyCredentialSource SoftwareCryptoStore::next_use(
    const std::string& rp_id, const CredentialHandle& handle) {
  CredentialHandle lookup = handle;
  lookup.rp_id = rp_id;

  auto record = storage_->get(lookup);
  if (!record) {
    spdlog::warn("Store: 凭据不存在 (rp={}, id={})", rp_id,
                 short_id(handle.descriptor.id));
    throw CtapError(CtapStatus::kNoCredentials, "凭据不存在");
  }

  // 计数器先持久化再签名
  record->sign_count++;
  store(*record);
  return std::move(*record);
}

CredentialHandle SoftwareCryptoStore::make_credential(
    const PublicKeyCredentialParameters& params, const std::string& rp_id,
    const UserEntity& user, bool discoverable) {
  std::lock_guard<std::mutex> lock(mutex_);

  Bytes credential_id = new_credential_id();
  auto record = PrivateKeyCredentialSource::generate(params, rp_id, user,
                                                     credential_id,
                                                     discoverable);
  try {
    store(record);
  } catch (const StorageError&) {
    OPENSSL_cleanse(record.private_key.data(), record.private_key.size());
    throw;
  }

  spdlog::info("Store: 已创建凭据 rp={}, user={}, discoverable={}", rp_id,
               user.name, discoverable);
  spdlog::debug("Store: credential id {}", short_id(credential_id));

  CredentialHandle handle = record.handle();
  OPENSSL_cleanse(record.private_key.data(), record.private_key.size());
  return handle;
}

std::pair<AuthenticatorData, AttestationStatement> SoftwareCryptoStore::attest(
    const std::string& rp_id, const CredentialHandle& handle,
    const Bytes& client_data_hash, bool user_present, bool user_verified) {
  std::lock_guard<std::mutex> lock(mutex_);

  PrivateKeyCredentialSource record = next_use(rp_id, handle);
  PublicKeyCredentialSource credential = record.to_public();
  OPENSSL_cleanse(record.private_key.data(), record.private_key.size());

  AuthenticatorData auth_data;
  auth_data.rp_id_hash = CryptoUtils::sha256(rp_id);
  auth_data.user_present = user_present;
  auth_data.user_verified = user_verified;
  auth_data.sign_count = record.sign_count;
  auth_data.attested_credential_data =
      AttestedCredentialData{aaguid_, record.credential_id,
                             credential.credential_public_key()};

  Bytes auth_data_bytes = auth_data.to_bytes();

  AttestationStatement statement;
  if (mode_ == AttestationMode::kBasic) {
    statement.alg = attestation_.alg();
    statement.sig = attestation_.sign(auth_data_bytes, client_data_hash);
    statement.attestation_certificate = attestation_.certificate();
    statement.ca_certificate_chain = attestation_.ca_certificate_chain();
  } else {
    statement.alg = credential.alg();
    statement.sig = credential.sign(auth_data_bytes, client_data_hash);
  }

  spdlog::debug("Store: attestation 完成 (counter={}, {} attestation)",
                record.sign_count,
                mode_ == AttestationMode::kBasic ? "basic" : "self");
  return {std::move(auth_data), std::move(statement)};
}

std::pair<AuthenticatorData, Bytes> SoftwareCryptoStore::assert_credential(
    const std::string& rp_id, const CredentialHandle& handle,
    const Bytes& client_data_hash, bool user_present, bool user_verified) {
  std::lock_guard<std::mutex> lock(mutex_);

  PrivateKeyCredentialSource record = next_use(rp_id, handle);
  PublicKeyCredentialSource credential = record.to_public();
  OPENSSL_cleanse(record.private_key.data(), record.private_key.size());

  AuthenticatorData auth_data;
  auth_data.rp_id_hash = CryptoUtils::sha256(rp_id);
  auth_data.user_present = user_present;
  auth_data.user_verified = user_verified;
  auth_data.sign_count = record.sign_count;

  Bytes signature = credential.sign(auth_data.to_bytes(), client_data_hash);

  spdlog::debug("Store: assertion 完成 (counter={})", record.sign_count);
  return {std::move(auth_data), std::move(signature)};
}

std::vector<CredentialHandle>
SoftwareCryptoStore::list_discoverable_credentials(const std::string& rp_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return storage_->list_discoverable(rp_id);
}

std::vector<CredentialHandle> SoftwareCryptoStore::list_specified_credentials(
    const std::string& rp_id,
    const std::vector<PublicKeyCredentialDescriptor>& descriptors) {
  std::lock_guard<std::mutex> lock(mutex_);
  return storage_->list_specified(rp_id, descriptors);
}

size_t SoftwareCryptoStore::credential_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return storage_->count();
}

}  // namespace ctapauth
