#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "ctapauth/attestation_source.h"
#include "ctapauth/credential_source.h"
#include "ctapauth/credential_storage.h"
#include "ctapauth/secret_store.h"

namespace ctapauth {

// attestation 签名方式
enum class AttestationMode {
  kBasic,  // attestation 私钥签名，attStmt 带 x5c
  kSelf,   // 凭据私钥签名，不带 x5c
};

/**
 * 软件凭据引擎
 *
 * 存储、attestation 密钥和随机数源由同一把互斥锁保护，
 * 每个操作 (生成、持久化、签名) 在一个临界区内完成。
 * 调用方必须在进入这里之前完成用户在场确认。
 */
class SoftwareCryptoStore : public SecretStore {
 public:
  SoftwareCryptoStore(std::unique_ptr<CredentialStorage> storage,
                      AttestationSource attestation, Bytes aaguid,
                      AttestationMode mode = AttestationMode::kBasic);

  CredentialHandle make_credential(const PublicKeyCredentialParameters& params,
                                   const std::string& rp_id,
                                   const UserEntity& user,
                                   bool discoverable) override;

  std::pair<AuthenticatorData, AttestationStatement> attest(
      const std::string& rp_id, const CredentialHandle& handle,
      const Bytes& client_data_hash, bool user_present,
      bool user_verified) override;

  std::pair<AuthenticatorData, Bytes> assert_credential(
      const std::string& rp_id, const CredentialHandle& handle,
      const Bytes& client_data_hash, bool user_present,
      bool user_verified) override;

  std::vector<CredentialHandle> list_discoverable_credentials(
      const std::string& rp_id) override;

  std::vector<CredentialHandle> list_specified_credentials(
      const std::string& rp_id,
      const std::vector<PublicKeyCredentialDescriptor>& descriptors) override;

  size_t credential_count() override;

 private:
  // 以下函数要求调用方已持有 mutex_

  // 查找记录并把签名计数器加一后写回，不存在时抛 kNoCredentials
  PrivateKeyCredentialSource next_use(const std::string& rp_id,
                                      const CredentialHandle& handle);
  void store(const PrivateKeyCredentialSource& record);
  Bytes new_credential_id();

  std::mutex mutex_;
  std::unique_ptr<CredentialStorage> storage_;
  AttestationSource attestation_;
  Bytes aaguid_;
  AttestationMode mode_;
};

}  // namespace ctapauth
