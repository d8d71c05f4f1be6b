#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "ctapauth/ctap_types.h"

namespace ctapauth {

/**
 * 协议层看到的凭据引擎接口
 *
 * 所有操作失败时抛 CtapError 或其子类：
 * - 凭据不存在: CtapError(kNoCredentials)
 * - 存储失败: StorageError
 * - 随机数、密钥生成或签名失败: CryptoError
 */
class SecretStore {
 public:
  virtual ~SecretStore() = default;

  // 为 (算法, RP, 用户) 生成新的凭据，每次调用都是独立的新密钥
  virtual CredentialHandle make_credential(
      const PublicKeyCredentialParameters& params, const std::string& rp_id,
      const UserEntity& user, bool discoverable) = 0;

  // 注册签名: authData 带 attested credential data
  virtual std::pair<AuthenticatorData, AttestationStatement> attest(
      const std::string& rp_id, const CredentialHandle& handle,
      const Bytes& client_data_hash, bool user_present,
      bool user_verified) = 0;

  // 认证签名: 用凭据自己的私钥，authData 不带 attested credential data
  virtual std::pair<AuthenticatorData, Bytes> assert_credential(
      const std::string& rp_id, const CredentialHandle& handle,
      const Bytes& client_data_hash, bool user_present,
      bool user_verified) = 0;

  virtual std::vector<CredentialHandle> list_discoverable_credentials(
      const std::string& rp_id) = 0;

  virtual std::vector<CredentialHandle> list_specified_credentials(
      const std::string& rp_id,
      const std::vector<PublicKeyCredentialDescriptor>& descriptors) = 0;

  virtual size_t credential_count() = 0;
};

}  // namespace ctapauth
