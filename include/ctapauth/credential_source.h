#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "ctapauth/crypto.h"
#include "ctapauth/ctap_types.h"

namespace ctapauth {

// 凭据的签名视图：只暴露 COSE 公钥和签名操作，不暴露私钥字节
class PublicKeyCredentialSource {
 public:
  explicit PublicKeyCredentialSource(ECKeyPair key) : key_(std::move(key)) {}

  int32_t alg() const { return static_cast<int32_t>(CoseAlgorithm::kEs256); }

  // COSE_Key 形式的公钥 (x/y 各 32 字节)
  CosePublicKey credential_public_key() const;

  // 对 authData || clientDataHash 签名 (DER)，失败抛 CryptoError
  Bytes sign(const Bytes& auth_data, const Bytes& client_data_hash) const;

 private:
  ECKeyPair key_;
};

/**
 * 存储中的完整凭据记录 (含私钥)
 *
 * 只在 Credential Engine 的临界区内使用，协议层拿到的是 handle()。
 */
struct PrivateKeyCredentialSource {
  int32_t alg = static_cast<int32_t>(CoseAlgorithm::kEs256);
  std::string rp_id;
  UserEntity user;
  Bytes credential_id;
  Bytes private_key;  // P-256 私钥 (32 字节)
  uint32_t sign_count = 0;
  bool discoverable = true;

  // 创建顺序，由存储在第一次写入时分配，越大越新
  uint64_t creation_order = 0;

  // 为给定参数生成新私钥，失败抛 CryptoError
  static PrivateKeyCredentialSource generate(
      const PublicKeyCredentialParameters& params, const std::string& rp_id,
      const UserEntity& user, const Bytes& credential_id, bool discoverable);

  CredentialHandle handle() const;

  // 从私钥恢复签名视图，私钥损坏时抛 CryptoError
  PublicKeyCredentialSource to_public() const;
};

}  // namespace ctapauth
