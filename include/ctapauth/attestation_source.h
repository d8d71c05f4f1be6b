#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ctapauth/crypto.h"
#include "ctapauth/ctap_types.h"

namespace ctapauth {

/**
 * Attestation 身份：P-256 私钥 + X.509 证书
 *
 * basic attestation 时用它的私钥签 authData || clientDataHash，
 * 证书放进 attStmt 的 x5c。
 */
class AttestationSource {
 public:
  AttestationSource(ECKeyPair key, Bytes certificate,
                    std::vector<Bytes> ca_certificate_chain = {});

  AttestationSource(const AttestationSource&) = delete;
  AttestationSource& operator=(const AttestationSource&) = delete;
  AttestationSource(AttestationSource&&) = default;
  AttestationSource& operator=(AttestationSource&&) = default;

  // 生成新的密钥和自签名证书，失败抛 CryptoError
  static AttestationSource generate(const std::string& common_name);

  // 从 PEM 文件加载 (私钥必须与证书配对)，失败抛 CryptoError
  static AttestationSource from_pem_files(const std::string& key_path,
                                          const std::string& cert_path);

  int32_t alg() const { return static_cast<int32_t>(CoseAlgorithm::kEs256); }

  // 签名 authData || clientDataHash (DER)，失败抛 CryptoError
  Bytes sign(const Bytes& auth_data, const Bytes& client_data_hash) const;

  const Bytes& certificate() const { return certificate_; }
  const std::vector<Bytes>& ca_certificate_chain() const {
    return ca_certificate_chain_;
  }

 private:
  ECKeyPair key_;
  Bytes certificate_;  // DER
  std::vector<Bytes> ca_certificate_chain_;
};

}  // namespace ctapauth
