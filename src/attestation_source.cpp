#include "ctapauth/attestation_source.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <utility>

#include "ctapauth/ctap_error.h"

namespace ctapauth {

static std::string read_text_file(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw CryptoError("无法打开文件: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

AttestationSource::AttestationSource(ECKeyPair key, Bytes certificate,
                                     std::vector<Bytes> ca_certificate_chain)
    : key_(std::move(key)),
      certificate_(std::move(certificate)),
      ca_certificate_chain_(std::move(ca_certificate_chain)) {}

AttestationSource AttestationSource::generate(const std::string& common_name) {
  spdlog::debug("Attestation: 生成新的 attestation 密钥对...");

  ECKeyPair key;
  if (!key.generate()) {
    throw CryptoError("生成 attestation 密钥对失败");
  }

  Bytes cert = CryptoUtils::generate_self_signed_cert(key, common_name);
  if (cert.empty()) {
    throw CryptoError("生成 attestation 证书失败");
  }

  spdlog::info("Attestation: 已生成自签名证书 CN={} ({} 字节)", common_name,
               cert.size());
  return AttestationSource(std::move(key), std::move(cert));
}

AttestationSource AttestationSource::from_pem_files(
    const std::string& key_path, const std::string& cert_path) {
  ECKeyPair key;
  if (!key.load_private_key_pem(read_text_file(key_path))) {
    throw CryptoError("无法加载 attestation 私钥: " + key_path);
  }

  Bytes cert = CryptoUtils::certificate_pem_to_der(read_text_file(cert_path));
  if (cert.empty()) {
    throw CryptoError("无法加载 attestation 证书: " + cert_path);
  }

  if (!CryptoUtils::certificate_matches_key(cert, key)) {
    throw CryptoError("attestation 证书与私钥不匹配");
  }

  spdlog::info("Attestation: 已从 {} 加载证书", cert_path);
  return AttestationSource(std::move(key), std::move(cert));
}

Bytes AttestationSource::sign(const Bytes& auth_data,
                              const Bytes& client_data_hash) const {
  Bytes to_sign;
  to_sign.reserve(auth_data.size() + client_data_hash.size());
  to_sign.insert(to_sign.end(), auth_data.begin(), auth_data.end());
  to_sign.insert(to_sign.end(), client_data_hash.begin(),
                 client_data_hash.end());

  Bytes signature = key_.sign(to_sign);
  if (signature.empty()) {
    throw CryptoError("attestation 签名失败");
  }
  return signature;
}

}  // namespace ctapauth
