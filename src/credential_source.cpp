#include "ctapauth/credential_source.h"

#include <openssl/crypto.h>
#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

#include "ctapauth/ctap_error.h"

namespace ctapauth {

CosePublicKey PublicKeyCredentialSource::credential_public_key() const {
  Bytes point = key_.get_public_key();
  if (point.size() != 65) {
    throw CryptoError("无法导出凭据公钥");
  }

  CosePublicKey cose;
  cose.alg = alg();
  cose.x.assign(point.begin() + 1, point.begin() + 33);
  cose.y.assign(point.begin() + 33, point.end());
  return cose;
}

Bytes PublicKeyCredentialSource::sign(const Bytes& auth_data,
                                      const Bytes& client_data_hash) const {
  // 签名数据: authData || clientDataHash
  Bytes to_sign;
  to_sign.reserve(auth_data.size() + client_data_hash.size());
  to_sign.insert(to_sign.end(), auth_data.begin(), auth_data.end());
  to_sign.insert(to_sign.end(), client_data_hash.begin(),
                 client_data_hash.end());

  Bytes signature = key_.sign(to_sign);
  if (signature.empty()) {
    throw CryptoError("凭据签名失败");
  }
  return signature;
}

PrivateKeyCredentialSource PrivateKeyCredentialSource::generate(
    const PublicKeyCredentialParameters& params, const std::string& rp_id,
    const UserEntity& user, const Bytes& credential_id, bool discoverable) {
  if (params.type != kPublicKeyType ||
      params.alg != static_cast<int32_t>(CoseAlgorithm::kEs256)) {
    throw CtapError(CtapStatus::kUnsupportedAlgorithm,
                    "不支持的算法: " + std::to_string(params.alg));
  }

  ECKeyPair key_pair;
  if (!key_pair.generate()) {
    throw CryptoError("生成凭据密钥对失败");
  }

  PrivateKeyCredentialSource source;
  source.alg = params.alg;
  source.rp_id = rp_id;
  source.user = user;
  source.credential_id = credential_id;
  source.private_key = key_pair.get_private_key();
  source.discoverable = discoverable;
  if (source.private_key.size() != 32) {
    OPENSSL_cleanse(source.private_key.data(), source.private_key.size());
    throw CryptoError("无法导出凭据私钥");
  }
  return source;
}

CredentialHandle PrivateKeyCredentialSource::handle() const {
  CredentialHandle handle;
  handle.descriptor.type = kPublicKeyType;
  handle.descriptor.id = credential_id;
  handle.rp_id = rp_id;
  handle.user = user;
  handle.discoverable = discoverable;
  return handle;
}

PublicKeyCredentialSource PrivateKeyCredentialSource::to_public() const {
  ECKeyPair key_pair;
  if (!key_pair.set_private_key(private_key)) {
    spdlog::error("Store: 凭据 {} 的私钥无法恢复",
                  spdlog::to_hex(credential_id.begin(),
                                 credential_id.begin() +
                                     std::min<size_t>(8, credential_id.size())));
    throw CryptoError("凭据私钥无效");
  }
  return PublicKeyCredentialSource(std::move(key_pair));
}

}  // namespace ctapauth
