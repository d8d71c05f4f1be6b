#include "ctapauth/factory.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>

#include "ctapauth/ctap_error.h"
#include "ctapauth/pam_auth.h"
#include "ctapauth/sealed_storage.h"
#include "ctapauth/software_crypto_store.h"
#include "ctapauth/tpm_sealer.h"

namespace ctapauth {

AttestationSource create_attestation_source(const AuthenticatorConfig& config) {
  if (config.attestation_key_path.empty() !=
      config.attestation_cert_path.empty()) {
    throw CryptoError("attestation 私钥和证书必须同时配置");
  }
  if (!config.attestation_key_path.empty()) {
    return AttestationSource::from_pem_files(config.attestation_key_path,
                                             config.attestation_cert_path);
  }
  return AttestationSource::generate(config.attestation_common_name);
}

std::unique_ptr<CredentialStorage> create_storage(
    const AuthenticatorConfig& config) {
  std::string path = config.storage_path.empty() ? default_storage_path()
                                                 : config.storage_path;

  std::unique_ptr<Sealer> sealer;
  if (config.use_tpm) {
    auto tpm = std::make_unique<TpmSealer>();
    if (tpm->initialize()) {
      sealer = std::move(tpm);
    } else if (config.require_tpm) {
      throw StorageError("TPM 不可用: " + tpm->last_error());
    } else {
      spdlog::warn("TPM 存储不可用: {}，凭据将以明文保存", tpm->last_error());
    }
  } else if (config.require_tpm) {
    throw StorageError("配置要求 TPM，但 use_tpm 为 false");
  }

  if (!sealer) {
    sealer = std::make_unique<PlainSealer>();
  }

  spdlog::info("Store: 凭据文件 {}", path);
  return std::make_unique<SealedFileStorage>(path, std::move(sealer));
}

std::unique_ptr<UserPresence> create_user_presence(
    const AuthenticatorConfig& config) {
  spdlog::info("PAM 验证: {}", config.use_pam ? "启用" : "禁用");
  if (config.use_pam) {
    spdlog::info("PAM 服务: {}", config.pam_service);
  } else {
    spdlog::info("默认结果: {}",
                 config.default_presence_result ? "允许" : "拒绝");
  }
  return std::make_unique<PamUserPresence>(
      config.pam_service, config.use_pam, config.default_presence_result,
      config.pam_timeout_seconds);
}

std::unique_ptr<Authenticator> create_authenticator(
    const AuthenticatorConfig& config) {
  if (config.aaguid.size() != kAaguidLength) {
    throw CtapError(CtapStatus::kOther, "AAGUID 必须是 16 字节");
  }

  auto store = std::make_unique<SoftwareCryptoStore>(
      create_storage(config), create_attestation_source(config), config.aaguid,
      config.attestation_mode);

  return std::make_unique<Authenticator>(std::move(store),
                                         create_user_presence(config),
                                         config.aaguid);
}

}  // namespace ctapauth
