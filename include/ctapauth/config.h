#pragma once

#include <spdlog/spdlog.h>

#include <string>

#include "ctapauth/ctap_types.h"
#include "ctapauth/software_crypto_store.h"

namespace ctapauth {

// 默认 AAGUID
inline constexpr char kDefaultAaguid[] = "CTAPAUTHSOFTKEY1";

struct AuthenticatorConfig {
  // 16 字节
  Bytes aaguid = Bytes(kDefaultAaguid, kDefaultAaguid + kAaguidLength);

  // Attestation
  AttestationMode attestation_mode = AttestationMode::kBasic;
  std::string attestation_key_path;   // PEM，空则启动时生成
  std::string attestation_cert_path;  // PEM
  std::string attestation_common_name = "ctapauth Soft Authenticator";

  // 用户在场确认
  std::string pam_service = "ctapauth";
  bool use_pam = true;
  bool default_presence_result = false;  // PAM 禁用时的结果
  int pam_timeout_seconds = 0;           // 0 = 不设超时，在调用线程上等待

  // 凭据存储
  std::string storage_path;  // 空则使用 default_storage_path()
  bool use_tpm = true;
  bool require_tpm = false;  // TPM 不可用时启动失败，而不是退回明文
};

// $HOME/.local/share/ctapauth/credentials.sealed
std::string default_storage_path();

// 设置日志格式和级别
void init_logging(spdlog::level::level_enum level = spdlog::level::info);

}  // namespace ctapauth
