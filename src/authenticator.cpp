#include "ctapauth/authenticator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "ctapauth/ctap_error.h"

#ifndef CTAPAUTH_VERSION_MAJOR
#define CTAPAUTH_VERSION_MAJOR 0
#endif
#ifndef CTAPAUTH_VERSION_MINOR
#define CTAPAUTH_VERSION_MINOR 0
#endif
#ifndef CTAPAUTH_VERSION_PATCH
#define CTAPAUTH_VERSION_PATCH 0
#endif

namespace ctapauth {

Authenticator::Authenticator(std::unique_ptr<SecretStore> store,
                             std::unique_ptr<UserPresence> presence,
                             Bytes aaguid)
    : store_(std::move(store)),
      presence_(std::move(presence)),
      aaguid_(std::move(aaguid)) {
  if (!store_ || !presence_) {
    throw CtapError(CtapStatus::kOther, "Authenticator 缺少 store 或 presence");
  }
}

MakeCredentialResponse Authenticator::make_credential(
    const MakeCredentialCommand& command) {
  spdlog::debug("CTAP2: 处理 authenticatorMakeCredential (rp={})",
                command.rp.id);

  // 1. 不支持任何 PIN/UV auth 协议
  if (command.pin_uv_auth_param) {
    spdlog::warn("CTAP2: 不支持 pinUvAuthParam");
    throw CtapError(CtapStatus::kInvalidParameter, "不支持 pinUvAuthParam");
  }

  // 2. 选择第一个支持的算法
  auto param = std::find_if(
      command.pub_key_cred_params.begin(), command.pub_key_cred_params.end(),
      [](const PublicKeyCredentialParameters& p) {
        return p.type == kPublicKeyType &&
               p.alg == static_cast<int32_t>(CoseAlgorithm::kEs256);
      });
  if (param == command.pub_key_cred_params.end()) {
    spdlog::warn("CTAP2: 没有支持的算法 (仅支持 ES256)");
    throw CtapError(CtapStatus::kUnsupportedAlgorithm, "没有支持的算法");
  }

  // 3. 本设备不做用户验证
  bool user_verified = false;
  bool user_present = false;

  // options
  bool discoverable = true;
  if (command.options) {
    CommandOptions options = CommandOptions::from_map(*command.options);
    if (options.uv.value_or(false)) {
      throw CtapError(CtapStatus::kInvalidOption, "不支持 uv");
    }
    if (!options.up.value_or(true)) {
      throw CtapError(CtapStatus::kInvalidOption, "makeCredential 不允许 up=false");
    }
    discoverable = options.rk.value_or(true);
  }

  // 4. 不支持 enterprise attestation
  if (command.enterprise_attestation) {
    spdlog::warn("CTAP2: 不支持 enterpriseAttestation");
    throw CtapError(CtapStatus::kInvalidParameter,
                    "不支持 enterpriseAttestation");
  }

  // 5. 不支持 excludeList
  if (command.exclude_list) {
    spdlog::warn("CTAP2: 不支持 excludeList");
    throw CtapError(CtapStatus::kInvalidParameter, "不支持 excludeList");
  }

  // 6. 用户在场确认 (在引擎的锁之外)
  const std::string& display_name =
      command.rp.name.empty() ? command.rp.id : command.rp.name;
  if (!presence_->approve_make_credential(display_name)) {
    spdlog::info("CTAP2: 用户拒绝创建凭据");
    throw CtapError(CtapStatus::kOperationDenied, "用户拒绝");
  }
  user_present = true;

  // 7. 生成凭据
  CredentialHandle handle = store_->make_credential(*param, command.rp.id,
                                                    command.user, discoverable);

  // 8. attestation
  auto [auth_data, att_stmt] =
      store_->attest(command.rp.id, handle, command.client_data_hash,
                     user_present, user_verified);

  spdlog::info("CTAP2: 凭据创建成功 (rp={})", command.rp.id);
  return MakeCredentialResponse{std::move(auth_data), std::move(att_stmt)};
}

GetAssertionResponse Authenticator::get_assertion(
    const GetAssertionCommand& command) {
  spdlog::debug("CTAP2: 处理 authenticatorGetAssertion (rp={})", command.rp_id);

  // 1. 不支持任何 PIN/UV auth 协议
  if (command.pin_uv_auth_param) {
    throw CtapError(CtapStatus::kInvalidParameter, "不支持 pinUvAuthParam");
  }

  // 2. options
  bool want_presence = true;
  if (command.options) {
    CommandOptions options = CommandOptions::from_map(*command.options);
    if (options.rk) {
      throw CtapError(CtapStatus::kUnsupportedOption,
                      "getAssertion 不支持 rk");
    }
    if (options.uv.value_or(false)) {
      throw CtapError(CtapStatus::kInvalidOption, "不支持 uv");
    }
    want_presence = options.up.value_or(true);
  }

  // 3. 选择凭据
  std::vector<CredentialHandle> candidates;
  if (command.allow_list) {
    candidates =
        store_->list_specified_credentials(command.rp_id, *command.allow_list);
    spdlog::debug("CTAP2: allowList 中 {} / {} 个凭据可用", candidates.size(),
                  command.allow_list->size());
  } else {
    candidates = store_->list_discoverable_credentials(command.rp_id);
    spdlog::debug("CTAP2: {} 个 discoverable 凭据", candidates.size());
  }

  if (candidates.empty()) {
    spdlog::warn("CTAP2: 没有匹配的凭据 (rp={})", command.rp_id);
    throw CtapError(CtapStatus::kNoCredentials, "没有匹配的凭据");
  }
  const CredentialHandle& selected = candidates.front();

  // 4. 用户在场确认
  bool user_present = false;
  if (want_presence) {
    if (!presence_->approve_get_assertion(command.rp_id)) {
      spdlog::info("CTAP2: 用户拒绝认证");
      throw CtapError(CtapStatus::kOperationDenied, "用户拒绝");
    }
    user_present = true;
  }

  // 5. 用凭据私钥签名
  auto [auth_data, signature] = store_->assert_credential(
      command.rp_id, selected, command.client_data_hash, user_present, false);

  GetAssertionResponse response;
  response.credential = selected.descriptor;
  response.auth_data = std::move(auth_data);
  response.signature = std::move(signature);
  if (selected.discoverable) {
    response.user = selected.user;
  }

  spdlog::info("CTAP2: 认证成功 (rp={})", command.rp_id);
  return response;
}

GetInfoResponse Authenticator::get_info() const {
  GetInfoResponse info;
  info.versions = {"FIDO_2_1", "U2F_V2"};
  info.aaguid = aaguid_;
  info.options = {{"rk", true}, {"up", true}, {"plat", false}};
  info.algorithms = {PublicKeyCredentialParameters::es256()};
  info.remaining_discoverable_credentials = 0;
  return info;
}

void Authenticator::wink() { presence_->wink(); }

VersionInfo Authenticator::version() const {
  VersionInfo info;
  info.version_major = CTAPAUTH_VERSION_MAJOR;
  info.version_minor = CTAPAUTH_VERSION_MINOR;
  info.version_build = CTAPAUTH_VERSION_PATCH;
  info.wink_supported = true;
  return info;
}

}  // namespace ctapauth
