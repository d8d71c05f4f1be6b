#pragma once

#include <memory>

#include "ctapauth/ctap_types.h"
#include "ctapauth/secret_store.h"
#include "ctapauth/user_presence.h"

namespace ctapauth {

/**
 * CTAP2 协议编排
 *
 * 按命令逐步校验请求，任一步失败立即抛出对应的 CtapError，
 * 在批准它的那一步之前不产生任何副作用。
 * 用户在场确认总是在调用凭据引擎之前完成，不会在等待用户时持有引擎的锁。
 */
class Authenticator {
 public:
  Authenticator(std::unique_ptr<SecretStore> store,
                std::unique_ptr<UserPresence> presence, Bytes aaguid);

  MakeCredentialResponse make_credential(const MakeCredentialCommand& command);

  GetAssertionResponse get_assertion(const GetAssertionCommand& command);

  GetInfoResponse get_info() const;

  void wink();

  VersionInfo version() const;

  // 测试与诊断用
  SecretStore& store() { return *store_; }

 private:
  std::unique_ptr<SecretStore> store_;
  std::unique_ptr<UserPresence> presence_;
  Bytes aaguid_;
};

}  // namespace ctapauth
