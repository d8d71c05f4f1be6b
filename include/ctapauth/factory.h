#pragma once

#include <memory>

#include "ctapauth/attestation_source.h"
#include "ctapauth/authenticator.h"
#include "ctapauth/config.h"
#include "ctapauth/credential_storage.h"
#include "ctapauth/user_presence.h"

namespace ctapauth {

// 按配置组装各个组件，失败时抛 CtapError 的子类

AttestationSource create_attestation_source(const AuthenticatorConfig& config);

std::unique_ptr<CredentialStorage> create_storage(
    const AuthenticatorConfig& config);

std::unique_ptr<UserPresence> create_user_presence(
    const AuthenticatorConfig& config);

std::unique_ptr<Authenticator> create_authenticator(
    const AuthenticatorConfig& config);

}  // namespace ctapauth
