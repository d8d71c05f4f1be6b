#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ctapauth/attestation_source.h"
#include "ctapauth/authenticator.h"
#include "ctapauth/crypto.h"
#include "ctapauth/ctap_error.h"
#include "ctapauth/memory_storage.h"
#include "ctapauth/sealed_storage.h"
#include "ctapauth/software_crypto_store.h"
#include "ctapauth/user_presence.h"

namespace ctapauth {
namespace test {

inline const Bytes kTestAaguid = {'C', 'T', 'A', 'P', 'A', 'U', 'T', 'H',
                                  'T', 'E', 'S', 'T', 'K', 'E', 'Y', '1'};

// 预设答案的在场确认，记录调用次数
class ScriptedUserPresence : public UserPresence {
 public:
  struct State {
    bool answer = true;
    bool fail = false;  // true 时抛 PresenceError
    int make_credential_calls = 0;
    int get_assertion_calls = 0;
    int wink_calls = 0;
    std::string last_display_name;
    std::string last_rp_id;
  };

  explicit ScriptedUserPresence(std::shared_ptr<State> state)
      : state_(std::move(state)) {}

  bool approve_make_credential(const std::string& display_name) override {
    state_->make_credential_calls++;
    state_->last_display_name = display_name;
    if (state_->fail) throw PresenceError("presence backend offline");
    return state_->answer;
  }

  bool approve_get_assertion(const std::string& rp_id) override {
    state_->get_assertion_calls++;
    state_->last_rp_id = rp_id;
    if (state_->fail) throw PresenceError("presence backend offline");
    return state_->answer;
  }

  void wink() override {
    state_->wink_calls++;
    if (state_->fail) throw PresenceError("wink failed");
  }

 private:
  std::shared_ptr<State> state_;
};

// 总是失败的 sealer
class FailingSealer : public Sealer {
 public:
  std::optional<std::vector<uint8_t>> seal(
      const std::vector<uint8_t>&) override {
    return std::nullopt;
  }
  std::optional<std::vector<uint8_t>> unseal(
      const std::vector<uint8_t>&) override {
    return std::nullopt;
  }
  const std::string& last_error() const override { return error_; }

 private:
  std::string error_ = "sealer unavailable";
};

// 测试用 storage：可以在写入时注入失败
class FlakyStorage : public MemoryCredentialStorage {
 public:
  void put_discoverable(const PrivateKeyCredentialSource& record) override {
    if (fail_writes) throw StorageError("disk full");
    MemoryCredentialStorage::put_discoverable(record);
  }
  void put_non_discoverable(const PrivateKeyCredentialSource& record) override {
    if (fail_writes) throw StorageError("disk full");
    MemoryCredentialStorage::put_non_discoverable(record);
  }

  bool fail_writes = false;
};

inline Bytes client_data_hash(uint8_t seed = 0x42) {
  return Bytes(kClientDataHashLength, seed);
}

inline MakeCredentialCommand make_credential_command(
    const std::string& rp_id = "example.com", const Bytes& user_id = {0x01}) {
  MakeCredentialCommand command;
  command.client_data_hash = client_data_hash();
  command.rp.id = rp_id;
  command.rp.name = "Example";
  command.user.id = user_id;
  command.user.name = "alice";
  command.user.display_name = "Alice";
  command.pub_key_cred_params = {PublicKeyCredentialParameters::es256()};
  return command;
}

inline GetAssertionCommand get_assertion_command(
    const std::string& rp_id = "example.com") {
  GetAssertionCommand command;
  command.rp_id = rp_id;
  command.client_data_hash = client_data_hash(0x24);
  return command;
}

inline Bytes concat(const Bytes& a, const Bytes& b) {
  Bytes out = a;
  out.insert(out.end(), b.begin(), b.end());
  return out;
}

// 用未压缩公钥验证 ECDSA 签名
inline bool verify_signature(const Bytes& public_key, const Bytes& data,
                             const Bytes& signature) {
  ECKeyPair key;
  return key.set_public_key(public_key) && key.verify(data, signature);
}

inline std::unique_ptr<SoftwareCryptoStore> make_store(
    std::unique_ptr<CredentialStorage> storage =
        std::make_unique<MemoryCredentialStorage>(),
    AttestationMode mode = AttestationMode::kBasic) {
  return std::make_unique<SoftwareCryptoStore>(
      std::move(storage), AttestationSource::generate("ctapauth test"),
      kTestAaguid, mode);
}

}  // namespace test
}  // namespace ctapauth
