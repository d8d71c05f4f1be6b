#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ctapauth {

using Bytes = std::vector<uint8_t>;

constexpr size_t kAaguidLength = 16;
constexpr size_t kClientDataHashLength = 32;
constexpr size_t kRpIdHashLength = 32;

// WebAuthn: user.id 最长 64 字节；rp.id 是域名，最长 253 字节
constexpr size_t kMaxUserIdLength = 64;
constexpr size_t kMaxRpIdLength = 253;
// rp.name / user.name / user.displayName 超长时截断到 64 字节
constexpr size_t kMaxEntityNameLength = 64;

constexpr const char* kPublicKeyType = "public-key";

// COSE 算法标识 (目前只支持 ES256)
enum class CoseAlgorithm : int32_t {
  kEs256 = -7,
};

struct PublicKeyCredentialParameters {
  std::string type = kPublicKeyType;
  int32_t alg = 0;

  static PublicKeyCredentialParameters es256() {
    return {kPublicKeyType, static_cast<int32_t>(CoseAlgorithm::kEs256)};
  }
};

struct PublicKeyCredentialDescriptor {
  std::string type = kPublicKeyType;
  Bytes id;

  bool operator==(const PublicKeyCredentialDescriptor& other) const {
    return type == other.type && id == other.id;
  }
};

struct RelyingPartyEntity {
  std::string id;
  std::string name;
};

struct UserEntity {
  Bytes id;  // user handle
  std::string name;
  std::string display_name;
};

/**
 * 凭据的轻量引用：公开描述符 + 定位私有记录所需的元数据。
 * 协议层只拿到 handle，永远接触不到私钥。
 */
struct CredentialHandle {
  PublicKeyCredentialDescriptor descriptor;
  std::string rp_id;
  UserEntity user;
  bool discoverable = true;
};

// COSE_Key (EC2 / P-256)
struct CosePublicKey {
  int32_t alg = static_cast<int32_t>(CoseAlgorithm::kEs256);
  Bytes x;  // 32 字节
  Bytes y;  // 32 字节

  // 未压缩点格式: 04 || x || y
  Bytes to_uncompressed_point() const;
};

struct AttestedCredentialData {
  Bytes aaguid;
  Bytes credential_id;
  CosePublicKey credential_public_key;
};

// authenticatorData 的标志位
constexpr uint8_t kFlagUserPresent = 0x01;
constexpr uint8_t kFlagUserVerified = 0x04;
constexpr uint8_t kFlagAttestedCredentialData = 0x40;

/**
 * authenticatorData (WebAuthn §6.1)
 *
 * rpIdHash(32) | flags(1) | signCount(4, big-endian) | [attestedCredentialData]
 *
 * 每次操作新建，构造后不再修改。
 */
struct AuthenticatorData {
  Bytes rp_id_hash;
  bool user_present = false;
  bool user_verified = false;
  uint32_t sign_count = 0;
  std::optional<AttestedCredentialData> attested_credential_data;

  uint8_t flags() const;
  Bytes to_bytes() const;
};

// "packed" 格式的 attestation statement；x5c 为空时为自证明 (self attestation)
struct AttestationStatement {
  std::string fmt = "packed";
  int32_t alg = static_cast<int32_t>(CoseAlgorithm::kEs256);
  Bytes sig;
  Bytes attestation_certificate;
  std::vector<Bytes> ca_certificate_chain;

  bool has_x5c() const { return !attestation_certificate.empty(); }
};

// 请求中可识别的 options 键，未识别的键按不存在处理
struct CommandOptions {
  std::optional<bool> rk;
  std::optional<bool> up;
  std::optional<bool> uv;

  static CommandOptions from_map(const std::map<std::string, bool>& options);
};

struct MakeCredentialCommand {
  Bytes client_data_hash;
  RelyingPartyEntity rp;
  UserEntity user;
  std::vector<PublicKeyCredentialParameters> pub_key_cred_params;
  std::optional<std::vector<PublicKeyCredentialDescriptor>> exclude_list;
  std::map<std::string, int> extensions;  // 忽略
  std::optional<std::map<std::string, bool>> options;
  std::optional<Bytes> pin_uv_auth_param;
  std::optional<int> pin_uv_auth_protocol;
  std::optional<int> enterprise_attestation;
};

struct MakeCredentialResponse {
  AuthenticatorData auth_data;
  AttestationStatement att_stmt;
};

struct GetAssertionCommand {
  std::string rp_id;
  Bytes client_data_hash;
  std::optional<std::vector<PublicKeyCredentialDescriptor>> allow_list;
  std::optional<std::map<std::string, bool>> options;
  std::optional<Bytes> pin_uv_auth_param;
  std::optional<int> pin_uv_auth_protocol;
};

struct GetAssertionResponse {
  PublicKeyCredentialDescriptor credential;
  AuthenticatorData auth_data;
  Bytes signature;
  std::optional<UserEntity> user;  // 仅 discoverable 凭据返回
};

struct GetInfoResponse {
  std::vector<std::string> versions;
  Bytes aaguid;
  std::map<std::string, bool> options;
  std::vector<PublicKeyCredentialParameters> algorithms;
  uint32_t remaining_discoverable_credentials = 0;
};

struct VersionInfo {
  uint32_t version_major = 0;
  uint32_t version_minor = 0;
  uint32_t version_build = 0;
  bool wink_supported = false;
};

}  // namespace ctapauth
