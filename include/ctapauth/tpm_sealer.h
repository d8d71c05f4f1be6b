#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ctapauth/sealed_storage.h"

struct ESYS_CONTEXT;

namespace ctapauth {

constexpr size_t kSealKeySize = 32;  // AES-256
constexpr size_t kSealIvSize = 12;
constexpr size_t kSealTagSize = 16;

// 封装 blob 的各个部分；key_public/key_private 是 Tss2_MU 序列化后的
// TPM2B_PUBLIC / TPM2B_PRIVATE
struct SealedBlob {
  std::vector<uint8_t> key_public;
  std::vector<uint8_t> key_private;
  std::vector<uint8_t> iv;
  std::vector<uint8_t> tag;
  std::vector<uint8_t> ciphertext;
};

std::vector<uint8_t> encode_sealed_blob(const SealedBlob& blob);

// 长度不符、被截断或末尾有多余数据时返回 nullopt
std::optional<SealedBlob> decode_sealed_blob(const std::vector<uint8_t>& data);

// 用 blob.iv 加密，写入 blob.ciphertext 和 blob.tag
bool aes_gcm_encrypt(const std::vector<uint8_t>& key,
                     const std::vector<uint8_t>& plaintext, SealedBlob& blob);

// tag 校验失败 (数据被篡改或密钥不对) 时返回 nullopt
std::optional<std::vector<uint8_t>> aes_gcm_decrypt(
    const std::vector<uint8_t>& key, const SealedBlob& blob);

/**
 * TPM 2.0 封装 (混合加密)
 *
 * 每次 seal 生成新的 AES-256 数据密钥，把它作为 keyed-hash 对象
 * 封装到 owner hierarchy 下的 ECC P-256 存储主密钥，数据本身用
 * AES-256-GCM 加密。数据密钥离开 TPM 时只以封装形式存在。
 *
 * blob 格式 (长度字段 big-endian):
 *   pub_len(4) | pub | priv_len(4) | priv | iv(12) | tag(16) |
 *   cipher_len(4) | cipher
 */
class TpmSealer : public Sealer {
 public:
  TpmSealer() = default;
  ~TpmSealer() override;

  TpmSealer(const TpmSealer&) = delete;
  TpmSealer& operator=(const TpmSealer&) = delete;

  // 连接 TPM 并创建主密钥，TPM 不可用时返回 false
  bool initialize();

  bool is_available() const { return primary_ != 0; }

  std::optional<std::vector<uint8_t>> seal(
      const std::vector<uint8_t>& data) override;

  std::optional<std::vector<uint8_t>> unseal(
      const std::vector<uint8_t>& blob) override;

  const std::string& last_error() const override { return last_error_; }

 private:
  bool fail(const std::string& message);
  void close();

  ESYS_CONTEXT* esys_ = nullptr;
  uint32_t primary_ = 0;  // ESYS_TR，0 表示未初始化
  std::string last_error_;
};

}  // namespace ctapauth
