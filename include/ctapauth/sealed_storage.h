#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ctapauth/credential_storage.h"
#include "ctapauth/memory_storage.h"

namespace ctapauth {

/**
 * 数据封装接口：明文进，封装后的 blob 出
 *
 * 与 OpenSSL 包装一样用 optional + last_error() 报告失败，
 * 由 SealedFileStorage 转成 StorageError。
 */
class Sealer {
 public:
  virtual ~Sealer() = default;

  virtual std::optional<std::vector<uint8_t>> seal(
      const std::vector<uint8_t>& data) = 0;

  virtual std::optional<std::vector<uint8_t>> unseal(
      const std::vector<uint8_t>& blob) = 0;

  virtual const std::string& last_error() const = 0;
};

// 不加密，原样存取 (没有 TPM 的机器和测试)
class PlainSealer : public Sealer {
 public:
  std::optional<std::vector<uint8_t>> seal(
      const std::vector<uint8_t>& data) override {
    return data;
  }

  std::optional<std::vector<uint8_t>> unseal(
      const std::vector<uint8_t>& blob) override {
    return blob;
  }

  const std::string& last_error() const override { return last_error_; }

 private:
  std::string last_error_;
};

/**
 * 凭据序列化/反序列化
 *
 * 格式 (版本 2，所有整数 big-endian):
 *   version(1) | count(4) | record...
 *   record = credential_id | private_key | rp_id | user_id | user_name |
 *            user_display_name (各 len(2) + 数据) |
 *            alg(4) | sign_count(4) | discoverable(1) | creation_order(8)
 */
class CredentialSerializer {
 public:
  static constexpr uint8_t kVersion = 2;
  static constexpr size_t kMaxFieldLength = 0xFFFF;

  // 任一字段超过 kMaxFieldLength 时抛 StorageError
  static std::vector<uint8_t> serialize(
      const std::vector<PrivateKeyCredentialSource>& credentials);

  // 格式错误返回 nullopt
  static std::optional<std::vector<PrivateKeyCredentialSource>> deserialize(
      const std::vector<uint8_t>& data);
};

/**
 * 封装文件存储
 *
 * 启动时读入并解封整个文件；每次写入先在副本上修改，
 * 序列化、封装并写盘成功后才替换内存中的状态。
 */
class SealedFileStorage : public CredentialStorage {
 public:
  // 文件存在但无法读取/解封/解析时抛 StorageError
  SealedFileStorage(std::string path, std::unique_ptr<Sealer> sealer);

  void put_discoverable(const PrivateKeyCredentialSource& record) override;
  void put_non_discoverable(const PrivateKeyCredentialSource& record) override;

  std::optional<PrivateKeyCredentialSource> get(
      const CredentialHandle& handle) const override;

  std::vector<CredentialHandle> list_discoverable(
      const std::string& rp_id) const override;

  std::vector<CredentialHandle> list_specified(
      const std::string& rp_id,
      const std::vector<PublicKeyCredentialDescriptor>& descriptors)
      const override;

  bool contains(const Bytes& credential_id) const override {
    return state_.contains(credential_id);
  }

  size_t count() const override { return state_.count(); }

  const std::string& path() const { return path_; }

 private:
  void load();
  void flush(const MemoryCredentialStorage& state);

  std::string path_;
  std::unique_ptr<Sealer> sealer_;
  MemoryCredentialStorage state_;
};

}  // namespace ctapauth
