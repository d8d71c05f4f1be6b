#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ctapauth/credential_source.h"
#include "ctapauth/ctap_types.h"

namespace ctapauth {

/**
 * 凭据存储接口
 *
 * 每条记录以 credential id 为键；discoverable 记录另有
 * (rp_id, user handle) 二级索引。写入失败抛 StorageError，
 * 此时存储内容保持不变。
 *
 * 实现本身不加锁，由 Credential Engine 的互斥锁串行化。
 */
class CredentialStorage {
 public:
  virtual ~CredentialStorage() = default;

  // 写入 discoverable 记录，同 id 覆盖
  virtual void put_discoverable(const PrivateKeyCredentialSource& record) = 0;

  // 写入只能通过 allow list 找到的记录，同 id 覆盖
  virtual void put_non_discoverable(
      const PrivateKeyCredentialSource& record) = 0;

  // 按 handle 查找 (id 与 rp_id 都必须匹配)
  virtual std::optional<PrivateKeyCredentialSource> get(
      const CredentialHandle& handle) const = 0;

  // 某个 RP 的 discoverable 凭据，最新创建的在前
  virtual std::vector<CredentialHandle> list_discoverable(
      const std::string& rp_id) const = 0;

  // descriptors 中属于该 RP 且存在于存储中的凭据，保持 descriptors 的顺序
  virtual std::vector<CredentialHandle> list_specified(
      const std::string& rp_id,
      const std::vector<PublicKeyCredentialDescriptor>& descriptors) const = 0;

  // 任意 RP 下是否已有该 credential id
  virtual bool contains(const Bytes& credential_id) const = 0;

  virtual size_t count() const = 0;
};

}  // namespace ctapauth
