#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "ctapauth/credential_storage.h"

namespace ctapauth {

// 内存中的凭据存储 (测试使用，也是 SealedFileStorage 的工作副本)
class MemoryCredentialStorage : public CredentialStorage {
 public:
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
    return records_.count(credential_id) > 0;
  }

  size_t count() const override { return records_.size(); }

  // 全部记录，按创建顺序
  std::vector<PrivateKeyCredentialSource> records() const;

  // 用持久化的记录重建存储和索引
  void restore(const std::vector<PrivateKeyCredentialSource>& records);

 private:
  void put(PrivateKeyCredentialSource record, bool discoverable);

  using IndexKey = std::pair<std::string, Bytes>;  // (rp_id, user handle)

  std::map<Bytes, PrivateKeyCredentialSource> records_;
  std::map<IndexKey, Bytes> discoverable_index_;
  uint64_t next_order_ = 1;
};

}  // namespace ctapauth
