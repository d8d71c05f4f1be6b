#include "ctapauth/memory_storage.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ctapauth {

void MemoryCredentialStorage::put_discoverable(
    const PrivateKeyCredentialSource& record) {
  put(record, true);
}

void MemoryCredentialStorage::put_non_discoverable(
    const PrivateKeyCredentialSource& record) {
  put(record, false);
}

void MemoryCredentialStorage::put(PrivateKeyCredentialSource record,
                                  bool discoverable) {
  record.discoverable = discoverable;

  // 同 id 覆盖时保留原来的创建顺序
  auto existing = records_.find(record.credential_id);
  if (existing != records_.end()) {
    record.creation_order = existing->second.creation_order;
  } else {
    record.creation_order = next_order_++;
  }

  IndexKey key{record.rp_id, record.user.id};
  auto idx = discoverable_index_.find(key);

  if (discoverable) {
    // 同一 (rp, user) 只索引最新的凭据
    if (idx == discoverable_index_.end()) {
      discoverable_index_.emplace(key, record.credential_id);
    } else {
      auto current = records_.find(idx->second);
      if (current == records_.end() ||
          current->second.creation_order <= record.creation_order) {
        idx->second = record.credential_id;
      }
    }
  } else if (idx != discoverable_index_.end() &&
             idx->second == record.credential_id) {
    discoverable_index_.erase(idx);
  }

  records_[record.credential_id] = std::move(record);
}

std::optional<PrivateKeyCredentialSource> MemoryCredentialStorage::get(
    const CredentialHandle& handle) const {
  auto it = records_.find(handle.descriptor.id);
  if (it == records_.end() || it->second.rp_id != handle.rp_id) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<CredentialHandle> MemoryCredentialStorage::list_discoverable(
    const std::string& rp_id) const {
  std::vector<const PrivateKeyCredentialSource*> matches;
  for (const auto& [key, credential_id] : discoverable_index_) {
    if (key.first != rp_id) continue;
    auto it = records_.find(credential_id);
    if (it != records_.end()) {
      matches.push_back(&it->second);
    }
  }

  std::sort(matches.begin(), matches.end(),
            [](const PrivateKeyCredentialSource* a,
               const PrivateKeyCredentialSource* b) {
              return a->creation_order > b->creation_order;
            });

  std::vector<CredentialHandle> handles;
  handles.reserve(matches.size());
  for (const auto* record : matches) {
    handles.push_back(record->handle());
  }
  return handles;
}

std::vector<CredentialHandle> MemoryCredentialStorage::list_specified(
    const std::string& rp_id,
    const std::vector<PublicKeyCredentialDescriptor>& descriptors) const {
  std::vector<CredentialHandle> handles;
  for (const auto& descriptor : descriptors) {
    if (descriptor.type != kPublicKeyType) continue;

    auto it = records_.find(descriptor.id);
    if (it == records_.end() || it->second.rp_id != rp_id) continue;

    // allow list 中重复的 id 只返回一次
    bool seen = std::any_of(
        handles.begin(), handles.end(), [&](const CredentialHandle& h) {
          return h.descriptor.id == descriptor.id;
        });
    if (!seen) {
      handles.push_back(it->second.handle());
    }
  }
  return handles;
}

std::vector<PrivateKeyCredentialSource> MemoryCredentialStorage::records()
    const {
  std::vector<PrivateKeyCredentialSource> result;
  result.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    result.push_back(record);
  }
  std::sort(result.begin(), result.end(),
            [](const PrivateKeyCredentialSource& a,
               const PrivateKeyCredentialSource& b) {
              return a.creation_order < b.creation_order;
            });
  return result;
}

void MemoryCredentialStorage::restore(
    const std::vector<PrivateKeyCredentialSource>& records) {
  records_.clear();
  discoverable_index_.clear();
  next_order_ = 1;

  for (const auto& record : records) {
    next_order_ = std::max(next_order_, record.creation_order + 1);
  }

  // 按创建顺序重放，索引自然指向每个 (rp, user) 最新的凭据
  std::vector<PrivateKeyCredentialSource> ordered = records;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const PrivateKeyCredentialSource& a,
                      const PrivateKeyCredentialSource& b) {
                     return a.creation_order < b.creation_order;
                   });

  for (auto& record : ordered) {
    if (record.creation_order == 0) {
      record.creation_order = next_order_++;
    }
    if (record.discoverable) {
      discoverable_index_[{record.rp_id, record.user.id}] =
          record.credential_id;
    }
    records_[record.credential_id] = record;
  }

  spdlog::debug("Store: 恢复了 {} 个凭据 ({} 个 discoverable)",
                records_.size(), discoverable_index_.size());
}

}  // namespace ctapauth
