#include "ctapauth/sealed_storage.h"

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

#include "ctapauth/ctap_error.h"

namespace ctapauth {

// ============== CredentialSerializer 实现 ==============

static void put_u16(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back((value >> 8) & 0xFF);
  out.push_back(value & 0xFF);
}

static void put_u32(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back((value >> 24) & 0xFF);
  out.push_back((value >> 16) & 0xFF);
  out.push_back((value >> 8) & 0xFF);
  out.push_back(value & 0xFF);
}

static void put_u64(std::vector<uint8_t>& out, uint64_t value) {
  put_u32(out, static_cast<uint32_t>(value >> 32));
  put_u32(out, static_cast<uint32_t>(value & 0xFFFFFFFF));
}

// 长度字段只有 16 位，超长时拒绝写入而不是截断长度
template <typename Container>
static void put_field(std::vector<uint8_t>& out, const Container& field) {
  if (field.size() > CredentialSerializer::kMaxFieldLength) {
    throw StorageError("凭据字段过长 (" + std::to_string(field.size()) +
                       " 字节)");
  }
  put_u16(out, static_cast<uint16_t>(field.size()));
  out.insert(out.end(), field.begin(), field.end());
}

std::vector<uint8_t> CredentialSerializer::serialize(
    const std::vector<PrivateKeyCredentialSource>& credentials) {
  std::vector<uint8_t> result;

  result.push_back(kVersion);
  put_u32(result, static_cast<uint32_t>(credentials.size()));

  for (const auto& cred : credentials) {
    put_field(result, cred.credential_id);
    put_field(result, cred.private_key);
    put_field(result, cred.rp_id);
    put_field(result, cred.user.id);
    put_field(result, cred.user.name);
    put_field(result, cred.user.display_name);
    put_u32(result, static_cast<uint32_t>(cred.alg));
    put_u32(result, cred.sign_count);
    result.push_back(cred.discoverable ? 1 : 0);
    put_u64(result, cred.creation_order);
  }

  return result;
}

std::optional<std::vector<PrivateKeyCredentialSource>>
CredentialSerializer::deserialize(const std::vector<uint8_t>& data) {
  if (data.size() < 5) {
    spdlog::error("Store: 凭据数据太短 ({} 字节)", data.size());
    return std::nullopt;
  }

  size_t offset = 0;

  uint8_t version = data[offset++];
  if (version != kVersion) {
    spdlog::error("Store: 不支持的凭据版本: {}", version);
    return std::nullopt;
  }

  auto read_u32 = [&](uint32_t& out) -> bool {
    if (offset + 4 > data.size()) return false;
    out = (static_cast<uint32_t>(data[offset]) << 24) |
          (static_cast<uint32_t>(data[offset + 1]) << 16) |
          (static_cast<uint32_t>(data[offset + 2]) << 8) |
          static_cast<uint32_t>(data[offset + 3]);
    offset += 4;
    return true;
  };

  auto read_u64 = [&](uint64_t& out) -> bool {
    uint32_t high = 0;
    uint32_t low = 0;
    if (!read_u32(high) || !read_u32(low)) return false;
    out = (static_cast<uint64_t>(high) << 32) | low;
    return true;
  };

  auto read_bytes = [&](std::vector<uint8_t>& out) -> bool {
    if (offset + 2 > data.size()) return false;
    uint16_t len = (static_cast<uint16_t>(data[offset]) << 8) |
                   static_cast<uint16_t>(data[offset + 1]);
    offset += 2;
    if (offset + len > data.size()) return false;
    out.assign(data.begin() + offset, data.begin() + offset + len);
    offset += len;
    return true;
  };

  auto read_string = [&](std::string& out) -> bool {
    if (offset + 2 > data.size()) return false;
    uint16_t len = (static_cast<uint16_t>(data[offset]) << 8) |
                   static_cast<uint16_t>(data[offset + 1]);
    offset += 2;
    if (offset + len > data.size()) return false;
    out.assign(reinterpret_cast<const char*>(data.data() + offset), len);
    offset += len;
    return true;
  };

  uint32_t count = 0;
  if (!read_u32(count)) {
    return std::nullopt;
  }

  std::vector<PrivateKeyCredentialSource> result;
  for (uint32_t i = 0; i < count; i++) {
    PrivateKeyCredentialSource cred;
    uint32_t alg = 0;

    bool ok = read_bytes(cred.credential_id) && read_bytes(cred.private_key) &&
              read_string(cred.rp_id) && read_bytes(cred.user.id) &&
              read_string(cred.user.name) &&
              read_string(cred.user.display_name) && read_u32(alg) &&
              read_u32(cred.sign_count) && offset < data.size();
    if (!ok) {
      spdlog::error("Store: 第 {} 个凭据记录被截断", i);
      return std::nullopt;
    }
    cred.alg = static_cast<int32_t>(alg);
    cred.discoverable = data[offset++] != 0;
    if (!read_u64(cred.creation_order)) {
      spdlog::error("Store: 第 {} 个凭据记录被截断", i);
      return std::nullopt;
    }

    result.push_back(std::move(cred));
  }

  if (offset != data.size()) {
    spdlog::error("Store: 凭据数据末尾有 {} 字节多余数据",
                  data.size() - offset);
    return std::nullopt;
  }

  return result;
}

// ============== SealedFileStorage 实现 ==============

// 递归创建目录 (权限 0700)
static bool ensure_directory(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) == 0) {
    return S_ISDIR(st.st_mode);
  }

  size_t pos = 0;
  while ((pos = path.find('/', pos + 1)) != std::string::npos) {
    std::string subpath = path.substr(0, pos);
    if (stat(subpath.c_str(), &st) != 0) {
      if (mkdir(subpath.c_str(), 0700) != 0 && errno != EEXIST) {
        return false;
      }
    }
  }
  if (mkdir(path.c_str(), 0700) != 0 && errno != EEXIST) {
    return false;
  }
  return true;
}

SealedFileStorage::SealedFileStorage(std::string path,
                                     std::unique_ptr<Sealer> sealer)
    : path_(std::move(path)), sealer_(std::move(sealer)) {
  if (!sealer_) {
    throw StorageError("未提供 sealer");
  }
  load();
}

void SealedFileStorage::load() {
  struct stat st;
  if (stat(path_.c_str(), &st) != 0) {
    spdlog::info("Store: 没有已封装的凭据数据 ({})", path_);
    return;
  }

  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    throw StorageError("无法打开封装文件: " + path_);
  }
  std::vector<uint8_t> blob((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw StorageError("读取封装文件失败: " + path_);
  }

  auto data = sealer_->unseal(blob);
  if (!data) {
    throw StorageError("无法解封凭据: " + sealer_->last_error());
  }

  auto credentials = CredentialSerializer::deserialize(*data);
  OPENSSL_cleanse(data->data(), data->size());
  if (!credentials) {
    throw StorageError("凭据文件格式错误: " + path_);
  }

  state_.restore(*credentials);
  for (auto& cred : *credentials) {
    OPENSSL_cleanse(cred.private_key.data(), cred.private_key.size());
  }
  spdlog::info("Store: 已加载 {} 个凭据", state_.count());
}

void SealedFileStorage::flush(const MemoryCredentialStorage& state) {
  std::vector<uint8_t> data = CredentialSerializer::serialize(state.records());
  auto blob = sealer_->seal(data);
  OPENSSL_cleanse(data.data(), data.size());
  if (!blob) {
    throw StorageError("凭据封装失败: " + sealer_->last_error());
  }

  size_t slash = path_.rfind('/');
  if (slash != std::string::npos && slash > 0 &&
      !ensure_directory(path_.substr(0, slash))) {
    throw StorageError("无法创建存储目录: " + path_.substr(0, slash));
  }

  // 先写临时文件再 rename，写到一半失败不会破坏旧文件
  std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StorageError("无法打开文件写入: " + tmp_path);
    }
    file.write(reinterpret_cast<const char*>(blob->data()), blob->size());
    file.close();
    if (!file) {
      std::remove(tmp_path.c_str());
      throw StorageError("写入封装文件失败: " + tmp_path);
    }
  }
  chmod(tmp_path.c_str(), 0600);

  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    std::string reason = std::strerror(errno);
    std::remove(tmp_path.c_str());
    throw StorageError("替换封装文件失败: " + reason);
  }

  spdlog::debug("Store: 已保存 {} 个凭据到 {} ({} 字节)", state.count(), path_,
                blob->size());
}

void SealedFileStorage::put_discoverable(
    const PrivateKeyCredentialSource& record) {
  MemoryCredentialStorage staged = state_;
  staged.put_discoverable(record);
  flush(staged);
  state_ = std::move(staged);
}

void SealedFileStorage::put_non_discoverable(
    const PrivateKeyCredentialSource& record) {
  MemoryCredentialStorage staged = state_;
  staged.put_non_discoverable(record);
  flush(staged);
  state_ = std::move(staged);
}

std::optional<PrivateKeyCredentialSource> SealedFileStorage::get(
    const CredentialHandle& handle) const {
  return state_.get(handle);
}

std::vector<CredentialHandle> SealedFileStorage::list_discoverable(
    const std::string& rp_id) const {
  return state_.list_discoverable(rp_id);
}

std::vector<CredentialHandle> SealedFileStorage::list_specified(
    const std::string& rp_id,
    const std::vector<PublicKeyCredentialDescriptor>& descriptors) const {
  return state_.list_specified(rp_id, descriptors);
}

}  // namespace ctapauth
