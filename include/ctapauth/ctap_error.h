#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ctapauth {

// CTAP2 状态码 (authenticator 返回给平台的第一个字节)
enum class CtapStatus : uint8_t {
  kSuccess = 0x00,
  kInvalidCommand = 0x01,
  kInvalidParameter = 0x02,
  kInvalidLength = 0x03,
  kCborUnexpectedType = 0x11,
  kInvalidCbor = 0x12,
  kMissingParameter = 0x14,
  kUnsupportedAlgorithm = 0x26,
  kOperationDenied = 0x27,
  kUnsupportedOption = 0x2B,
  kInvalidOption = 0x2C,
  kNoCredentials = 0x2E,
  kNotAllowed = 0x30,
  kOther = 0x7F,
};

// 状态码的可读名称 (用于日志)
const char* status_name(CtapStatus status);

/**
 * 所有 authenticator 失败的基类。
 *
 * 各层抛出自己的子类 (StorageError, CryptoError, PresenceError)，
 * 调用方可以按子类区分来源，也可以统一按 CtapError 处理并读取 status()。
 * 协议层不会捕获后重新包装这些异常。
 */
class CtapError : public std::runtime_error {
 public:
  CtapError(CtapStatus status, const std::string& message);
  explicit CtapError(CtapStatus status);

  CtapStatus status() const noexcept { return status_; }

 private:
  CtapStatus status_;
};

// 凭据存储后端失败 (读写、封装、序列化)
class StorageError : public CtapError {
 public:
  explicit StorageError(const std::string& message)
      : CtapError(CtapStatus::kOther, message) {}
};

// 密钥生成、随机数或签名失败
class CryptoError : public CtapError {
 public:
  explicit CryptoError(const std::string& message)
      : CtapError(CtapStatus::kOther, message) {}
};

// 用户在场确认本身出错 (不是用户拒绝)
class PresenceError : public CtapError {
 public:
  explicit PresenceError(const std::string& message)
      : CtapError(CtapStatus::kOther, message) {}
};

}  // namespace ctapauth
