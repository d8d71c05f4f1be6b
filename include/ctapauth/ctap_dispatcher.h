#pragma once

#include <cstdint>
#include <vector>

#include "ctapauth/authenticator.h"

namespace ctapauth {

// CTAP2 命令码 (authenticatorXxx)
enum class CtapCommand : uint8_t {
  kMakeCredential = 0x01,
  kGetAssertion = 0x02,
  kGetInfo = 0x04,
  kClientPin = 0x06,
};

/**
 * CTAP2 CBOR 消息分发
 *
 * 输入: 命令码(1) || CBOR 请求
 * 输出: 状态码(1) || CBOR 响应 (失败时只有状态码)
 *
 * 这是把异常转换成状态码的唯一位置。
 */
class CtapDispatcher {
 public:
  explicit CtapDispatcher(Authenticator& authenticator)
      : authenticator_(authenticator) {}

  std::vector<uint8_t> handle(const std::vector<uint8_t>& message);

 private:
  std::vector<uint8_t> dispatch(uint8_t command,
                                const std::vector<uint8_t>& cbor_data);

  Authenticator& authenticator_;
};

}  // namespace ctapauth
