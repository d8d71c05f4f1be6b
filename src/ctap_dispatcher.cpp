#include "ctapauth/ctap_dispatcher.h"

#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

#include <exception>

#include "ctapauth/cbor_helper.h"
#include "ctapauth/ctap_error.h"

namespace ctapauth {

static std::vector<uint8_t> status_only(CtapStatus status) {
  return {static_cast<uint8_t>(status)};
}

static std::vector<uint8_t> success_with(const std::vector<uint8_t>& cbor) {
  if (cbor.empty()) {
    throw CtapError(CtapStatus::kOther, "CBOR 响应编码失败");
  }
  std::vector<uint8_t> response;
  response.reserve(1 + cbor.size());
  response.push_back(static_cast<uint8_t>(CtapStatus::kSuccess));
  response.insert(response.end(), cbor.begin(), cbor.end());
  return response;
}

std::vector<uint8_t> CtapDispatcher::handle(
    const std::vector<uint8_t>& message) {
  if (message.empty()) {
    spdlog::warn("CTAP2: 空消息");
    return status_only(CtapStatus::kInvalidLength);
  }

  uint8_t command = message[0];
  std::vector<uint8_t> cbor_data(message.begin() + 1, message.end());

  spdlog::debug("CTAP2: 命令码 {:#04X}, CBOR 数据 {} 字节", command,
                cbor_data.size());
  spdlog::trace("CTAP2: 请求 {}", spdlog::to_hex(cbor_data));

  try {
    return dispatch(command, cbor_data);
  } catch (const CtapError& e) {
    spdlog::warn("CTAP2: 命令 {:#04X} 失败: {} ({})", command,
                 status_name(e.status()), e.what());
    return status_only(e.status());
  } catch (const std::exception& e) {
    spdlog::error("CTAP2: 命令 {:#04X} 内部错误: {}", command, e.what());
    return status_only(CtapStatus::kOther);
  }
}

std::vector<uint8_t> CtapDispatcher::dispatch(
    uint8_t command, const std::vector<uint8_t>& cbor_data) {
  switch (static_cast<CtapCommand>(command)) {
    case CtapCommand::kGetInfo:
      return success_with(
          CborEncoder::encode_get_info(authenticator_.get_info()));

    case CtapCommand::kMakeCredential: {
      auto request = CborDecoder::parse_make_credential(cbor_data);
      auto response = authenticator_.make_credential(request);
      return success_with(
          CborEncoder::encode_make_credential_response(response));
    }

    case CtapCommand::kGetAssertion: {
      auto request = CborDecoder::parse_get_assertion(cbor_data);
      auto response = authenticator_.get_assertion(request);
      return success_with(CborEncoder::encode_get_assertion_response(response));
    }

    case CtapCommand::kClientPin:
      spdlog::debug("CTAP2: CLIENT_PIN (不支持 PIN)");
      return status_only(CtapStatus::kNotAllowed);
  }

  spdlog::warn("CTAP2: 不支持的命令 {:#04X}", command);
  return status_only(CtapStatus::kInvalidCommand);
}

}  // namespace ctapauth
