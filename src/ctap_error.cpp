#include "ctapauth/ctap_error.h"

namespace ctapauth {

const char* status_name(CtapStatus status) {
  switch (status) {
    case CtapStatus::kSuccess:
      return "CTAP2_OK";
    case CtapStatus::kInvalidCommand:
      return "CTAP1_ERR_INVALID_COMMAND";
    case CtapStatus::kInvalidParameter:
      return "CTAP1_ERR_INVALID_PARAMETER";
    case CtapStatus::kInvalidLength:
      return "CTAP1_ERR_INVALID_LENGTH";
    case CtapStatus::kCborUnexpectedType:
      return "CTAP2_ERR_CBOR_UNEXPECTED_TYPE";
    case CtapStatus::kInvalidCbor:
      return "CTAP2_ERR_INVALID_CBOR";
    case CtapStatus::kMissingParameter:
      return "CTAP2_ERR_MISSING_PARAMETER";
    case CtapStatus::kUnsupportedAlgorithm:
      return "CTAP2_ERR_UNSUPPORTED_ALGORITHM";
    case CtapStatus::kOperationDenied:
      return "CTAP2_ERR_OPERATION_DENIED";
    case CtapStatus::kUnsupportedOption:
      return "CTAP2_ERR_UNSUPPORTED_OPTION";
    case CtapStatus::kInvalidOption:
      return "CTAP2_ERR_INVALID_OPTION";
    case CtapStatus::kNoCredentials:
      return "CTAP2_ERR_NO_CREDENTIALS";
    case CtapStatus::kNotAllowed:
      return "CTAP2_ERR_NOT_ALLOWED";
    case CtapStatus::kOther:
      return "CTAP1_ERR_OTHER";
  }
  return "CTAP_UNKNOWN";
}

CtapError::CtapError(CtapStatus status, const std::string& message)
    : std::runtime_error(message), status_(status) {}

CtapError::CtapError(CtapStatus status)
    : std::runtime_error(status_name(status)), status_(status) {}

}  // namespace ctapauth
