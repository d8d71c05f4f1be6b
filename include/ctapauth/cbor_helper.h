#pragma once

#include <cbor.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ctapauth/ctap_types.h"

namespace ctapauth {

// cbor_item_t 的 RAII 包装 (cbor_decref)
struct CborItemDeleter {
  void operator()(cbor_item_t* item) const {
    if (item) cbor_decref(&item);
  }
};
using CborItemPtr = std::unique_ptr<cbor_item_t, CborItemDeleter>;

// CBOR 编码助手 (CTAP2 canonical 编码)
class CborEncoder {
 public:
  // 编码 GetInfo 响应
  static std::vector<uint8_t> encode_get_info(const GetInfoResponse& info);

  // 编码 MakeCredential 响应 (attestation object)
  static std::vector<uint8_t> encode_make_credential_response(
      const MakeCredentialResponse& response);

  // 编码 GetAssertion 响应
  static std::vector<uint8_t> encode_get_assertion_response(
      const GetAssertionResponse& response);

  // 编码 COSE Key (ES256/P-256)
  static std::vector<uint8_t> encode_cose_key(const CosePublicKey& key);

  // 通用编码方法
  static std::vector<uint8_t> encode(const cbor_item_t* item);

 private:
  static cbor_item_t* build_int(int64_t value);
  static cbor_item_t* build_bytes(const std::vector<uint8_t>& data);
  static cbor_item_t* build_text(const std::string& text);
  static cbor_item_t* build_descriptor(
      const PublicKeyCredentialDescriptor& descriptor);
  static void add_to_map(cbor_item_t* map, int64_t key, cbor_item_t* value);
  static void add_to_map(cbor_item_t* map, const std::string& key,
                         cbor_item_t* value);
};

/**
 * CBOR 解码助手
 *
 * 解析失败时抛出 CtapError：
 * - 不是合法 CBOR 或末尾有多余数据: kInvalidCbor
 * - 顶层不是 map 或字段类型不对: kCborUnexpectedType
 * - 缺少必需字段: kMissingParameter
 * - clientDataHash 长度不是 32，rp.id 或 user.id 过长: kInvalidLength
 * - pinUvAuthProtocol / enterpriseAttestation 超出范围: kInvalidParameter
 *
 * rp.name、user.name、user.displayName 超过 64 字节时截断；
 * alg 超出 int32 的 pubKeyCredParams 项被丢弃。
 */
class CborDecoder {
 public:
  static MakeCredentialCommand parse_make_credential(
      const std::vector<uint8_t>& data);

  static GetAssertionCommand parse_get_assertion(
      const std::vector<uint8_t>& data);

 private:
  static CborItemPtr load_map(const std::vector<uint8_t>& data);
  static std::string get_string(const cbor_item_t* item);
  static std::vector<uint8_t> get_bytes(const cbor_item_t* item);
  static std::optional<int32_t> get_int32(const cbor_item_t* item);
  static int get_small_uint(const cbor_item_t* item);
  static std::string get_name(const cbor_item_t* item);
  static bool get_bool(const cbor_item_t* item);
  static std::map<std::string, bool> get_options(const cbor_item_t* item);
  static std::vector<PublicKeyCredentialDescriptor> get_descriptor_list(
      const cbor_item_t* item);
};

}  // namespace ctapauth
