#include "ctapauth/cbor_helper.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <limits>

#include "ctapauth/ctap_error.h"

namespace ctapauth {

// ============== CborEncoder 实现 ==============

std::vector<uint8_t> CborEncoder::encode(const cbor_item_t* item) {
  if (!item) return {};

  size_t buffer_size = 1024;
  std::vector<uint8_t> buffer(buffer_size);
  size_t written = 0;

  // 尝试编码，如果缓冲区不够大则扩展
  while (true) {
    written = cbor_serialize(item, buffer.data(), buffer.size());
    if (written > 0 && written <= buffer.size()) {
      buffer.resize(written);
      break;
    }
    buffer_size *= 2;
    buffer.resize(buffer_size);
    if (buffer_size > 64 * 1024) {
      spdlog::error("CBOR: 编码缓冲区过大");
      return {};
    }
  }

  return buffer;
}

// 整数按最短宽度编码 (canonical CBOR)
cbor_item_t* CborEncoder::build_int(int64_t value) {
  uint64_t magnitude = value >= 0 ? static_cast<uint64_t>(value)
                                  : static_cast<uint64_t>(-1 - value);
  bool negative = value < 0;

  if (magnitude <= 0xFF) {
    auto v = static_cast<uint8_t>(magnitude);
    return negative ? cbor_build_negint8(v) : cbor_build_uint8(v);
  }
  if (magnitude <= 0xFFFF) {
    auto v = static_cast<uint16_t>(magnitude);
    return negative ? cbor_build_negint16(v) : cbor_build_uint16(v);
  }
  if (magnitude <= 0xFFFFFFFF) {
    auto v = static_cast<uint32_t>(magnitude);
    return negative ? cbor_build_negint32(v) : cbor_build_uint32(v);
  }
  return negative ? cbor_build_negint64(magnitude)
                  : cbor_build_uint64(magnitude);
}

cbor_item_t* CborEncoder::build_bytes(const std::vector<uint8_t>& data) {
  return cbor_build_bytestring(data.data(), data.size());
}

cbor_item_t* CborEncoder::build_text(const std::string& text) {
  return cbor_build_stringn(text.data(), text.size());
}

void CborEncoder::add_to_map(cbor_item_t* map, int64_t key,
                             cbor_item_t* value) {
  if (!value ||
      !cbor_map_add(map, cbor_pair{cbor_move(build_int(key)),
                                   cbor_move(value)})) {
    throw CtapError(CtapStatus::kOther, "CBOR: 无法添加 map 项");
  }
}

void CborEncoder::add_to_map(cbor_item_t* map, const std::string& key,
                             cbor_item_t* value) {
  if (!value || !cbor_map_add(map, cbor_pair{cbor_move(build_text(key)),
                                             cbor_move(value)})) {
    throw CtapError(CtapStatus::kOther, "CBOR: 无法添加 map 项");
  }
}

// {"id": bytes, "type": "public-key"}
// 键顺序: "id"(2) < "type"(4)
cbor_item_t* CborEncoder::build_descriptor(
    const PublicKeyCredentialDescriptor& descriptor) {
  cbor_item_t* map = cbor_new_definite_map(2);
  add_to_map(map, "id", build_bytes(descriptor.id));
  add_to_map(map, "type", build_text(descriptor.type));
  return map;
}

// 辅助函数：比较两个 CBOR 文本键的规范顺序
// 规则：先按长度排序，同长度按字节值排序
static bool cbor_key_less(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return a.size() < b.size();
  return a < b;
}

std::vector<uint8_t> CborEncoder::encode_cose_key(const CosePublicKey& key) {
  if (key.x.size() != 32 || key.y.size() != 32) {
    spdlog::error("CBOR: 无效的公钥坐标");
    return {};
  }

  // COSE_Key for ES256 (P-256)
  // 规范键顺序 (整数键): 1, 3, -1, -2, -3
  CborItemPtr map(cbor_new_definite_map(5));
  add_to_map(map.get(), 1, build_int(2));        // kty = EC2
  add_to_map(map.get(), 3, build_int(key.alg));  // alg
  add_to_map(map.get(), -1, build_int(1));       // crv = P-256
  add_to_map(map.get(), -2, build_bytes(key.x));
  add_to_map(map.get(), -3, build_bytes(key.y));

  return encode(map.get());
}

std::vector<uint8_t> CborEncoder::encode_get_info(const GetInfoResponse& info) {
  // CTAP2 GetInfo 响应使用整数键，按数值排序: 1, 3, 4, 10, 20
  size_t map_size = 4;
  if (!info.options.empty()) map_size++;
  CborItemPtr map(cbor_new_definite_map(map_size));

  // 1: versions
  cbor_item_t* versions = cbor_new_definite_array(info.versions.size());
  for (const auto& v : info.versions) {
    cbor_array_push(versions, cbor_move(build_text(v)));
  }
  add_to_map(map.get(), 1, versions);

  // 3: aaguid
  add_to_map(map.get(), 3, build_bytes(info.aaguid));

  // 4: options - 必须按键的规范顺序
  if (!info.options.empty()) {
    std::vector<std::string> keys;
    for (const auto& [k, v] : info.options) keys.push_back(k);
    std::sort(keys.begin(), keys.end(), cbor_key_less);

    cbor_item_t* options = cbor_new_definite_map(keys.size());
    for (const auto& k : keys) {
      add_to_map(options, k, cbor_build_bool(info.options.at(k)));
    }
    add_to_map(map.get(), 4, options);
  }

  // 0x0A: algorithms ("alg" < "type" 因为长度 3 < 4)
  cbor_item_t* algorithms = cbor_new_definite_array(info.algorithms.size());
  for (const auto& param : info.algorithms) {
    cbor_item_t* entry = cbor_new_definite_map(2);
    add_to_map(entry, "alg", build_int(param.alg));
    add_to_map(entry, "type", build_text(param.type));
    cbor_array_push(algorithms, cbor_move(entry));
  }
  add_to_map(map.get(), 0x0A, algorithms);

  // 0x14: remainingDiscoverableCredentials
  add_to_map(map.get(), 0x14, build_int(info.remaining_discoverable_credentials));

  return encode(map.get());
}

std::vector<uint8_t> CborEncoder::encode_make_credential_response(
    const MakeCredentialResponse& response) {
  // MakeCredential 响应: map(3)，整数键顺序: 1, 2, 3
  CborItemPtr map(cbor_new_definite_map(3));

  // 1: fmt
  add_to_map(map.get(), 1, build_text(response.att_stmt.fmt));

  // 2: authData
  add_to_map(map.get(), 2, build_bytes(response.auth_data.to_bytes()));

  // 3: attStmt
  // 键顺序: "alg"(3) < "sig"(3) < "x5c"(3)
  const auto& stmt = response.att_stmt;
  cbor_item_t* att_stmt = cbor_new_definite_map(stmt.has_x5c() ? 3 : 2);
  add_to_map(att_stmt, "alg", build_int(stmt.alg));
  add_to_map(att_stmt, "sig", build_bytes(stmt.sig));
  if (stmt.has_x5c()) {
    // Basic attestation: x5c = [attestation cert, ca chain...]
    cbor_item_t* x5c =
        cbor_new_definite_array(1 + stmt.ca_certificate_chain.size());
    cbor_array_push(x5c, cbor_move(build_bytes(stmt.attestation_certificate)));
    for (const auto& cert : stmt.ca_certificate_chain) {
      cbor_array_push(x5c, cbor_move(build_bytes(cert)));
    }
    add_to_map(att_stmt, "x5c", x5c);
  }
  add_to_map(map.get(), 3, att_stmt);

  return encode(map.get());
}

std::vector<uint8_t> CborEncoder::encode_get_assertion_response(
    const GetAssertionResponse& response) {
  // GetAssertion 响应: map(3 or 4)，整数键顺序: 1, 2, 3, 4
  bool has_user = response.user.has_value();
  CborItemPtr map(cbor_new_definite_map(has_user ? 4 : 3));

  // 1: credential
  add_to_map(map.get(), 1, build_descriptor(response.credential));

  // 2: authData
  add_to_map(map.get(), 2, build_bytes(response.auth_data.to_bytes()));

  // 3: signature
  add_to_map(map.get(), 3, build_bytes(response.signature));

  // 4: user
  // 键顺序: "id"(2) < "name"(4) < "displayName"(11)
  if (has_user) {
    const auto& user = *response.user;
    size_t user_size = 1;
    if (!user.name.empty()) user_size++;
    if (!user.display_name.empty()) user_size++;

    cbor_item_t* user_map = cbor_new_definite_map(user_size);
    add_to_map(user_map, "id", build_bytes(user.id));
    if (!user.name.empty()) {
      add_to_map(user_map, "name", build_text(user.name));
    }
    if (!user.display_name.empty()) {
      add_to_map(user_map, "displayName", build_text(user.display_name));
    }
    add_to_map(map.get(), 4, user_map);
  }

  return encode(map.get());
}

// ============== CborDecoder 实现 ==============

CborItemPtr CborDecoder::load_map(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    throw CtapError(CtapStatus::kInvalidCbor, "CBOR: 请求为空");
  }

  struct cbor_load_result result;
  CborItemPtr item(cbor_load(data.data(), data.size(), &result));

  if (result.error.code != CBOR_ERR_NONE || !item) {
    spdlog::error("CBOR: 解析失败 (code={}, position={})",
                  static_cast<int>(result.error.code), result.error.position);
    throw CtapError(CtapStatus::kInvalidCbor);
  }
  if (result.read != data.size()) {
    spdlog::error("CBOR: 请求末尾有多余数据 ({} / {})", result.read,
                  data.size());
    throw CtapError(CtapStatus::kInvalidCbor);
  }
  if (!cbor_isa_map(item.get())) {
    throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 顶层不是 map");
  }
  return item;
}

std::string CborDecoder::get_string(const cbor_item_t* item) {
  if (!item || !cbor_isa_string(item) || !cbor_string_is_definite(item)) {
    throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 期望文本串");
  }
  return std::string(reinterpret_cast<const char*>(cbor_string_handle(item)),
                     cbor_string_length(item));
}

std::vector<uint8_t> CborDecoder::get_bytes(const cbor_item_t* item) {
  if (!item || !cbor_isa_bytestring(item) ||
      !cbor_bytestring_is_definite(item)) {
    throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 期望字节串");
  }
  const uint8_t* data = cbor_bytestring_handle(item);
  size_t len = cbor_bytestring_length(item);
  return std::vector<uint8_t>(data, data + len);
}

// 超出 int32 范围返回 nullopt，不做截断
std::optional<int32_t> CborDecoder::get_int32(const cbor_item_t* item) {
  constexpr uint64_t kMax = std::numeric_limits<int32_t>::max();
  if (item && cbor_isa_uint(item)) {
    uint64_t value = cbor_get_int(item);
    if (value > kMax) return std::nullopt;
    return static_cast<int32_t>(value);
  }
  if (item && cbor_isa_negint(item)) {
    // 编码值 n 表示 -1 - n
    uint64_t value = cbor_get_int(item);
    if (value > kMax) return std::nullopt;
    return -1 - static_cast<int32_t>(value);
  }
  throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 期望整数");
}

// 协议版本之类的小整数，负数或超出 int 范围视为无效参数
int CborDecoder::get_small_uint(const cbor_item_t* item) {
  auto value = get_int32(item);
  if (!value || *value < 0) {
    throw CtapError(CtapStatus::kInvalidParameter, "CBOR: 整数超出范围");
  }
  return *value;
}

// 截断到 kMaxEntityNameLength 字节，不拆开 UTF-8 多字节字符
std::string CborDecoder::get_name(const cbor_item_t* item) {
  std::string name = get_string(item);
  if (name.size() <= kMaxEntityNameLength) return name;

  size_t cut = kMaxEntityNameLength;
  while (cut > 0 && (static_cast<uint8_t>(name[cut]) & 0xC0) == 0x80) {
    cut--;
  }
  spdlog::debug("CBOR: 名称从 {} 字节截断到 {} 字节", name.size(), cut);
  name.resize(cut);
  return name;
}

bool CborDecoder::get_bool(const cbor_item_t* item) {
  if (!item || !cbor_is_bool(item)) {
    throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 期望布尔值");
  }
  return cbor_get_bool(item);
}

std::map<std::string, bool> CborDecoder::get_options(const cbor_item_t* item) {
  if (!cbor_isa_map(item)) {
    throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: options 不是 map");
  }

  std::map<std::string, bool> options;
  size_t opt_size = cbor_map_size(item);
  struct cbor_pair* opt_pairs = cbor_map_handle(item);
  for (size_t j = 0; j < opt_size; j++) {
    options[get_string(opt_pairs[j].key)] = get_bool(opt_pairs[j].value);
  }
  return options;
}

std::vector<PublicKeyCredentialDescriptor> CborDecoder::get_descriptor_list(
    const cbor_item_t* item) {
  if (!cbor_isa_array(item)) {
    throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 凭据列表不是数组");
  }

  std::vector<PublicKeyCredentialDescriptor> list;
  size_t arr_size = cbor_array_size(item);
  cbor_item_t** entries = cbor_array_handle(item);
  for (size_t j = 0; j < arr_size; j++) {
    const cbor_item_t* cred = entries[j];
    if (!cbor_isa_map(cred)) {
      throw CtapError(CtapStatus::kCborUnexpectedType,
                      "CBOR: 凭据描述符不是 map");
    }

    PublicKeyCredentialDescriptor descriptor;
    bool has_id = false;
    bool has_type = false;
    size_t cred_size = cbor_map_size(cred);
    struct cbor_pair* cred_pairs = cbor_map_handle(cred);
    for (size_t k = 0; k < cred_size; k++) {
      std::string ck = get_string(cred_pairs[k].key);
      if (ck == "id") {
        descriptor.id = get_bytes(cred_pairs[k].value);
        has_id = true;
      } else if (ck == "type") {
        descriptor.type = get_string(cred_pairs[k].value);
        has_type = true;
      }
    }
    if (!has_id || !has_type) {
      throw CtapError(CtapStatus::kMissingParameter,
                      "CBOR: 凭据描述符缺少 id/type");
    }
    list.push_back(std::move(descriptor));
  }
  return list;
}

MakeCredentialCommand CborDecoder::parse_make_credential(
    const std::vector<uint8_t>& data) {
  CborItemPtr item = load_map(data);
  MakeCredentialCommand cmd;
  bool has_client_data_hash = false;
  bool has_rp = false;
  bool has_user = false;
  bool has_params = false;

  size_t map_size = cbor_map_size(item.get());
  struct cbor_pair* pairs = cbor_map_handle(item.get());

  for (size_t i = 0; i < map_size; i++) {
    if (!cbor_isa_uint(pairs[i].key)) {
      throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 请求键不是整数");
    }
    uint64_t key = cbor_get_int(pairs[i].key);
    const cbor_item_t* value = pairs[i].value;

    switch (key) {
      case 1:  // clientDataHash (bytes)
        cmd.client_data_hash = get_bytes(value);
        has_client_data_hash = true;
        break;

      case 2: {  // rp (map)
        if (!cbor_isa_map(value)) {
          throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: rp 不是 map");
        }
        size_t rp_size = cbor_map_size(value);
        struct cbor_pair* rp_pairs = cbor_map_handle(value);
        for (size_t j = 0; j < rp_size; j++) {
          std::string rp_key = get_string(rp_pairs[j].key);
          if (rp_key == "id") {
            cmd.rp.id = get_string(rp_pairs[j].value);
            has_rp = true;
          } else if (rp_key == "name") {
            cmd.rp.name = get_name(rp_pairs[j].value);
          }
        }
        break;
      }

      case 3: {  // user (map)
        if (!cbor_isa_map(value)) {
          throw CtapError(CtapStatus::kCborUnexpectedType,
                          "CBOR: user 不是 map");
        }
        size_t user_size = cbor_map_size(value);
        struct cbor_pair* user_pairs = cbor_map_handle(value);
        for (size_t j = 0; j < user_size; j++) {
          std::string user_key = get_string(user_pairs[j].key);
          if (user_key == "id") {
            cmd.user.id = get_bytes(user_pairs[j].value);
            has_user = true;
          } else if (user_key == "name") {
            cmd.user.name = get_name(user_pairs[j].value);
          } else if (user_key == "displayName") {
            cmd.user.display_name = get_name(user_pairs[j].value);
          }
        }
        break;
      }

      case 4: {  // pubKeyCredParams (array)
        if (!cbor_isa_array(value)) {
          throw CtapError(CtapStatus::kCborUnexpectedType,
                          "CBOR: pubKeyCredParams 不是数组");
        }
        size_t arr_size = cbor_array_size(value);
        cbor_item_t** params = cbor_array_handle(value);
        for (size_t j = 0; j < arr_size; j++) {
          const cbor_item_t* param = params[j];
          if (!cbor_isa_map(param)) {
            throw CtapError(CtapStatus::kCborUnexpectedType,
                            "CBOR: pubKeyCredParams 项不是 map");
          }
          PublicKeyCredentialParameters parsed;
          parsed.type.clear();
          bool has_alg = false;
          bool alg_in_range = true;
          size_t param_size = cbor_map_size(param);
          struct cbor_pair* param_pairs = cbor_map_handle(param);
          for (size_t k = 0; k < param_size; k++) {
            std::string pk = get_string(param_pairs[k].key);
            if (pk == "type") {
              parsed.type = get_string(param_pairs[k].value);
            } else if (pk == "alg") {
              auto alg = get_int32(param_pairs[k].value);
              alg_in_range = alg.has_value();
              parsed.alg = alg.value_or(0);
              has_alg = true;
            }
          }
          if (parsed.type.empty() || !has_alg) {
            throw CtapError(CtapStatus::kMissingParameter,
                            "CBOR: pubKeyCredParams 项缺少 type/alg");
          }
          // 超出 COSE 算法标识范围，不可能是支持的算法
          if (!alg_in_range) {
            spdlog::debug("CBOR: 忽略超出范围的 alg");
            continue;
          }
          cmd.pub_key_cred_params.push_back(std::move(parsed));
        }
        has_params = true;
        break;
      }

      case 5:  // excludeList (array)
        cmd.exclude_list = get_descriptor_list(value);
        break;

      case 6:  // extensions (map)，不处理
        if (!cbor_isa_map(value)) {
          throw CtapError(CtapStatus::kCborUnexpectedType,
                          "CBOR: extensions 不是 map");
        }
        spdlog::debug("CBOR: 忽略 {} 个扩展", cbor_map_size(value));
        break;

      case 7:  // options (map)
        cmd.options = get_options(value);
        break;

      case 8:  // pinUvAuthParam (bytes)
        cmd.pin_uv_auth_param = get_bytes(value);
        break;

      case 9:  // pinUvAuthProtocol (uint)
        cmd.pin_uv_auth_protocol = get_small_uint(value);
        break;

      case 0x0A:  // enterpriseAttestation (uint)
        cmd.enterprise_attestation = get_small_uint(value);
        break;

      default:
        spdlog::debug("CBOR: 忽略未知字段 {}", key);
        break;
    }
  }

  if (!has_client_data_hash || !has_rp || !has_user || !has_params) {
    throw CtapError(CtapStatus::kMissingParameter,
                    "CBOR: MakeCredential 缺少必需字段");
  }
  if (cmd.client_data_hash.size() != kClientDataHashLength) {
    throw CtapError(CtapStatus::kInvalidLength,
                    "CBOR: clientDataHash 长度无效");
  }

  if (cmd.rp.id.size() > kMaxRpIdLength) {
    throw CtapError(CtapStatus::kInvalidLength, "CBOR: rp.id 过长");
  }
  if (cmd.user.id.size() > kMaxUserIdLength) {
    throw CtapError(CtapStatus::kInvalidLength, "CBOR: user.id 过长");
  }

  spdlog::debug("CBOR: MakeCredential 解析完成 - rp_id={}, user={}",
                cmd.rp.id, cmd.user.name);
  return cmd;
}

GetAssertionCommand CborDecoder::parse_get_assertion(
    const std::vector<uint8_t>& data) {
  CborItemPtr item = load_map(data);
  GetAssertionCommand cmd;
  bool has_rp_id = false;
  bool has_client_data_hash = false;

  size_t map_size = cbor_map_size(item.get());
  struct cbor_pair* pairs = cbor_map_handle(item.get());

  for (size_t i = 0; i < map_size; i++) {
    if (!cbor_isa_uint(pairs[i].key)) {
      throw CtapError(CtapStatus::kCborUnexpectedType, "CBOR: 请求键不是整数");
    }
    uint64_t key = cbor_get_int(pairs[i].key);
    const cbor_item_t* value = pairs[i].value;

    switch (key) {
      case 1:  // rpId (string)
        cmd.rp_id = get_string(value);
        has_rp_id = true;
        break;

      case 2:  // clientDataHash (bytes)
        cmd.client_data_hash = get_bytes(value);
        has_client_data_hash = true;
        break;

      case 3:  // allowList (array)
        cmd.allow_list = get_descriptor_list(value);
        break;

      case 4:  // extensions (map)，不处理
        if (!cbor_isa_map(value)) {
          throw CtapError(CtapStatus::kCborUnexpectedType,
                          "CBOR: extensions 不是 map");
        }
        break;

      case 5:  // options (map)
        cmd.options = get_options(value);
        break;

      case 6:  // pinUvAuthParam (bytes)
        cmd.pin_uv_auth_param = get_bytes(value);
        break;

      case 7:  // pinUvAuthProtocol (uint)
        cmd.pin_uv_auth_protocol = get_small_uint(value);
        break;

      default:
        spdlog::debug("CBOR: 忽略未知字段 {}", key);
        break;
    }
  }

  if (!has_rp_id || !has_client_data_hash) {
    throw CtapError(CtapStatus::kMissingParameter,
                    "CBOR: GetAssertion 缺少必需字段");
  }
  if (cmd.client_data_hash.size() != kClientDataHashLength) {
    throw CtapError(CtapStatus::kInvalidLength,
                    "CBOR: clientDataHash 长度无效");
  }

  if (cmd.rp_id.size() > kMaxRpIdLength) {
    throw CtapError(CtapStatus::kInvalidLength, "CBOR: rpId 过长");
  }

  spdlog::debug("CBOR: GetAssertion 解析完成 - rp_id={}", cmd.rp_id);
  return cmd;
}

}  // namespace ctapauth
