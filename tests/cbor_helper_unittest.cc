#include "ctapauth/cbor_helper.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>
#include <string>
#include <vector>

#include "ctapauth/ctap_error.h"

namespace ctapauth {

namespace {

// 拼接若干字节片段
Bytes Join(std::initializer_list<Bytes> parts) {
  Bytes out;
  for (const auto& part : parts) {
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

Bytes Text(const std::string& s) { return Bytes(s.begin(), s.end()); }

const Bytes kHash = Bytes(32, 0x42);

// clang-format off
// Key(01) - clientDataHash, Bytes(32)
const Bytes kClientDataHashEntry = Join({{0x01, 0x58, 0x20}, kHash});

// Key(02) - rp {"id": "example.com", "name": "Example"}
const Bytes kRpEntry = Join({
    {0x02, 0xA2},
    {0x62}, Text("id"), {0x6B}, Text("example.com"),
    {0x64}, Text("name"), {0x67}, Text("Example"),
});

// Key(03) - user {"id": h'01', "name": "alice"}
const Bytes kUserEntry = Join({
    {0x03, 0xA2},
    {0x62}, Text("id"), {0x41, 0x01},
    {0x64}, Text("name"), {0x65}, Text("alice"),
});

// Key(04) - pubKeyCredParams [{"alg": -7, "type": "public-key"}]
const Bytes kParamsEntry = Join({
    {0x04, 0x81, 0xA2},
    {0x63}, Text("alg"), {0x26},
    {0x64}, Text("type"), {0x6A}, Text("public-key"),
});

// [{"id": h'0102', "type": "public-key"}]
const Bytes kDescriptorList = Join({
    {0x81, 0xA2},
    {0x62}, Text("id"), {0x42, 0x01, 0x02},
    {0x64}, Text("type"), {0x6A}, Text("public-key"),
});
// clang-format on

TEST(CborDecoderTest, ParseMinimalMakeCredential) {
  Bytes request = Join({{0xA4}, kClientDataHashEntry, kRpEntry, kUserEntry,
                        kParamsEntry});

  MakeCredentialCommand command = CborDecoder::parse_make_credential(request);
  EXPECT_EQ(kHash, command.client_data_hash);
  EXPECT_EQ("example.com", command.rp.id);
  EXPECT_EQ("Example", command.rp.name);
  EXPECT_EQ(Bytes({0x01}), command.user.id);
  EXPECT_EQ("alice", command.user.name);
  EXPECT_TRUE(command.user.display_name.empty());
  ASSERT_EQ(1u, command.pub_key_cred_params.size());
  EXPECT_EQ(-7, command.pub_key_cred_params[0].alg);
  EXPECT_EQ("public-key", command.pub_key_cred_params[0].type);
  EXPECT_FALSE(command.exclude_list);
  EXPECT_FALSE(command.options);
  EXPECT_FALSE(command.pin_uv_auth_param);
  EXPECT_FALSE(command.enterprise_attestation);
}

TEST(CborDecoderTest, ParseMakeCredentialOptionalFields) {
  // clang-format off
  Bytes request = Join({
      {0xA9}, kClientDataHashEntry, kRpEntry, kUserEntry, kParamsEntry,
      // Key(05) - excludeList
      {0x05}, kDescriptorList,
      // Key(07) - options {"rk": false}
      {0x07, 0xA1, 0x62}, Text("rk"), {0xF4},
      // Key(08) - pinUvAuthParam h'00'
      {0x08, 0x41, 0x00},
      // Key(09) - pinUvAuthProtocol 1
      {0x09, 0x01},
      // Key(0A) - enterpriseAttestation 1
      {0x0A, 0x01},
  });
  // clang-format on

  MakeCredentialCommand command = CborDecoder::parse_make_credential(request);
  ASSERT_TRUE(command.exclude_list);
  ASSERT_EQ(1u, command.exclude_list->size());
  EXPECT_EQ(Bytes({0x01, 0x02}), (*command.exclude_list)[0].id);
  ASSERT_TRUE(command.options);
  EXPECT_FALSE(command.options->at("rk"));
  ASSERT_TRUE(command.pin_uv_auth_param);
  EXPECT_EQ(Bytes({0x00}), *command.pin_uv_auth_param);
  EXPECT_EQ(1, command.pin_uv_auth_protocol.value_or(0));
  EXPECT_EQ(1, command.enterprise_attestation.value_or(0));
}

TEST(CborDecoderTest, MakeCredentialMissingParams) {
  Bytes request = Join({{0xA3}, kClientDataHashEntry, kRpEntry, kUserEntry});
  try {
    CborDecoder::parse_make_credential(request);
    FAIL() << "expected CtapError";
  } catch (const CtapError& e) {
    EXPECT_EQ(CtapStatus::kMissingParameter, e.status());
  }
}

TEST(CborDecoderTest, MakeCredentialShortClientDataHash) {
  Bytes request = Join({{0xA4, 0x01, 0x41, 0x00}, kRpEntry, kUserEntry,
                        kParamsEntry});
  try {
    CborDecoder::parse_make_credential(request);
    FAIL() << "expected CtapError";
  } catch (const CtapError& e) {
    EXPECT_EQ(CtapStatus::kInvalidLength, e.status());
  }
}

TEST(CborDecoderTest, MakeCredentialWrongFieldType) {
  // clientDataHash 是文本串
  Bytes request = Join({{0xA4, 0x01, 0x61, 'x'}, kRpEntry, kUserEntry,
                        kParamsEntry});
  try {
    CborDecoder::parse_make_credential(request);
    FAIL() << "expected CtapError";
  } catch (const CtapError& e) {
    EXPECT_EQ(CtapStatus::kCborUnexpectedType, e.status());
  }
}

TEST(CborDecoderTest, RejectsMalformedCbor) {
  const std::vector<Bytes> cases = {
      {},
      // Map(1) 缺少内容
      {0xA1},
      // 合法 map 之后还有多余字节
      {0xA0, 0x00},
  };
  for (const auto& request : cases) {
    try {
      CborDecoder::parse_make_credential(request);
      ADD_FAILURE() << "expected CtapError";
    } catch (const CtapError& e) {
      EXPECT_EQ(CtapStatus::kInvalidCbor, e.status());
    }
  }
}

TEST(CborDecoderTest, RejectsNonMapRequest) {
  try {
    CborDecoder::parse_get_assertion({0x80});
    FAIL() << "expected CtapError";
  } catch (const CtapError& e) {
    EXPECT_EQ(CtapStatus::kCborUnexpectedType, e.status());
  }
}

TEST(CborDecoderTest, ParseGetAssertion) {
  // clang-format off
  Bytes request = Join({
      {0xA4},
      // Key(01) - rpId
      {0x01, 0x6B}, Text("example.com"),
      // Key(02) - clientDataHash
      {0x02, 0x58, 0x20}, kHash,
      // Key(03) - allowList
      {0x03}, kDescriptorList,
      // Key(05) - options {"up": false}
      {0x05, 0xA1, 0x62}, Text("up"), {0xF4},
  });
  // clang-format on

  GetAssertionCommand command = CborDecoder::parse_get_assertion(request);
  EXPECT_EQ("example.com", command.rp_id);
  EXPECT_EQ(kHash, command.client_data_hash);
  ASSERT_TRUE(command.allow_list);
  ASSERT_EQ(1u, command.allow_list->size());
  EXPECT_EQ("public-key", (*command.allow_list)[0].type);
  ASSERT_TRUE(command.options);
  EXPECT_FALSE(command.options->at("up"));
  EXPECT_FALSE(command.pin_uv_auth_param);
}

TEST(CborDecoderTest, GetAssertionMissingRpId) {
  Bytes request = Join({{0xA1, 0x02, 0x58, 0x20}, kHash});
  try {
    CborDecoder::parse_get_assertion(request);
    FAIL() << "expected CtapError";
  } catch (const CtapError& e) {
    EXPECT_EQ(CtapStatus::kMissingParameter, e.status());
  }
}

TEST(CborDecoderTest, LongNamesTruncated) {
  // "名" 是 3 字节 UTF-8，30 个共 90 字节
  std::string wide_name;
  for (int i = 0; i < 30; i++) wide_name += "名";

  // clang-format off
  Bytes request = Join({
      {0xA4}, kClientDataHashEntry,
      // Key(02) - rp {"id": "example.com", "name": "r" * 100}
      {0x02, 0xA2},
      {0x62}, Text("id"), {0x6B}, Text("example.com"),
      {0x64}, Text("name"), {0x78, 0x64}, Bytes(100, 'r'),
      // Key(03) - user {"id": h'01', "name": "名" * 30, "displayName": "d" * 64}
      {0x03, 0xA3},
      {0x62}, Text("id"), {0x41, 0x01},
      {0x64}, Text("name"), {0x78, 0x5A}, Text(wide_name),
      {0x6B}, Text("displayName"), {0x78, 0x40}, Bytes(64, 'd'),
      kParamsEntry,
  });
  // clang-format on

  MakeCredentialCommand command = CborDecoder::parse_make_credential(request);
  EXPECT_EQ(std::string(64, 'r'), command.rp.name);
  // 不拆开多字节字符: 21 个字符 = 63 字节
  EXPECT_EQ(wide_name.substr(0, 63), command.user.name);
  EXPECT_EQ(std::string(64, 'd'), command.user.display_name);
}

TEST(CborDecoderTest, OversizedIdsRejected) {
  // clang-format off
  // user.id 65 字节
  Bytes long_user_id = Join({
      {0xA4}, kClientDataHashEntry, kRpEntry,
      {0x03, 0xA2},
      {0x62}, Text("id"), {0x58, 0x41}, Bytes(65, 0x01),
      {0x64}, Text("name"), {0x65}, Text("alice"),
      kParamsEntry,
  });
  // rp.id 254 字节
  Bytes long_rp_id = Join({
      {0xA4}, kClientDataHashEntry,
      {0x02, 0xA1, 0x62}, Text("id"), {0x78, 0xFE}, Bytes(254, 'a'),
      kUserEntry, kParamsEntry,
  });
  Bytes long_assertion_rp_id = Join({
      {0xA2},
      {0x01, 0x78, 0xFE}, Bytes(254, 'a'),
      {0x02, 0x58, 0x20}, kHash,
  });
  // clang-format on

  for (const Bytes& request : {long_user_id, long_rp_id}) {
    try {
      CborDecoder::parse_make_credential(request);
      FAIL() << "expected CtapError";
    } catch (const CtapError& e) {
      EXPECT_EQ(CtapStatus::kInvalidLength, e.status());
    }
  }
  try {
    CborDecoder::parse_get_assertion(long_assertion_rp_id);
    FAIL() << "expected CtapError";
  } catch (const CtapError& e) {
    EXPECT_EQ(CtapStatus::kInvalidLength, e.status());
  }

  // 64 字节的 user.id 可以接受
  // clang-format off
  Bytes max_user_id = Join({
      {0xA4}, kClientDataHashEntry, kRpEntry,
      {0x03, 0xA1, 0x62}, Text("id"), {0x58, 0x40}, Bytes(64, 0x01),
      kParamsEntry,
  });
  // clang-format on
  EXPECT_EQ(Bytes(64, 0x01),
            CborDecoder::parse_make_credential(max_user_id).user.id);
}

TEST(CborDecoderTest, OutOfRangeAlgorithmDropped) {
  // clang-format off
  Bytes request = Join({
      {0xA4}, kClientDataHashEntry, kRpEntry, kUserEntry,
      // Key(04) - pubKeyCredParams, 4 项
      {0x04, 0x84},
      // {"alg": 4294967289, "type": "public-key"}, 低 32 位等于 -7
      {0xA2, 0x63}, Text("alg"), {0x1A, 0xFF, 0xFF, 0xFF, 0xF9},
      {0x64}, Text("type"), {0x6A}, Text("public-key"),
      // {"alg": 2^64 - 7, ...}
      {0xA2, 0x63}, Text("alg"),
      {0x1B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xF9},
      {0x64}, Text("type"), {0x6A}, Text("public-key"),
      // {"alg": -4294967296, ...}
      {0xA2, 0x63}, Text("alg"), {0x3A, 0xFF, 0xFF, 0xFF, 0xFF},
      {0x64}, Text("type"), {0x6A}, Text("public-key"),
      // {"alg": -257, ...}
      {0xA2, 0x63}, Text("alg"), {0x39, 0x01, 0x00},
      {0x64}, Text("type"), {0x6A}, Text("public-key"),
  });
  // clang-format on

  MakeCredentialCommand command = CborDecoder::parse_make_credential(request);
  ASSERT_EQ(1u, command.pub_key_cred_params.size());
  EXPECT_EQ(-257, command.pub_key_cred_params[0].alg);
}

TEST(CborDecoderTest, OutOfRangeIntegersRejected) {
  // clang-format off
  // enterpriseAttestation 2^32
  Bytes huge_enterprise = Join({
      {0xA5}, kClientDataHashEntry, kRpEntry, kUserEntry, kParamsEntry,
      {0x0A, 0x1B, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00},
  });
  // pinUvAuthProtocol -1
  Bytes negative_protocol = Join({
      {0xA5}, kClientDataHashEntry, kRpEntry, kUserEntry, kParamsEntry,
      {0x09, 0x20},
  });
  // clang-format on

  for (const Bytes& request : {huge_enterprise, negative_protocol}) {
    try {
      CborDecoder::parse_make_credential(request);
      FAIL() << "expected CtapError";
    } catch (const CtapError& e) {
      EXPECT_EQ(CtapStatus::kInvalidParameter, e.status());
    }
  }
}

TEST(CborEncoderTest, EncodeGetInfo) {
  GetInfoResponse info;
  info.versions = {"FIDO_2_1", "U2F_V2"};
  info.aaguid = Bytes(16, 0x00);
  info.options = {{"plat", false}, {"rk", true}, {"up", true}};
  info.algorithms = {PublicKeyCredentialParameters::es256()};

  // clang-format off
  Bytes expected = Join({
      // Map(5)
      {0xA5},
      // Key(01) - versions ["FIDO_2_1", "U2F_V2"]
      {0x01, 0x82, 0x68}, Text("FIDO_2_1"), {0x66}, Text("U2F_V2"),
      // Key(03) - AAGUID, Bytes(16)
      {0x03, 0x50}, Bytes(16, 0x00),
      // Key(04) - options, 键按长度优先排序
      {0x04, 0xA3},
      {0x62}, Text("rk"), {0xF5},
      {0x62}, Text("up"), {0xF5},
      {0x64}, Text("plat"), {0xF4},
      // Key(0A) - algorithms
      {0x0A, 0x81, 0xA2},
      {0x63}, Text("alg"), {0x26},
      {0x64}, Text("type"), {0x6A}, Text("public-key"),
      // Key(14) - remainingDiscoverableCredentials 0
      {0x14, 0x00},
  });
  // clang-format on

  EXPECT_EQ(expected, CborEncoder::encode_get_info(info));
}

AuthenticatorData SimpleAuthData() {
  AuthenticatorData data;
  data.rp_id_hash = Bytes(32, 0x11);
  data.user_present = true;
  data.sign_count = 2;
  return data;
}

TEST(CborEncoderTest, EncodeMakeCredentialResponse) {
  MakeCredentialResponse response;
  response.auth_data = SimpleAuthData();
  response.att_stmt.sig = {0x30, 0x01};

  // clang-format off
  Bytes self_attestation = Join({
      {0xA3},
      // Key(01) - fmt "packed"
      {0x01, 0x66}, Text("packed"),
      // Key(02) - authData, Bytes(37)
      {0x02, 0x58, 0x25}, response.auth_data.to_bytes(),
      // Key(03) - attStmt {"alg": -7, "sig": h'3001'}
      {0x03, 0xA2},
      {0x63}, Text("alg"), {0x26},
      {0x63}, Text("sig"), {0x42, 0x30, 0x01},
  });
  // clang-format on
  EXPECT_EQ(self_attestation,
            CborEncoder::encode_make_credential_response(response));

  response.att_stmt.attestation_certificate = {0xAA, 0xBB, 0xCC};

  // clang-format off
  Bytes basic_attestation = Join({
      {0xA3},
      {0x01, 0x66}, Text("packed"),
      {0x02, 0x58, 0x25}, response.auth_data.to_bytes(),
      // attStmt {"alg", "sig", "x5c": [h'AABBCC']}
      {0x03, 0xA3},
      {0x63}, Text("alg"), {0x26},
      {0x63}, Text("sig"), {0x42, 0x30, 0x01},
      {0x63}, Text("x5c"), {0x81, 0x43, 0xAA, 0xBB, 0xCC},
  });
  // clang-format on
  EXPECT_EQ(basic_attestation,
            CborEncoder::encode_make_credential_response(response));
}

TEST(CborEncoderTest, EncodeGetAssertionResponse) {
  GetAssertionResponse response;
  response.credential.id = {0x01, 0x02};
  response.auth_data = SimpleAuthData();
  response.signature = {0x30, 0x01};

  // clang-format off
  Bytes common = Join({
      // Key(01) - credential {"id": h'0102', "type": "public-key"}
      {0x01, 0xA2},
      {0x62}, Text("id"), {0x42, 0x01, 0x02},
      {0x64}, Text("type"), {0x6A}, Text("public-key"),
      // Key(02) - authData
      {0x02, 0x58, 0x25}, response.auth_data.to_bytes(),
      // Key(03) - signature
      {0x03, 0x42, 0x30, 0x01},
  });
  // clang-format on
  EXPECT_EQ(Join({{0xA3}, common}),
            CborEncoder::encode_get_assertion_response(response));

  response.user = UserEntity{{0x01}, "alice", "Alice"};

  // clang-format off
  Bytes with_user = Join({
      {0xA4}, common,
      // Key(04) - user {"id", "name", "displayName"}
      {0x04, 0xA3},
      {0x62}, Text("id"), {0x41, 0x01},
      {0x64}, Text("name"), {0x65}, Text("alice"),
      {0x6B}, Text("displayName"), {0x65}, Text("Alice"),
  });
  // clang-format on
  EXPECT_EQ(with_user, CborEncoder::encode_get_assertion_response(response));
}

TEST(CborEncoderTest, TextWithEmbeddedNul) {
  GetAssertionResponse response;
  response.credential.id = {0x01, 0x02};
  response.auth_data = SimpleAuthData();
  response.signature = {0x30, 0x01};
  response.user = UserEntity{{0x01}, std::string("a\0b", 3), ""};

  Bytes encoded = CborEncoder::encode_get_assertion_response(response);
  // user.name 按长度编码，NUL 之后的字节保留
  Bytes name = Join({{0x64}, Text("name"), {0x63, 'a', 0x00, 'b'}});
  EXPECT_NE(encoded.end(), std::search(encoded.begin(), encoded.end(),
                                       name.begin(), name.end()));
}

}  // namespace

}  // namespace ctapauth
