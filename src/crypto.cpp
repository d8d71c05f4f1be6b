#include "ctapauth/crypto.h"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace ctapauth {

// P-256 的 OpenSSL 组名
static const char* kP256GroupName = "prime256v1";
static constexpr size_t kP256PrivateKeySize = 32;
static constexpr size_t kP256PublicKeySize = 65;

// 取出 OpenSSL 错误队列中最近的一条，方便写日志
static std::string openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) return "unknown";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

// 用 OSSL_PARAM 构造 P-256 EVP_PKEY；priv 为空时只构造公钥
static EVP_PKEY* build_p256_key(const std::vector<uint8_t>& pub_key,
                                const BIGNUM* priv_bn) {
  OSSL_PARAM_BLD* param_bld = OSSL_PARAM_BLD_new();
  if (!param_bld) return nullptr;

  bool ok = OSSL_PARAM_BLD_push_utf8_string(
                param_bld, OSSL_PKEY_PARAM_GROUP_NAME, kP256GroupName, 0) ==
                1 &&
            OSSL_PARAM_BLD_push_octet_string(param_bld, OSSL_PKEY_PARAM_PUB_KEY,
                                             pub_key.data(),
                                             pub_key.size()) == 1;
  if (ok && priv_bn) {
    ok = OSSL_PARAM_BLD_push_BN(param_bld, OSSL_PKEY_PARAM_PRIV_KEY,
                                priv_bn) == 1;
  }

  OSSL_PARAM* params = ok ? OSSL_PARAM_BLD_to_param(param_bld) : nullptr;
  OSSL_PARAM_BLD_free(param_bld);
  if (!params) return nullptr;

  EVP_PKEY* pkey = nullptr;
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr);
  if (ctx) {
    int selection = priv_bn ? EVP_PKEY_KEYPAIR : EVP_PKEY_PUBLIC_KEY;
    if (EVP_PKEY_fromdata_init(ctx) <= 0 ||
        EVP_PKEY_fromdata(ctx, &pkey, selection, params) <= 0) {
      pkey = nullptr;
    }
    EVP_PKEY_CTX_free(ctx);
  }

  OSSL_PARAM_free(params);
  return pkey;
}

ECKeyPair::ECKeyPair() = default;

ECKeyPair::~ECKeyPair() {
  if (pkey_) {
    EVP_PKEY_free(pkey_);
    pkey_ = nullptr;
  }
}

ECKeyPair::ECKeyPair(ECKeyPair&& other) noexcept : pkey_(other.pkey_) {
  other.pkey_ = nullptr;
}

ECKeyPair& ECKeyPair::operator=(ECKeyPair&& other) noexcept {
  if (this != &other) {
    if (pkey_) {
      EVP_PKEY_free(pkey_);
    }
    pkey_ = other.pkey_;
    other.pkey_ = nullptr;
  }
  return *this;
}

bool ECKeyPair::generate() {
  if (pkey_) {
    EVP_PKEY_free(pkey_);
    pkey_ = nullptr;
  }

  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
  if (!ctx) {
    spdlog::error("Crypto: EVP_PKEY_CTX_new_id 失败: {}", openssl_error());
    return false;
  }

  if (EVP_PKEY_keygen_init(ctx) <= 0) {
    spdlog::error("Crypto: EVP_PKEY_keygen_init 失败: {}", openssl_error());
    EVP_PKEY_CTX_free(ctx);
    return false;
  }

  if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_X9_62_prime256v1) <= 0) {
    spdlog::error("Crypto: 设置 P-256 曲线失败: {}", openssl_error());
    EVP_PKEY_CTX_free(ctx);
    return false;
  }

  if (EVP_PKEY_keygen(ctx, &pkey_) <= 0) {
    spdlog::error("Crypto: EVP_PKEY_keygen 失败: {}", openssl_error());
    EVP_PKEY_CTX_free(ctx);
    pkey_ = nullptr;
    return false;
  }

  EVP_PKEY_CTX_free(ctx);
  return true;
}

std::vector<uint8_t> ECKeyPair::get_public_key() const {
  std::vector<uint8_t> result;
  if (!pkey_) return result;

  // 获取公钥大小
  size_t len = 0;
  if (EVP_PKEY_get_octet_string_param(pkey_, OSSL_PKEY_PARAM_PUB_KEY, nullptr,
                                      0, &len) != 1) {
    spdlog::error("Crypto: 无法获取公钥长度");
    return result;
  }

  result.resize(len);
  if (EVP_PKEY_get_octet_string_param(pkey_, OSSL_PKEY_PARAM_PUB_KEY,
                                      result.data(), len, &len) != 1) {
    spdlog::error("Crypto: 无法获取公钥");
    return {};
  }

  result.resize(len);
  return result;
}

std::vector<uint8_t> ECKeyPair::get_private_key() const {
  std::vector<uint8_t> result;
  if (!pkey_) return result;

  BIGNUM* priv_bn = nullptr;
  if (EVP_PKEY_get_bn_param(pkey_, OSSL_PKEY_PARAM_PRIV_KEY, &priv_bn) != 1) {
    spdlog::error("Crypto: 无法获取私钥");
    return result;
  }

  // 左侧补零到 32 字节
  result.resize(kP256PrivateKeySize);
  if (BN_bn2binpad(priv_bn, result.data(), kP256PrivateKeySize) < 0) {
    BN_clear_free(priv_bn);
    return {};
  }

  BN_clear_free(priv_bn);
  return result;
}

bool ECKeyPair::set_private_key(const std::vector<uint8_t>& private_key) {
  if (private_key.size() != kP256PrivateKeySize) {
    spdlog::error("Crypto: 私钥长度无效 ({} 字节)", private_key.size());
    return false;
  }

  BIGNUM* priv_bn = BN_bin2bn(private_key.data(), private_key.size(), nullptr);
  if (!priv_bn) {
    spdlog::error("Crypto: 无法从私钥创建 BIGNUM");
    return false;
  }

  // 获取 P-256 曲线参数并计算公钥点
  EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1);
  EC_POINT* pub_point = group ? EC_POINT_new(group) : nullptr;
  if (!pub_point ||
      !EC_POINT_mul(group, pub_point, priv_bn, nullptr, nullptr, nullptr)) {
    EC_POINT_free(pub_point);
    EC_GROUP_free(group);
    BN_clear_free(priv_bn);
    spdlog::error("Crypto: 无法从私钥计算公钥");
    return false;
  }

  size_t pub_len = EC_POINT_point2oct(
      group, pub_point, POINT_CONVERSION_UNCOMPRESSED, nullptr, 0, nullptr);
  std::vector<uint8_t> pub_key(pub_len);
  EC_POINT_point2oct(group, pub_point, POINT_CONVERSION_UNCOMPRESSED,
                     pub_key.data(), pub_len, nullptr);

  EC_POINT_free(pub_point);
  EC_GROUP_free(group);

  EVP_PKEY* pkey = build_p256_key(pub_key, priv_bn);
  BN_clear_free(priv_bn);
  if (!pkey) {
    spdlog::error("Crypto: 构建私钥失败: {}", openssl_error());
    return false;
  }

  if (pkey_) EVP_PKEY_free(pkey_);
  pkey_ = pkey;
  return true;
}

bool ECKeyPair::set_public_key(const std::vector<uint8_t>& pub_key) {
  if (pub_key.size() != kP256PublicKeySize || pub_key[0] != 0x04) {
    spdlog::error("Crypto: 公钥格式无效 ({} 字节)", pub_key.size());
    return false;
  }

  EVP_PKEY* pkey = build_p256_key(pub_key, nullptr);
  if (!pkey) {
    spdlog::error("Crypto: 导入公钥失败: {}", openssl_error());
    return false;
  }

  if (pkey_) EVP_PKEY_free(pkey_);
  pkey_ = pkey;
  return true;
}

bool ECKeyPair::load_private_key_pem(const std::string& pem) {
  BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  if (!bio) return false;

  EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);
  if (!pkey) {
    spdlog::error("Crypto: 无法解析 PEM 私钥: {}", openssl_error());
    return false;
  }

  char group[64] = {0};
  size_t group_len = 0;
  if (!EVP_PKEY_is_a(pkey, "EC") ||
      EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME, group,
                                     sizeof(group), &group_len) != 1 ||
      std::strcmp(group, kP256GroupName) != 0) {
    spdlog::error("Crypto: PEM 私钥不是 P-256 密钥");
    EVP_PKEY_free(pkey);
    return false;
  }

  if (pkey_) EVP_PKEY_free(pkey_);
  pkey_ = pkey;
  return true;
}

std::vector<uint8_t> ECKeyPair::sign(const std::vector<uint8_t>& data) const {
  std::vector<uint8_t> result;
  if (!pkey_) return result;

  EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
  if (!md_ctx) return result;

  if (EVP_DigestSignInit(md_ctx, nullptr, EVP_sha256(), nullptr, pkey_) <= 0) {
    EVP_MD_CTX_free(md_ctx);
    return result;
  }

  if (EVP_DigestSignUpdate(md_ctx, data.data(), data.size()) <= 0) {
    EVP_MD_CTX_free(md_ctx);
    return result;
  }

  size_t sig_len = 0;
  if (EVP_DigestSignFinal(md_ctx, nullptr, &sig_len) <= 0) {
    EVP_MD_CTX_free(md_ctx);
    return result;
  }

  result.resize(sig_len);
  if (EVP_DigestSignFinal(md_ctx, result.data(), &sig_len) <= 0) {
    EVP_MD_CTX_free(md_ctx);
    return {};
  }

  result.resize(sig_len);
  EVP_MD_CTX_free(md_ctx);
  return result;
}

bool ECKeyPair::verify(const std::vector<uint8_t>& data,
                       const std::vector<uint8_t>& signature) const {
  if (!pkey_) return false;

  EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
  if (!md_ctx) return false;

  if (EVP_DigestVerifyInit(md_ctx, nullptr, EVP_sha256(), nullptr, pkey_) <=
      0) {
    EVP_MD_CTX_free(md_ctx);
    return false;
  }

  if (EVP_DigestVerifyUpdate(md_ctx, data.data(), data.size()) <= 0) {
    EVP_MD_CTX_free(md_ctx);
    return false;
  }

  int result =
      EVP_DigestVerifyFinal(md_ctx, signature.data(), signature.size());
  EVP_MD_CTX_free(md_ctx);
  return result == 1;
}

// CryptoUtils 实现

std::vector<uint8_t> CryptoUtils::sha256(const std::vector<uint8_t>& data) {
  std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
  SHA256(data.data(), data.size(), hash.data());
  return hash;
}

std::vector<uint8_t> CryptoUtils::sha256(const std::string& data) {
  std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash.data());
  return hash;
}

std::vector<uint8_t> CryptoUtils::random_bytes(size_t len) {
  std::vector<uint8_t> result(len);
  if (RAND_bytes(result.data(), static_cast<int>(len)) != 1) {
    spdlog::error("Crypto: RAND_bytes 失败: {}", openssl_error());
    return {};
  }
  return result;
}

std::vector<uint8_t> CryptoUtils::generate_self_signed_cert(
    const ECKeyPair& key_pair, const std::string& common_name, int days) {
  std::vector<uint8_t> result;
  if (!key_pair.pkey_) return result;

  X509* x509 = X509_new();
  if (!x509) return result;

  // 设置版本为 V3
  X509_set_version(x509, 2);

  // 设置序列号
  ASN1_INTEGER* serial = ASN1_INTEGER_new();
  ASN1_INTEGER_set(serial, 1);
  X509_set_serialNumber(x509, serial);
  ASN1_INTEGER_free(serial);

  // 设置有效期
  X509_gmtime_adj(X509_getm_notBefore(x509), 0);
  X509_gmtime_adj(X509_getm_notAfter(x509), 60L * 60 * 24 * days);

  // 设置公钥
  X509_set_pubkey(x509, key_pair.pkey_);

  // 主题和颁发者 (自签名，所以相同)
  // packed attestation 要求 OU = "Authenticator Attestation"
  X509_NAME* name = X509_get_subject_name(x509);
  X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                             reinterpret_cast<const unsigned char*>("ctapauth"),
                             -1, -1, 0);
  X509_NAME_add_entry_by_txt(
      name, "OU", MBSTRING_ASC,
      reinterpret_cast<const unsigned char*>("Authenticator Attestation"), -1,
      -1, 0);
  X509_NAME_add_entry_by_txt(
      name, "CN", MBSTRING_ASC,
      reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
  X509_set_issuer_name(x509, name);

  // basicConstraints: CA:FALSE
  X509V3_CTX ext_ctx;
  X509V3_set_ctx_nodb(&ext_ctx);
  X509V3_set_ctx(&ext_ctx, x509, x509, nullptr, nullptr, 0);
  X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ext_ctx,
                                            NID_basic_constraints, "CA:FALSE");
  if (ext) {
    X509_add_ext(x509, ext, -1);
    X509_EXTENSION_free(ext);
  }

  // 签名
  if (X509_sign(x509, key_pair.pkey_, EVP_sha256()) <= 0) {
    spdlog::error("Crypto: 证书签名失败: {}", openssl_error());
    X509_free(x509);
    return result;
  }

  // 导出为 DER 格式
  int len = i2d_X509(x509, nullptr);
  if (len > 0) {
    result.resize(len);
    unsigned char* p = result.data();
    i2d_X509(x509, &p);
  }

  X509_free(x509);
  return result;
}

std::vector<uint8_t> CryptoUtils::certificate_pem_to_der(
    const std::string& pem) {
  std::vector<uint8_t> result;

  BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  if (!bio) return result;

  X509* x509 = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);
  if (!x509) {
    spdlog::error("Crypto: 无法解析 PEM 证书: {}", openssl_error());
    return result;
  }

  int len = i2d_X509(x509, nullptr);
  if (len > 0) {
    result.resize(len);
    unsigned char* p = result.data();
    i2d_X509(x509, &p);
  }

  X509_free(x509);
  return result;
}

// DER -> X509*，调用方负责释放
static X509* parse_der_certificate(const std::vector<uint8_t>& cert_der) {
  const unsigned char* p = cert_der.data();
  return d2i_X509(nullptr, &p, static_cast<long>(cert_der.size()));
}

std::vector<uint8_t> CryptoUtils::certificate_public_key(
    const std::vector<uint8_t>& cert_der) {
  std::vector<uint8_t> result;

  X509* x509 = parse_der_certificate(cert_der);
  if (!x509) return result;

  EVP_PKEY* pkey = X509_get0_pubkey(x509);
  size_t len = 0;
  if (pkey && EVP_PKEY_get_octet_string_param(pkey, OSSL_PKEY_PARAM_PUB_KEY,
                                              nullptr, 0, &len) == 1) {
    result.resize(len);
    if (EVP_PKEY_get_octet_string_param(pkey, OSSL_PKEY_PARAM_PUB_KEY,
                                        result.data(), len, &len) != 1) {
      result.clear();
    }
  }

  X509_free(x509);
  return result;
}

bool CryptoUtils::certificate_matches_key(const std::vector<uint8_t>& cert_der,
                                          const ECKeyPair& key_pair) {
  if (!key_pair.pkey_) return false;

  X509* x509 = parse_der_certificate(cert_der);
  if (!x509) return false;

  bool matches = X509_check_private_key(x509, key_pair.pkey_) == 1;
  X509_free(x509);
  return matches;
}

}  // namespace ctapauth
