#include "ctapauth/tpm_sealer.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tss2/tss2_esys.h>
#include <tss2/tss2_mu.h>

#include <cstring>
#include <memory>

namespace ctapauth {

namespace {

struct EsysFree {
  void operator()(void* p) const { Esys_Free(p); }
};
template <typename T>
using EsysPtr = std::unique_ptr<T, EsysFree>;

using CipherCtxPtr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(value >> shift));
  }
}

class BlobReader {
 public:
  explicit BlobReader(const std::vector<uint8_t>& data) : data_(data) {}

  bool u32(uint32_t& out) {
    const uint8_t* p = take(4);
    if (!p) return false;
    out = (uint32_t{p[0]} << 24) | (uint32_t{p[1]} << 16) |
          (uint32_t{p[2]} << 8) | uint32_t{p[3]};
    return true;
  }

  const uint8_t* take(size_t len) {
    if (len > data_.size() - offset_) return nullptr;
    const uint8_t* p = data_.data() + offset_;
    offset_ += len;
    return p;
  }

  bool bytes(size_t len, std::vector<uint8_t>& out) {
    const uint8_t* p = take(len);
    if (!p) return false;
    out.assign(p, p + len);
    return true;
  }

  bool done() const { return offset_ == data_.size(); }

 private:
  const std::vector<uint8_t>& data_;
  size_t offset_ = 0;
};

// owner hierarchy 下的 ECC P-256 存储主密钥
TSS2_RC create_storage_primary(ESYS_CONTEXT* ctx, ESYS_TR* primary) {
  TPM2B_PUBLIC tmpl{};
  tmpl.publicArea.type = TPM2_ALG_ECC;
  tmpl.publicArea.nameAlg = TPM2_ALG_SHA256;
  tmpl.publicArea.objectAttributes =
      TPMA_OBJECT_FIXEDTPM | TPMA_OBJECT_FIXEDPARENT |
      TPMA_OBJECT_SENSITIVEDATAORIGIN | TPMA_OBJECT_USERWITHAUTH |
      TPMA_OBJECT_RESTRICTED | TPMA_OBJECT_DECRYPT;

  TPMS_ECC_PARMS& ecc = tmpl.publicArea.parameters.eccDetail;
  ecc.symmetric.algorithm = TPM2_ALG_AES;
  ecc.symmetric.keyBits.aes = 128;
  ecc.symmetric.mode.aes = TPM2_ALG_CFB;
  ecc.scheme.scheme = TPM2_ALG_NULL;
  ecc.curveID = TPM2_ECC_NIST_P256;
  ecc.kdf.scheme = TPM2_ALG_NULL;

  TPM2B_SENSITIVE_CREATE sensitive{};
  TPM2B_DATA outside_info{};
  TPML_PCR_SELECTION pcrs{};

  return Esys_CreatePrimary(ctx, ESYS_TR_RH_OWNER, ESYS_TR_PASSWORD,
                            ESYS_TR_NONE, ESYS_TR_NONE, &sensitive, &tmpl,
                            &outside_info, &pcrs, primary, nullptr, nullptr,
                            nullptr, nullptr);
}

// 把数据密钥封装成 primary 下的 keyed-hash 对象
TSS2_RC seal_data_key(ESYS_CONTEXT* ctx, ESYS_TR primary,
                      const std::vector<uint8_t>& key, SealedBlob& blob) {
  TPM2B_PUBLIC tmpl{};
  tmpl.publicArea.type = TPM2_ALG_KEYEDHASH;
  tmpl.publicArea.nameAlg = TPM2_ALG_SHA256;
  tmpl.publicArea.objectAttributes =
      TPMA_OBJECT_FIXEDTPM | TPMA_OBJECT_FIXEDPARENT | TPMA_OBJECT_USERWITHAUTH;
  tmpl.publicArea.parameters.keyedHashDetail.scheme.scheme = TPM2_ALG_NULL;

  TPM2B_SENSITIVE_CREATE sensitive{};
  sensitive.sensitive.data.size = static_cast<uint16_t>(key.size());
  memcpy(sensitive.sensitive.data.buffer, key.data(), key.size());

  TPM2B_DATA outside_info{};
  TPML_PCR_SELECTION pcrs{};
  TPM2B_PRIVATE* out_private = nullptr;
  TPM2B_PUBLIC* out_public = nullptr;

  TSS2_RC rc = Esys_Create(ctx, primary, ESYS_TR_PASSWORD, ESYS_TR_NONE,
                           ESYS_TR_NONE, &sensitive, &tmpl, &outside_info,
                           &pcrs, &out_private, &out_public, nullptr, nullptr,
                           nullptr);
  OPENSSL_cleanse(&sensitive, sizeof(sensitive));

  EsysPtr<TPM2B_PRIVATE> private_part(out_private);
  EsysPtr<TPM2B_PUBLIC> public_part(out_public);
  if (rc != TSS2_RC_SUCCESS) return rc;

  uint8_t pub_buf[sizeof(TPM2B_PUBLIC)];
  uint8_t priv_buf[sizeof(TPM2B_PRIVATE)];
  size_t pub_len = 0;
  size_t priv_len = 0;
  rc = Tss2_MU_TPM2B_PUBLIC_Marshal(public_part.get(), pub_buf,
                                    sizeof(pub_buf), &pub_len);
  if (rc != TSS2_RC_SUCCESS) return rc;
  rc = Tss2_MU_TPM2B_PRIVATE_Marshal(private_part.get(), priv_buf,
                                     sizeof(priv_buf), &priv_len);
  if (rc != TSS2_RC_SUCCESS) return rc;

  blob.key_public.assign(pub_buf, pub_buf + pub_len);
  blob.key_private.assign(priv_buf, priv_buf + priv_len);
  return TSS2_RC_SUCCESS;
}

TSS2_RC unseal_data_key(ESYS_CONTEXT* ctx, ESYS_TR primary,
                        const SealedBlob& blob, std::vector<uint8_t>& key) {
  TPM2B_PUBLIC key_public{};
  TPM2B_PRIVATE key_private{};
  size_t pos = 0;
  TSS2_RC rc = Tss2_MU_TPM2B_PUBLIC_Unmarshal(
      blob.key_public.data(), blob.key_public.size(), &pos, &key_public);
  if (rc != TSS2_RC_SUCCESS) return rc;
  pos = 0;
  rc = Tss2_MU_TPM2B_PRIVATE_Unmarshal(
      blob.key_private.data(), blob.key_private.size(), &pos, &key_private);
  if (rc != TSS2_RC_SUCCESS) return rc;

  ESYS_TR object = ESYS_TR_NONE;
  rc = Esys_Load(ctx, primary, ESYS_TR_PASSWORD, ESYS_TR_NONE, ESYS_TR_NONE,
                 &key_private, &key_public, &object);
  if (rc != TSS2_RC_SUCCESS) return rc;

  TPM2B_SENSITIVE_DATA* out = nullptr;
  rc = Esys_Unseal(ctx, object, ESYS_TR_PASSWORD, ESYS_TR_NONE, ESYS_TR_NONE,
                   &out);
  Esys_FlushContext(ctx, object);

  EsysPtr<TPM2B_SENSITIVE_DATA> sensitive(out);
  if (rc == TSS2_RC_SUCCESS) {
    key.assign(sensitive->buffer, sensitive->buffer + sensitive->size);
    OPENSSL_cleanse(sensitive->buffer, sensitive->size);
  }
  return rc;
}

}  // namespace

// ============== 封装 blob 格式 ==============

std::vector<uint8_t> encode_sealed_blob(const SealedBlob& blob) {
  std::vector<uint8_t> out;
  out.reserve(12 + blob.key_public.size() + blob.key_private.size() +
              kSealIvSize + kSealTagSize + blob.ciphertext.size());
  put_u32(out, static_cast<uint32_t>(blob.key_public.size()));
  out.insert(out.end(), blob.key_public.begin(), blob.key_public.end());
  put_u32(out, static_cast<uint32_t>(blob.key_private.size()));
  out.insert(out.end(), blob.key_private.begin(), blob.key_private.end());
  out.insert(out.end(), blob.iv.begin(), blob.iv.end());
  out.insert(out.end(), blob.tag.begin(), blob.tag.end());
  put_u32(out, static_cast<uint32_t>(blob.ciphertext.size()));
  out.insert(out.end(), blob.ciphertext.begin(), blob.ciphertext.end());
  return out;
}

std::optional<SealedBlob> decode_sealed_blob(
    const std::vector<uint8_t>& data) {
  BlobReader reader(data);
  SealedBlob blob;

  uint32_t pub_len = 0;
  uint32_t priv_len = 0;
  uint32_t cipher_len = 0;
  if (!reader.u32(pub_len) || pub_len == 0 ||
      pub_len > sizeof(TPM2B_PUBLIC) ||
      !reader.bytes(pub_len, blob.key_public) || !reader.u32(priv_len) ||
      priv_len == 0 ||
      priv_len > sizeof(TPM2B_PRIVATE) ||
      !reader.bytes(priv_len, blob.key_private) ||
      !reader.bytes(kSealIvSize, blob.iv) ||
      !reader.bytes(kSealTagSize, blob.tag) || !reader.u32(cipher_len) ||
      cipher_len == 0 || !reader.bytes(cipher_len, blob.ciphertext) ||
      !reader.done()) {
    return std::nullopt;
  }
  return blob;
}

bool aes_gcm_encrypt(const std::vector<uint8_t>& key,
                     const std::vector<uint8_t>& plaintext, SealedBlob& blob) {
  if (key.size() != kSealKeySize || blob.iv.size() != kSealIvSize) {
    return false;
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if (!ctx) return false;

  blob.ciphertext.resize(plaintext.size());
  blob.tag.resize(kSealTagSize);
  int len = 0;
  int tail = 0;
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(),
                         blob.iv.data()) != 1 ||
      EVP_EncryptUpdate(ctx.get(), blob.ciphertext.data(), &len,
                        plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1 ||
      EVP_EncryptFinal_ex(ctx.get(), blob.ciphertext.data() + len, &tail) !=
          1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kSealTagSize),
                          blob.tag.data()) != 1) {
    return false;
  }
  blob.ciphertext.resize(len + tail);
  return true;
}

std::optional<std::vector<uint8_t>> aes_gcm_decrypt(
    const std::vector<uint8_t>& key, const SealedBlob& blob) {
  if (key.size() != kSealKeySize || blob.iv.size() != kSealIvSize ||
      blob.tag.size() != kSealTagSize) {
    return std::nullopt;
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  if (!ctx) return std::nullopt;

  // EVP_CTRL_GCM_SET_TAG 要求可写指针
  std::vector<uint8_t> tag = blob.tag;
  std::vector<uint8_t> plaintext(blob.ciphertext.size());
  int len = 0;
  int tail = 0;
  bool ok =
      EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(),
                         blob.iv.data()) == 1 &&
      EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                        blob.ciphertext.data(),
                        static_cast<int>(blob.ciphertext.size())) == 1 &&
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(kSealTagSize), tag.data()) == 1 &&
      EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &tail) == 1;
  if (!ok) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return std::nullopt;
  }
  plaintext.resize(len + tail);
  return plaintext;
}

// ============== TpmSealer 实现 ==============

TpmSealer::~TpmSealer() { close(); }

bool TpmSealer::fail(const std::string& message) {
  last_error_ = message;
  spdlog::error("TPM: {}", message);
  return false;
}

void TpmSealer::close() {
  if (primary_ != 0) {
    Esys_FlushContext(esys_, primary_);
    primary_ = 0;
  }
  if (esys_) {
    Esys_Finalize(&esys_);
    esys_ = nullptr;
  }
}

bool TpmSealer::initialize() {
  if (is_available()) return true;

  TSS2_RC rc = Esys_Initialize(&esys_, nullptr, nullptr);
  if (rc != TSS2_RC_SUCCESS) {
    // 没有 TPM 是常见情况，调用方决定是否退回明文
    last_error_ = fmt::format("无法连接 TPM (rc=0x{:X})", rc);
    spdlog::warn("TPM: {}", last_error_);
    esys_ = nullptr;
    return false;
  }

  ESYS_TR primary = ESYS_TR_NONE;
  rc = create_storage_primary(esys_, &primary);
  if (rc != TSS2_RC_SUCCESS) {
    close();
    return fail(fmt::format("无法创建存储主密钥 (rc=0x{:X})", rc));
  }

  primary_ = primary;
  spdlog::info("TPM: 封装已就绪 (primary=0x{:X})", primary_);
  return true;
}

std::optional<std::vector<uint8_t>> TpmSealer::seal(
    const std::vector<uint8_t>& data) {
  if (!is_available()) {
    fail("TPM 未初始化");
    return std::nullopt;
  }
  if (data.empty()) {
    fail("没有要封装的数据");
    return std::nullopt;
  }

  std::vector<uint8_t> key(kSealKeySize);
  SealedBlob blob;
  blob.iv.resize(kSealIvSize);
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1 ||
      RAND_bytes(blob.iv.data(), static_cast<int>(blob.iv.size())) != 1) {
    OPENSSL_cleanse(key.data(), key.size());
    fail("随机数生成失败");
    return std::nullopt;
  }

  TSS2_RC rc = seal_data_key(esys_, primary_, key, blob);
  bool encrypted = rc == TSS2_RC_SUCCESS && aes_gcm_encrypt(key, data, blob);
  OPENSSL_cleanse(key.data(), key.size());

  if (rc != TSS2_RC_SUCCESS) {
    fail(fmt::format("封装数据密钥失败 (rc=0x{:X})", rc));
    return std::nullopt;
  }
  if (!encrypted) {
    fail("AES-GCM 加密失败");
    return std::nullopt;
  }

  std::vector<uint8_t> out = encode_sealed_blob(blob);
  spdlog::debug("TPM: 已封装 {} 字节 -> {} 字节", data.size(), out.size());
  return out;
}

std::optional<std::vector<uint8_t>> TpmSealer::unseal(
    const std::vector<uint8_t>& data) {
  if (!is_available()) {
    fail("TPM 未初始化");
    return std::nullopt;
  }

  auto blob = decode_sealed_blob(data);
  if (!blob) {
    fail("封装数据格式错误");
    return std::nullopt;
  }

  std::vector<uint8_t> key;
  TSS2_RC rc = unseal_data_key(esys_, primary_, *blob, key);
  if (rc != TSS2_RC_SUCCESS || key.size() != kSealKeySize) {
    OPENSSL_cleanse(key.data(), key.size());
    fail(fmt::format("解封数据密钥失败 (rc=0x{:X})", rc));
    return std::nullopt;
  }

  auto plaintext = aes_gcm_decrypt(key, *blob);
  OPENSSL_cleanse(key.data(), key.size());
  if (!plaintext) {
    fail("AES-GCM 解密失败 (数据可能被篡改)");
    return std::nullopt;
  }

  spdlog::debug("TPM: 已解封 {} 字节", plaintext->size());
  return plaintext;
}

}  // namespace ctapauth
