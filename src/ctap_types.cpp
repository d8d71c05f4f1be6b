#include "ctapauth/ctap_types.h"

#include "ctapauth/cbor_helper.h"

namespace ctapauth {

Bytes CosePublicKey::to_uncompressed_point() const {
  Bytes point;
  point.reserve(1 + x.size() + y.size());
  point.push_back(0x04);
  point.insert(point.end(), x.begin(), x.end());
  point.insert(point.end(), y.begin(), y.end());
  return point;
}

uint8_t AuthenticatorData::flags() const {
  uint8_t flags = 0;
  if (user_present) flags |= kFlagUserPresent;
  if (user_verified) flags |= kFlagUserVerified;
  if (attested_credential_data) flags |= kFlagAttestedCredentialData;
  return flags;
}

Bytes AuthenticatorData::to_bytes() const {
  Bytes result;

  // RP ID hash (32 bytes)
  result.insert(result.end(), rp_id_hash.begin(), rp_id_hash.end());

  result.push_back(flags());

  // Counter (4 bytes, big-endian)
  result.push_back((sign_count >> 24) & 0xFF);
  result.push_back((sign_count >> 16) & 0xFF);
  result.push_back((sign_count >> 8) & 0xFF);
  result.push_back(sign_count & 0xFF);

  if (attested_credential_data) {
    const auto& attested = *attested_credential_data;

    // AAGUID (16 bytes)
    result.insert(result.end(), attested.aaguid.begin(), attested.aaguid.end());

    // Credential ID length (2 bytes, big-endian)
    uint16_t cred_id_len = static_cast<uint16_t>(attested.credential_id.size());
    result.push_back((cred_id_len >> 8) & 0xFF);
    result.push_back(cred_id_len & 0xFF);
    result.insert(result.end(), attested.credential_id.begin(),
                  attested.credential_id.end());

    // Credential Public Key (COSE_Key)
    Bytes cose_key = CborEncoder::encode_cose_key(attested.credential_public_key);
    result.insert(result.end(), cose_key.begin(), cose_key.end());
  }

  return result;
}

CommandOptions CommandOptions::from_map(
    const std::map<std::string, bool>& options) {
  CommandOptions result;
  for (const auto& [key, value] : options) {
    if (key == "rk") {
      result.rk = value;
    } else if (key == "up") {
      result.up = value;
    } else if (key == "uv") {
      result.uv = value;
    }
  }
  return result;
}

}  // namespace ctapauth
