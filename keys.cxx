#include "procura.hxx"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <openssl/crypto.h>

// NIP-19 keys are plain bech32 (BIP-173), not bech32m.
static const char *bech32_charset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

static uint32_t bech32_polymod(const std::vector<uint8_t> &values) {
  static const uint32_t gen[5] = {0x3b6a57b2, 0x26508e6d, 0x1ea119fa,
                                  0x3d4233dd, 0x2a1462b3};
  uint32_t chk = 1;
  for (auto v : values) {
    auto top = chk >> 25;
    chk = ((chk & 0x1ffffff) << 5) ^ v;
    for (int i = 0; i < 5; ++i) {
      if ((top >> i) & 1)
        chk ^= gen[i];
    }
  }
  return chk;
}

static std::vector<uint8_t> bech32_hrp_expand(const std::string &hrp) {
  std::vector<uint8_t> ret;
  ret.reserve(hrp.size() * 2 + 1);
  for (auto c : hrp)
    ret.push_back(static_cast<uint8_t>(c) >> 5);
  ret.push_back(0);
  for (auto c : hrp)
    ret.push_back(static_cast<uint8_t>(c) & 31);
  return ret;
}

static bool convert_bits(std::vector<uint8_t> &out,
                         const std::vector<uint8_t> &in, int from, int to,
                         bool pad) {
  uint32_t acc = 0;
  int bits = 0;
  const uint32_t maxv = (1 << to) - 1;
  for (auto value : in) {
    if ((value >> from) != 0)
      return false;
    acc = (acc << from) | value;
    bits += from;
    while (bits >= to) {
      bits -= to;
      out.push_back((acc >> bits) & maxv);
    }
  }
  if (pad) {
    if (bits > 0)
      out.push_back((acc << (to - bits)) & maxv);
  } else if (bits >= from || ((acc << (to - bits)) & maxv)) {
    return false;
  }
  return true;
}

std::string bech32_encode(const std::string &hrp,
                          const std::vector<uint8_t> &data) {
  std::vector<uint8_t> values;
  convert_bits(values, data, 8, 5, true);

  auto enc = bech32_hrp_expand(hrp);
  enc.insert(enc.end(), values.begin(), values.end());
  enc.resize(enc.size() + 6);
  auto mod = bech32_polymod(enc) ^ 1;

  std::string ret = hrp + "1";
  for (auto v : values)
    ret += bech32_charset[v];
  for (int i = 0; i < 6; ++i)
    ret += bech32_charset[(mod >> (5 * (5 - i))) & 31];
  return ret;
}

std::vector<uint8_t> bech32_decode(const std::string &str,
                                   const std::string &hrp) {
  bool lower = false, upper = false;
  for (auto c : str) {
    if (c < 33 || c > 126)
      throw delegation_error(delegation_errc::invalid_bech32,
                             "invalid bech32 character");
    if (c >= 'a' && c <= 'z')
      lower = true;
    if (c >= 'A' && c <= 'Z')
      upper = true;
  }
  if (lower && upper) {
    throw delegation_error(delegation_errc::invalid_bech32,
                           "mixed case bech32 string");
  }

  std::string s = str;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto pos = s.rfind('1');
  if (pos == std::string::npos || pos == 0 || pos + 7 > s.size()) {
    throw delegation_error(delegation_errc::invalid_bech32,
                           "malformed bech32 string");
  }
  if (s.substr(0, pos) != hrp) {
    throw delegation_error(delegation_errc::invalid_bech32,
                           "unexpected bech32 prefix: " + s.substr(0, pos) +
                               ", want " + hrp);
  }

  std::vector<uint8_t> values;
  for (auto i = pos + 1; i < s.size(); ++i) {
    const char *p = std::strchr(bech32_charset, s[i]);
    if (p == nullptr || *p == '\0') {
      throw delegation_error(delegation_errc::invalid_bech32,
                             "invalid bech32 character");
    }
    values.push_back(static_cast<uint8_t>(p - bech32_charset));
  }

  auto chk = bech32_hrp_expand(hrp);
  chk.insert(chk.end(), values.begin(), values.end());
  if (bech32_polymod(chk) != 1) {
    throw delegation_error(delegation_errc::invalid_bech32,
                           "invalid bech32 checksum");
  }

  values.resize(values.size() - 6);
  std::vector<uint8_t> data;
  if (!convert_bits(data, values, 5, 8, false)) {
    throw delegation_error(delegation_errc::invalid_bech32,
                           "invalid bech32 padding");
  }
  return data;
}

// accepts 64 hex characters, or bech32 with the given prefix when allowed
static std::array<uint8_t, 32> decode_key32(const std::string &s,
                                            const std::string &hrp,
                                            delegation_errc errc,
                                            bool allow_bech32) {
  std::vector<uint8_t> bytes;
  try {
    if (allow_bech32 && !s.compare(0, hrp.size() + 1, hrp + "1")) {
      bytes = bech32_decode(s, hrp);
    } else {
      bytes = hex2bytes(s);
    }
  } catch (const delegation_error &e) {
    throw delegation_error(errc, e.code(), e.what());
  }
  if (bytes.size() != 32) {
    OPENSSL_cleanse(bytes.data(), bytes.size());
    throw delegation_error(errc, "invalid key length: " +
                                     std::to_string(bytes.size()));
  }
  std::array<uint8_t, 32> key;
  std::copy(bytes.begin(), bytes.end(), key.begin());
  OPENSSL_cleanse(bytes.data(), bytes.size());
  return key;
}

pubkey_t parse_public_key(const std::string &s, bool allow_bech32) {
  auto pubkey = decode_key32(s, "npub", delegation_errc::invalid_public_key,
                             allow_bech32);
  if (!public_key_valid(pubkey)) {
    throw delegation_error(delegation_errc::invalid_public_key,
                           "public key is not a valid curve point");
  }
  return pubkey;
}

signature_t parse_signature(const std::string &s) {
  std::vector<uint8_t> bytes;
  try {
    bytes = hex2bytes(s);
  } catch (const delegation_error &e) {
    throw delegation_error(delegation_errc::invalid_signature_encoding,
                           e.code(), e.what());
  }
  if (bytes.size() != 64) {
    throw delegation_error(delegation_errc::invalid_signature_encoding,
                           "invalid signature length: " +
                               std::to_string(bytes.size()));
  }
  signature_t sig;
  std::copy(bytes.begin(), bytes.end(), sig.begin());
  return sig;
}

keys_t keys_from_secret_key(const seckey_t &secret_key) {
  return {secret_key, derive_public_key(secret_key)};
}

keys_t keys_from_secret_key(const std::string &s) {
  auto secret_key =
      decode_key32(s, "nsec", delegation_errc::invalid_secret_key, true);
  auto keys = keys_from_secret_key(secret_key);
  OPENSSL_cleanse(secret_key.data(), secret_key.size());
  return keys;
}

std::string public_key_to_npub(const pubkey_t &pubkey) {
  return bech32_encode("npub",
                       std::vector<uint8_t>(pubkey.begin(), pubkey.end()));
}
