#include "procura.hxx"
#include <iomanip>
#include <sstream>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

static inline int hex2nibble(char c) {
  if ('0' <= c && c <= '9')
    return c - '0';
  if ('a' <= c && c <= 'f')
    return c - 'a' + 10;
  if ('A' <= c && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> hex2bytes(const std::string &hex) {
  if (hex.length() % 2 != 0) {
    throw delegation_error(delegation_errc::invalid_hex,
                           "odd length hex string");
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(hex.length() / 2);
  for (decltype(hex.length()) i = 0; i < hex.length(); i += 2) {
    auto hi = hex2nibble(hex[i]);
    auto lo = hex2nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw delegation_error(delegation_errc::invalid_hex,
                             "invalid hex character at " + std::to_string(i));
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return bytes;
}

std::string bytes2hex(const uint8_t *data, size_t len) {
  std::stringstream ss;
  ss << std::hex;
  for (size_t i = 0; i < len; ++i) {
    ss << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

digest_t sha256(const std::string &data) {
  digest_t digest{};
  if (!EVP_Digest(data.data(), data.size(), digest.data(), nullptr,
                  EVP_sha256(), nullptr)) {
    throw std::runtime_error("EVP_Digest failed");
  }
  return digest;
}

// Created and randomized once, read-only afterwards. libsecp256k1 allows
// concurrent use of a const context from any number of threads.
static const secp256k1_context *secp256k1_ctx() {
  static const secp256k1_context *ctx = [] {
#define secp256k1_context_flags                                                \
  (SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY)
    secp256k1_context *c = secp256k1_context_create(secp256k1_context_flags);
    if (c == nullptr) {
      throw std::runtime_error("secp256k1_context_create failed");
    }
    unsigned char seed[32];
    if (RAND_bytes(seed, sizeof(seed)) != 1 ||
        !secp256k1_context_randomize(c, seed)) {
      secp256k1_context_destroy(c);
      throw std::runtime_error("failed to randomize secp256k1 context");
    }
    return c;
  }();
  return ctx;
}

signature_t signature_sign(const keys_t &keys, const digest_t &digest) {
  auto ctx = secp256k1_ctx();
  secp256k1_keypair keypair;
  if (!secp256k1_keypair_create(ctx, &keypair, keys.secret_key.data())) {
    throw delegation_error(delegation_errc::invalid_secret_key,
                           "invalid secret key");
  }

  unsigned char aux[32];
  if (RAND_bytes(aux, sizeof(aux)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }

  signature_t sig{};
#ifdef SECP256K1_SCHNORRSIG_EXTRAPARAMS_INIT
  auto ok = secp256k1_schnorrsig_sign32(ctx, sig.data(), digest.data(),
                                        &keypair, aux);
#else
  auto ok =
      secp256k1_schnorrsig_sign(ctx, sig.data(), digest.data(), &keypair, aux);
#endif
  OPENSSL_cleanse(&keypair, sizeof(keypair));
  if (!ok) {
    throw std::runtime_error("secp256k1_schnorrsig_sign failed");
  }
  return sig;
}

bool public_key_valid(const pubkey_t &pubkey) {
  secp256k1_xonly_pubkey pub;
  return secp256k1_xonly_pubkey_parse(secp256k1_ctx(), &pub, pubkey.data());
}

pubkey_t derive_public_key(const seckey_t &secret_key) {
  auto ctx = secp256k1_ctx();
  secp256k1_keypair keypair;
  if (!secp256k1_keypair_create(ctx, &keypair, secret_key.data())) {
    throw delegation_error(delegation_errc::invalid_secret_key,
                           "invalid secret key");
  }
  secp256k1_xonly_pubkey pub;
  pubkey_t pubkey{};
  secp256k1_keypair_xonly_pub(ctx, &pub, nullptr, &keypair);
  secp256k1_xonly_pubkey_serialize(ctx, pubkey.data(), &pub);
  OPENSSL_cleanse(&keypair, sizeof(keypair));
  return pubkey;
}

bool signature_verify(const signature_t &sig, const pubkey_t &pubkey,
                      const digest_t &digest) {
  auto ctx = secp256k1_ctx();
  secp256k1_xonly_pubkey pub;
  if (!secp256k1_xonly_pubkey_parse(ctx, &pub, pubkey.data())) {
    return false;
  }

  return secp256k1_schnorrsig_verify(ctx, sig.data(), digest.data(),
#ifdef SECP256K1_SCHNORRSIG_EXTRAPARAMS_INIT
                                     32,
#endif
                                     &pub);
}

bool check_event(const event_t &ev) {
  nlohmann::json check = nlohmann::json::array({
      0,
      ev.pubkey,
      ev.created_at,
      ev.kind,
      ev.tags,
      ev.content,
  });
  auto dump = check.dump();
  check.clear();

  auto digest = sha256(dump);
  auto id = bytes2hex(digest);
  if (id != ev.id) {
    console->debug("check_event: id mismatch: {}", ev.id);
    return false;
  }

  pubkey_t pubkey;
  signature_t sig;
  try {
    pubkey = parse_public_key(ev.pubkey, false);
    sig = parse_signature(ev.sig);
  } catch (const delegation_error &e) {
    console->debug("check_event: {}", e.what());
    return false;
  }
  if (!signature_verify(sig, pubkey, digest)) {
    console->debug("check_event: invalid signature: {}", ev.id);
    return false;
  }

  if (ev.kind < 0 || ev.created_at < 0) {
    console->debug("check_event: negative kind or created_at: {}", ev.id);
    return false;
  }
  const auto props = event_properties_from_event(ev);
  for (const auto &tag : ev.tags) {
    if (tag.empty() || tag[0] != "delegation")
      continue;

    try {
      auto delegation = delegation_tag_from_tag(tag);
      auto result = validate_delegation_tag(delegation, pubkey, props);
      if (result != validation_result_t::ok) {
        console->debug("check_event: delegation rejected: {}: {}", ev.id,
                       validation_result_string(result));
        return false;
      }
    } catch (const delegation_error &e) {
      console->debug("check_event: {}: {}", ev.id, e.what());
      return false;
    }
  }

  return true;
}
