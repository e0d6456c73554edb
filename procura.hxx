#ifndef _PROCURA_H_
#define _PROCURA_H_

#include <array>
#include <compare>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using pubkey_t = std::array<uint8_t, 32>;
using seckey_t = std::array<uint8_t, 32>;
using signature_t = std::array<uint8_t, 64>;
using digest_t = std::array<uint8_t, 32>;

enum class delegation_errc {
  invalid_condition,
  numeric_parse,
  delegation_tag_parse,
  invalid_hex,
  invalid_public_key,
  invalid_secret_key,
  invalid_signature_encoding,
  invalid_bech32,
};

class delegation_error : public std::runtime_error {
public:
  delegation_error(delegation_errc code, const std::string &what)
      : std::runtime_error(what), code_(code), cause_(code) {}
  delegation_error(delegation_errc code, delegation_errc cause,
                   const std::string &what)
      : std::runtime_error(what), code_(code), cause_(cause) {}

  delegation_errc code() const noexcept { return code_; }
  // the underlying failure when this error wraps another one
  delegation_errc cause() const noexcept { return cause_; }

private:
  delegation_errc code_;
  delegation_errc cause_;
};

enum class validation_result_t {
  ok,
  invalid_signature,
  invalid_kind,
  created_too_early,
  created_too_late,
};

const char *validation_result_string(validation_result_t);

using event_t = struct event_t {
  std::string id;
  std::string pubkey;
  std::time_t created_at;
  int kind;
  std::vector<std::vector<std::string>> tags;
  std::string content;
  std::string sig;
};

using event_properties_t = struct event_properties_t {
  uint64_t kind;
  uint64_t created_time;
};

// kind and created_at must not be negative; check_event rejects such events
event_properties_t event_properties_from_event(const event_t &);

using condition_t = struct condition_t {
  enum class type_t { kind, created_before, created_after };
  type_t type;
  uint64_t value;

  auto operator<=>(const condition_t &) const = default;
};

using conditions_t = std::vector<condition_t>;

condition_t parse_condition(const std::string &);
std::string format_condition(const condition_t &);
conditions_t parse_conditions(const std::string &);
std::string format_conditions(const conditions_t &);
validation_result_t evaluate(const condition_t &, const event_properties_t &);
validation_result_t evaluate(const conditions_t &, const event_properties_t &);

// signing capability; the secret never leaves this struct
using keys_t = struct keys_t {
  seckey_t secret_key;
  pubkey_t public_key;
};

std::vector<uint8_t> hex2bytes(const std::string &);
std::string bytes2hex(const uint8_t *, size_t);
template <size_t N> inline std::string bytes2hex(const std::array<uint8_t, N> &a) {
  return bytes2hex(a.data(), a.size());
}

std::string bech32_encode(const std::string &hrp, const std::vector<uint8_t> &);
std::vector<uint8_t> bech32_decode(const std::string &, const std::string &hrp);

pubkey_t parse_public_key(const std::string &, bool allow_bech32 = true);
signature_t parse_signature(const std::string &);
keys_t keys_from_secret_key(const std::string &);
keys_t keys_from_secret_key(const seckey_t &);
std::string public_key_to_npub(const pubkey_t &);

bool public_key_valid(const pubkey_t &);
pubkey_t derive_public_key(const seckey_t &);

digest_t sha256(const std::string &);
signature_t signature_sign(const keys_t &, const digest_t &);
bool signature_verify(const signature_t &, const pubkey_t &, const digest_t &);

using delegation_tag_t = struct delegation_tag_t {
  pubkey_t delegator_pubkey;
  conditions_t conditions;
  signature_t signature;

  bool operator==(const delegation_tag_t &) const = default;
};

std::string build_token(const pubkey_t &delegatee_pubkey,
                        const std::string &conditions);
signature_t sign_delegation(const keys_t &delegator_keys,
                            const pubkey_t &delegatee_pubkey,
                            const std::string &conditions);
bool verify_delegation_signature(const pubkey_t &delegator_pubkey,
                                 const signature_t &signature,
                                 const pubkey_t &delegatee_pubkey,
                                 const std::string &conditions);

delegation_tag_t create_delegation_tag(const keys_t &delegator_keys,
                                       const pubkey_t &delegatee_pubkey,
                                       const std::string &conditions);
validation_result_t validate_delegation_tag(const delegation_tag_t &,
                                            const pubkey_t &delegatee_pubkey,
                                            const event_properties_t &);
std::string serialize_delegation_tag(const delegation_tag_t &);
delegation_tag_t deserialize_delegation_tag(const std::string &);
delegation_tag_t delegation_tag_from_tag(const std::vector<std::string> &);

bool check_event(const event_t &);

inline void to_json(nlohmann::json &j, const event_t &e) {
  j = nlohmann::json{
      {"id", e.id},           {"pubkey", e.pubkey},
      {"content", e.content}, {"created_at", e.created_at},
      {"kind", e.kind},       {"tags", e.tags},
      {"sig", e.sig},
  };
}

inline void from_json(const nlohmann::json &j, event_t &e) {
  j.at("id").get_to(e.id);
  j.at("pubkey").get_to(e.pubkey);
  j.at("content").get_to(e.content);
  j.at("created_at").get_to(e.created_at);
  j.at("kind").get_to(e.kind);
  j.at("tags").get_to(e.tags);
  j.at("sig").get_to(e.sig);
}

inline void to_json(nlohmann::json &j, const delegation_tag_t &t) {
  j = nlohmann::json::array({
      "delegation",
      bytes2hex(t.delegator_pubkey),
      format_conditions(t.conditions),
      bytes2hex(t.signature),
  });
}

#ifdef INITIALIZE_LOGGER
auto console = spdlog::stderr_color_mt("procura");
#else
extern std::shared_ptr<spdlog::logger> console;
#endif

#endif
