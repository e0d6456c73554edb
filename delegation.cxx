#include "procura.hxx"

static const std::string delegation_keyword = "delegation";

// nostr:delegation:<pubkey of publisher (delegatee)>:<conditions query string>
std::string build_token(const pubkey_t &delegatee_pubkey,
                        const std::string &conditions) {
  return "nostr:" + delegation_keyword + ":" + bytes2hex(delegatee_pubkey) +
         ":" + conditions;
}

signature_t sign_delegation(const keys_t &delegator_keys,
                            const pubkey_t &delegatee_pubkey,
                            const std::string &conditions) {
  auto token = build_token(delegatee_pubkey, conditions);
  return signature_sign(delegator_keys, sha256(token));
}

bool verify_delegation_signature(const pubkey_t &delegator_pubkey,
                                 const signature_t &signature,
                                 const pubkey_t &delegatee_pubkey,
                                 const std::string &conditions) {
  auto token = build_token(delegatee_pubkey, conditions);
  return signature_verify(signature, delegator_pubkey, sha256(token));
}

delegation_tag_t create_delegation_tag(const keys_t &delegator_keys,
                                       const pubkey_t &delegatee_pubkey,
                                       const std::string &conditions) {
  // reject malformed conditions before anything gets signed
  auto parsed = parse_conditions(conditions);
  auto signature = sign_delegation(delegator_keys, delegatee_pubkey, conditions);
  // store the key that actually signed, not whatever keys_t carries
  return {derive_public_key(delegator_keys.secret_key), std::move(parsed),
          signature};
}

validation_result_t validate_delegation_tag(const delegation_tag_t &tag,
                                            const pubkey_t &delegatee_pubkey,
                                            const event_properties_t &ep) {
  if (!verify_delegation_signature(tag.delegator_pubkey, tag.signature,
                                   delegatee_pubkey,
                                   format_conditions(tag.conditions))) {
    console->debug("delegation signature mismatch: delegator={} delegatee={}",
                   bytes2hex(tag.delegator_pubkey),
                   bytes2hex(delegatee_pubkey));
    return validation_result_t::invalid_signature;
  }
  return evaluate(tag.conditions, ep);
}

std::string serialize_delegation_tag(const delegation_tag_t &tag) {
  nlohmann::json j = tag;
  return j.dump();
}

delegation_tag_t delegation_tag_from_tag(const std::vector<std::string> &tag) {
  if (tag.size() != 4) {
    throw delegation_error(delegation_errc::delegation_tag_parse,
                           "delegation tag must have 4 elements, got " +
                               std::to_string(tag.size()));
  }
  if (tag[0] != delegation_keyword) {
    throw delegation_error(delegation_errc::delegation_tag_parse,
                           "not a delegation tag: " + tag[0]);
  }

  delegation_tag_t result;
  const char *field = "delegator pubkey";
  try {
    // the wire format is hex only
    result.delegator_pubkey = parse_public_key(tag[1], false);
    field = "conditions";
    result.conditions = parse_conditions(tag[2]);
    field = "signature";
    result.signature = parse_signature(tag[3]);
  } catch (const delegation_error &e) {
    throw delegation_error(delegation_errc::delegation_tag_parse, e.code(),
                           std::string("delegation tag ") + field + ": " +
                               e.what());
  }
  return result;
}

delegation_tag_t deserialize_delegation_tag(const std::string &s) {
  std::vector<std::string> tag;
  try {
    tag = nlohmann::json::parse(s).get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception &e) {
    console->debug("delegation tag is not a string array: {}", e.what());
    throw delegation_error(delegation_errc::delegation_tag_parse,
                           std::string("delegation tag parse error: ") +
                               e.what());
  }
  return delegation_tag_from_tag(tag);
}
