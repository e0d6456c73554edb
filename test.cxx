// clang-format off

#define INITIALIZE_LOGGER

#include <picotest.h>
#undef ok
#define PROCURA_TEST
#include "procura.hxx"

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <thread>

static const std::string delegator_nsec = "nsec1ktekw0hr5evjs0n9nyyquz4sue568snypy2rwk5mpv6hl2hq3vtsk0kpae";
static const std::string delegator_hex = "1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4";
static const std::string delegatee_npub = "npub1h652adkpv4lr8k66cadg8yg0wl5wcc29z4lyw66m3rrwskcl4v6qr82xez";
static const std::string delegatee_hex = "bea8aeb6c1657e33db5ac75a83910f77e8ec6145157e476b5b88c6e85b1fab34";
static const std::string wrong_npub = "npub1zju3cgxq9p6f2c2jzrhhwuse94p7efkj5dp59eerh53hqd08j4dszevd7s";
static const std::string conditions_str = "kind=1&created_at>1676067553&created_at<1678659553";
static const std::string known_tag = R"(["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1&created_at>1676067553&created_at<1678659553","369aed09c1ad52fceb77ecd6c16f2433eac4a3803fc41c58876a5b60f4f36b9493d5115e5ec5a0ce6c3668ffe5b58d47f2cbc97233833bb7e908f66dbbbd9d36"])";

static event_t string2event(const std::string& string) {
  return nlohmann::json::parse(string).get<event_t>();
}

template <typename F>
static bool throws_errc(F f, delegation_errc code) {
  try {
    f();
  } catch (const delegation_error& e) {
    return e.code() == code;
  }
  return false;
}

static void test_procura_condition() {
  auto c = parse_condition("kind=1");
  _ok(c.type == condition_t::type_t::kind && c.value == 1, "kind=1 should be parsed as kind");

  c = parse_condition("created_at<10000");
  _ok(c.type == condition_t::type_t::created_before && c.value == 10000, "created_at< should be parsed as created_before");

  c = parse_condition("created_at>10000");
  _ok(c.type == condition_t::type_t::created_after && c.value == 10000, "created_at> should be parsed as created_after");

  c = parse_condition("kind=18446744073709551615");
  _ok(c.value == 18446744073709551615ULL, "max u64 should be accepted");

  _ok(format_condition({condition_t::type_t::kind, 7}) == "kind=7", "format kind");
  _ok(format_condition({condition_t::type_t::created_before, 5}) == "created_at<5", "format created_before");
  _ok(format_condition({condition_t::type_t::created_after, 5}) == "created_at>5", "format created_after");

  _ok(throws_errc([] { parse_condition("__invalid_condition__"); }, delegation_errc::invalid_condition), "unknown condition must be rejected");
  _ok(throws_errc([] { parse_condition(" kind=1"); }, delegation_errc::invalid_condition), "leading whitespace must be rejected");
  _ok(throws_errc([] { parse_condition("created_at=1"); }, delegation_errc::invalid_condition), "created_at= is not a condition");
  _ok(throws_errc([] { parse_condition("kind=__invalid_number__"); }, delegation_errc::numeric_parse), "non numeric kind must be rejected");
  _ok(throws_errc([] { parse_condition("kind="); }, delegation_errc::numeric_parse), "empty number must be rejected");
  _ok(throws_errc([] { parse_condition("kind=-1"); }, delegation_errc::numeric_parse), "negative number must be rejected");
  _ok(parse_condition("kind=+1") == condition_t{condition_t::type_t::kind, 1}, "explicit plus sign should be accepted");
  _ok(format_condition(parse_condition("created_at>+1000")) == "created_at>1000", "plus sign is dropped when formatting");
  _ok(throws_errc([] { parse_condition("kind=+"); }, delegation_errc::numeric_parse), "lone plus sign must be rejected");
  _ok(throws_errc([] { parse_condition("kind=++1"); }, delegation_errc::numeric_parse), "double plus sign must be rejected");
  _ok(throws_errc([] { parse_condition("kind=1 "); }, delegation_errc::numeric_parse), "trailing whitespace must be rejected");
  _ok(throws_errc([] { parse_condition("created_at<18446744073709551616"); }, delegation_errc::numeric_parse), "overflow must be rejected");
}

static void test_procura_conditions() {
  auto cs = parse_conditions(conditions_str);
  _ok(cs.size() == 3, "three conditions should be parsed");
  _ok(cs[0] == condition_t{condition_t::type_t::kind, 1}, "first condition is kind");
  _ok(cs[1] == condition_t{condition_t::type_t::created_after, 1676067553}, "second condition is created_after");
  _ok(cs[2] == condition_t{condition_t::type_t::created_before, 1678659553}, "third condition is created_before");
  _ok(format_conditions(cs) == conditions_str, "conditions should be formatted in insertion order");
  _ok(parse_conditions(format_conditions(cs)) == cs, "parse and format should round trip");

  _ok(parse_conditions("").empty(), "empty string should give no conditions");
  _ok(format_conditions({}) == "", "no conditions should format to empty string");

  auto one = parse_conditions("created_at<10000");
  _ok(one.size() == 1 && format_conditions(one) == "created_at<10000", "single condition");

  conditions_t built;
  built.push_back({condition_t::type_t::kind, 1});
  _ok(format_conditions(built) == "kind=1", "kind=1");
  built.push_back({condition_t::type_t::created_after, 1674834236});
  built.push_back({condition_t::type_t::created_before, 1677426236});
  _ok(format_conditions(built) == "kind=1&created_at>1674834236&created_at<1677426236", "built conditions");

  _ok(throws_errc([] { parse_conditions("__invalid_condition__&kind=1"); }, delegation_errc::invalid_condition), "invalid first condition aborts parsing");
  _ok(throws_errc([] { parse_conditions("kind=1&kind=x"); }, delegation_errc::numeric_parse), "invalid later condition aborts parsing");
  _ok(throws_errc([] { parse_conditions("kind=1&"); }, delegation_errc::invalid_condition), "trailing separator must be rejected");
  _ok(throws_errc([] { parse_conditions("&"); }, delegation_errc::invalid_condition), "lone separator must be rejected");
}

static void test_procura_evaluate() {
  auto c_kind = parse_conditions("kind=3");
  _ok(evaluate(c_kind, {3, 0}) == validation_result_t::ok, "kind 3 matches");
  _ok(evaluate(c_kind, {5, 0}) == validation_result_t::invalid_kind, "kind 5 does not match");

  auto c_impossible = parse_conditions("kind=3&kind=4");
  _ok(evaluate(c_impossible, {3, 0}) == validation_result_t::invalid_kind, "contradicting kinds never pass");

  auto c_first = parse_conditions("created_at<1000&kind=3");
  _ok(evaluate(c_first, {4, 2000}) == validation_result_t::created_too_late, "first failing condition wins");

  auto c_before = parse_conditions("created_at<1000");
  _ok(evaluate(c_before, {3, 999}) == validation_result_t::ok, "999 is before 1000");
  _ok(evaluate(c_before, {3, 1000}) == validation_result_t::created_too_late, "1000 is not before 1000");
  _ok(evaluate(c_before, {3, 2000}) == validation_result_t::created_too_late, "2000 is not before 1000");

  auto c_after = parse_conditions("created_at>1000");
  _ok(evaluate(c_after, {3, 1001}) == validation_result_t::ok, "1001 is after 1000");
  _ok(evaluate(c_after, {3, 1000}) == validation_result_t::created_too_early, "1000 is not after 1000");
  _ok(evaluate(c_after, {3, 500}) == validation_result_t::created_too_early, "500 is not after 1000");

  auto c_complex = parse_conditions(conditions_str);
  _ok(evaluate(c_complex, {1, 1677000000}) == validation_result_t::ok, "in window");
  _ok(evaluate(c_complex, {5, 1677000000}) == validation_result_t::invalid_kind, "wrong kind");
  _ok(evaluate(c_complex, {1, 1674000000}) == validation_result_t::created_too_early, "too early");
  _ok(evaluate(c_complex, {1, 1699000000}) == validation_result_t::created_too_late, "too late");

  _ok(evaluate(conditions_t{}, {42, 0}) == validation_result_t::ok, "no conditions always pass");
}

static void test_procura_keys() {
  _ok(bytes2hex(parse_public_key(delegatee_npub)) == delegatee_hex, "npub should decode");
  _ok(parse_public_key(delegatee_hex) == parse_public_key(delegatee_npub), "hex and npub should agree");
  _ok(public_key_to_npub(parse_public_key(delegator_hex)) == "npub1rfze4zn25ezp6jqt5ejlhrajrfx0az72ed7cwvq0spr22k9rlnjq93lmd4", "npub should encode");

  auto keys = keys_from_secret_key(delegator_nsec);
  _ok(bytes2hex(keys.public_key) == delegator_hex, "public key should be derived from nsec");
  keys = keys_from_secret_key("ee35e8bb71131c02c1d7e73231daa48e9953d329a4b701f7133c8f46dd21139c");
  _ok(bytes2hex(keys.public_key) == "8e0d3d3eb2881ec137a11debe736a9086715a8c8beeeda615780064d68bc25dd", "public key should be derived from hex");

  _ok(throws_errc([] { parse_public_key("1a459a8a"); }, delegation_errc::invalid_public_key), "short public key must be rejected");
  _ok(throws_errc([] { parse_public_key("zz459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4"); }, delegation_errc::invalid_public_key), "non hex public key must be rejected");
  _ok(throws_errc([] { parse_public_key("npub1h652adkpv4lr8k66cadg8yg0wl5wcc29z4lyw66m3rrwskcl4v6qr82xeq"); }, delegation_errc::invalid_public_key), "bad npub checksum must be rejected");
  _ok(throws_errc([] { parse_public_key(delegatee_npub, false); }, delegation_errc::invalid_public_key), "npub must be rejected where only hex is allowed");
  _ok(throws_errc([] { parse_public_key("0000000000000000000000000000000000000000000000000000000000000000"); }, delegation_errc::invalid_public_key), "x=0 is not on the curve");
  _ok(throws_errc([] { keys_from_secret_key("0000000000000000000000000000000000000000000000000000000000000000"); }, delegation_errc::invalid_secret_key), "zero secret key must be rejected");
  _ok(throws_errc([] { keys_from_secret_key(delegatee_npub); }, delegation_errc::invalid_secret_key), "npub is not a secret key");
  _ok(throws_errc([] { keys_from_secret_key("b2f3673ee3a659283e6599080e0ab0e669a3c2640914375a9b0b357faae08b"); }, delegation_errc::invalid_secret_key), "short secret key must be rejected");
  _ok(throws_errc([] { keys_from_secret_key("b2f3673ee3a659283e6599080e0ab0e669a3c2640914375a9b0b357faae08b1700"); }, delegation_errc::invalid_secret_key), "long secret key must be rejected");
  _ok(throws_errc([] { parse_signature("abcd"); }, delegation_errc::invalid_signature_encoding), "short signature must be rejected");
  _ok(throws_errc([] { bech32_decode("npub1", "npub"); }, delegation_errc::invalid_bech32), "truncated bech32 must be rejected");
  _ok(throws_errc([] { hex2bytes("abc"); }, delegation_errc::invalid_hex), "odd hex must be rejected");

  _ok(bytes2hex(hex2bytes("00FFa0")) == "00ffa0", "hex is encoded lowercase");
}

static void test_procura_token() {
  auto delegatee = parse_public_key("npub1gae33na4gfaeelrx48arwc2sc8wmccs3tt38emmjg9ltjktfzwtqtl4l6u");
  auto token = build_token(delegatee, "kind=1&created_at>1674834236&created_at<1677426236");
  _ok(token == "nostr:delegation:477318cfb5427b9cfc66a9fa376150c1ddbc62115ae27cef72417eb959691396:kind=1&created_at>1674834236&created_at<1677426236", "token format");
  _ok(build_token(delegatee, "") == "nostr:delegation:477318cfb5427b9cfc66a9fa376150c1ddbc62115ae27cef72417eb959691396:", "token with empty conditions");
}

static void test_procura_sign() {
  auto keys = keys_from_secret_key("ee35e8bb71131c02c1d7e73231daa48e9953d329a4b701f7133c8f46dd21139c");
  auto delegatee = parse_public_key("npub1gae33na4gfaeelrx48arwc2sc8wmccs3tt38emmjg9ltjktfzwtqtl4l6u");
  std::string conditions = "kind=1&created_at>1674834236&created_at<1677426236";

  auto sig = parse_signature("f9f00fcf8480686d9da6dfde1187d4ba19c54f6ace4c73361a14db429c4b96eb30b29283d6ea1f06ba9e18e06e408244c689039ddadbacffc56060f3da5b04b8");
  _ok(verify_delegation_signature(keys.public_key, sig, delegatee, conditions), "known signature should verify");
  _ok(!verify_delegation_signature(keys.public_key, sig, delegatee, "kind=1"), "known signature must not verify other conditions");

  auto fresh = sign_delegation(keys, delegatee, conditions);
  _ok(verify_delegation_signature(keys.public_key, fresh, delegatee, conditions), "fresh signature should verify");
  _ok(signature_verify(fresh, keys.public_key, sha256(build_token(delegatee, conditions))), "fresh signature should verify at low level");

  fresh[0] ^= 1;
  _ok(!verify_delegation_signature(keys.public_key, fresh, delegatee, conditions), "tampered signature must not verify");
}

static void test_procura_create_and_validate() {
  auto keys = keys_from_secret_key(delegator_nsec);
  auto delegatee = parse_public_key(delegatee_npub);

  auto tag = create_delegation_tag(keys, delegatee, conditions_str);
  _ok(bytes2hex(tag.delegator_pubkey) == delegator_hex, "delegator public key is stored");
  _ok(format_conditions(tag.conditions) == conditions_str, "conditions are stored parsed");
  _ok(verify_delegation_signature(keys.public_key, tag.signature, delegatee, conditions_str), "tag signature should verify");

  auto expected = R"(["delegation",")" + delegator_hex + R"(",")" + conditions_str + R"(",")" + bytes2hex(tag.signature) + R"("])";
  _ok(serialize_delegation_tag(tag) == expected, "serialized tag");

  _ok(validate_delegation_tag(tag, delegatee, {1, 1677000000}) == validation_result_t::ok, "valid event");
  _ok(validate_delegation_tag(tag, delegatee, {1, 1677000000}) == validation_result_t::ok, "validation is repeatable");
  _ok(validate_delegation_tag(tag, parse_public_key(wrong_npub), {1, 1677000000}) == validation_result_t::invalid_signature, "wrong delegatee");
  _ok(validate_delegation_tag(tag, parse_public_key(wrong_npub), {9, 1679000000}) == validation_result_t::invalid_signature, "signature is checked before conditions");
  _ok(validate_delegation_tag(tag, delegatee, {5, 1677000000}) == validation_result_t::invalid_kind, "wrong kind");
  _ok(validate_delegation_tag(tag, delegatee, {1, 1679000000}) == validation_result_t::created_too_late, "too late");
  _ok(validate_delegation_tag(tag, delegatee, {1, 1670000000}) == validation_result_t::created_too_early, "too early");

  auto tampered = tag;
  tampered.conditions[0].value = 7;
  _ok(validate_delegation_tag(tampered, delegatee, {7, 1677000000}) == validation_result_t::invalid_signature, "tampered conditions");

  auto open = create_delegation_tag(keys, delegatee, "");
  _ok(open.conditions.empty(), "empty conditions are allowed");
  _ok(validate_delegation_tag(open, delegatee, {30023, 1}) == validation_result_t::ok, "empty conditions always pass");

  keys_t mismatched{keys.secret_key, delegatee};
  auto signed_by_secret = create_delegation_tag(mismatched, delegatee, conditions_str);
  _ok(bytes2hex(signed_by_secret.delegator_pubkey) == delegator_hex, "delegator key comes from the secret key that signs");
  _ok(validate_delegation_tag(signed_by_secret, delegatee, {1, 1677000000}) == validation_result_t::ok, "tag from mismatched keys still validates");

  _ok(throws_errc([&] { create_delegation_tag(keys, delegatee, "kind=one"); }, delegation_errc::numeric_parse), "create rejects bad numbers");
  _ok(throws_errc([&] { create_delegation_tag(keys, delegatee, "kind<1"); }, delegation_errc::invalid_condition), "create rejects bad conditions");
}

static void test_procura_deserialize() {
  auto delegatee = parse_public_key(delegatee_npub);

  auto tag = deserialize_delegation_tag(known_tag);
  _ok(validate_delegation_tag(tag, delegatee, {1, 1677000000}) == validation_result_t::ok, "known tag should validate");
  _ok(validate_delegation_tag(tag, delegatee, {5, 1677000000}) == validation_result_t::invalid_kind, "known tag with wrong kind");
  _ok(format_conditions(tag.conditions) == conditions_str, "known tag conditions");
  _ok(public_key_to_npub(tag.delegator_pubkey) == "npub1rfze4zn25ezp6jqt5ejlhrajrfx0az72ed7cwvq0spr22k9rlnjq93lmd4", "known tag delegator");
  _ok(serialize_delegation_tag(tag) == known_tag, "known tag should serialize to the same string");
  _ok(delegation_tag_from_tag(nlohmann::json::parse(known_tag).get<std::vector<std::string>>()) == tag, "tag list form parses the same");

  _ok(throws_errc([] { deserialize_delegation_tag(R"(["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1"])"); }, delegation_errc::delegation_tag_parse), "3 elements");
  _ok(throws_errc([] { deserialize_delegation_tag(R"(["delegator","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1","369aed09c1ad52fceb77ecd6c16f2433eac4a3803fc41c58876a5b60f4f36b9493d5115e5ec5a0ce6c3668ffe5b58d47f2cbc97233833bb7e908f66dbbbd9d36"])"); }, delegation_errc::delegation_tag_parse), "wrong keyword");
  _ok(throws_errc([] { deserialize_delegation_tag("not json"); }, delegation_errc::delegation_tag_parse), "not json");
  _ok(throws_errc([] { deserialize_delegation_tag(R"({"delegation":1})"); }, delegation_errc::delegation_tag_parse), "not an array");
  _ok(throws_errc([] { deserialize_delegation_tag(R"(["delegation",1,"kind=1","00"])"); }, delegation_errc::delegation_tag_parse), "not strings");

  try {
    deserialize_delegation_tag(R"(["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=x","369aed09c1ad52fceb77ecd6c16f2433eac4a3803fc41c58876a5b60f4f36b9493d5115e5ec5a0ce6c3668ffe5b58d47f2cbc97233833bb7e908f66dbbbd9d36"])");
    _ok(false, "bad conditions must be rejected");
  } catch (const delegation_error& e) {
    _ok(e.code() == delegation_errc::delegation_tag_parse && e.cause() == delegation_errc::numeric_parse, "bad conditions keep their cause");
  }

  try {
    deserialize_delegation_tag(R"(["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1","369aed"])");
    _ok(false, "short signature must be rejected");
  } catch (const delegation_error& e) {
    _ok(e.code() == delegation_errc::delegation_tag_parse && e.cause() == delegation_errc::invalid_signature_encoding, "short signature keeps its cause");
  }

  try {
    deserialize_delegation_tag(R"(["delegation","npub1rfze4zn25ezp6jqt5ejlhrajrfx0az72ed7cwvq0spr22k9rlnjq93lmd4","kind=1","369aed09c1ad52fceb77ecd6c16f2433eac4a3803fc41c58876a5b60f4f36b9493d5115e5ec5a0ce6c3668ffe5b58d47f2cbc97233833bb7e908f66dbbbd9d36"])");
    _ok(false, "npub delegator must be rejected");
  } catch (const delegation_error& e) {
    _ok(e.code() == delegation_errc::delegation_tag_parse && e.cause() == delegation_errc::invalid_public_key, "bad delegator keeps its cause");
  }
}

static void test_procura_concurrent_use() {
  auto keys = keys_from_secret_key(delegator_nsec);
  auto delegatee = parse_public_key(delegatee_npub);

  const size_t nthreads = 8;
  std::vector<validation_result_t> results(nthreads * 2, validation_result_t::invalid_signature);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < nthreads; ++i) {
    threads.emplace_back([&, i] {
      auto conditions = "kind=" + std::to_string(i) + "&created_at<1678659553";
      auto tag = create_delegation_tag(keys, delegatee, conditions);
      results[i * 2] = validate_delegation_tag(tag, delegatee, {static_cast<uint64_t>(i), 1677000000});
      results[i * 2 + 1] = validate_delegation_tag(deserialize_delegation_tag(known_tag), delegatee, {1, 1677000000});
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  for (size_t i = 0; i < results.size(); ++i) {
    _ok(results[i] == validation_result_t::ok, "create and validate from thread %zu", i / 2);
  }
}

static void test_procura_check_event() {
  event_t ev;

  ev = string2event(
      R"({"id":"bb97556f36930838b8593b9e3dd130182e77f34ddf6c8e351b41b1753dc2580a","pubkey":"2c7cc62a697ea3a7826521f3fd34f0cb273693cbe5e9310f35449f43622a5cdc","created_at":1706278266,"kind":1,"tags":[["r","https://image.nostr.build/9b882abc8183d79fdda4c5278228a5f1641b78fa457e643532c5e1c2d89ae6f9.jpg#m=image%2Fjpeg&dim=1067x1920&blurhash=%5DN9%25MXON%5EnotWSf5jcWAo4WAk9t8kBogofM_WFR%25WBjvR%24s%3Bjrj%3FogRiahRjWBa%23WTj%5DWUa%7DfRRjWERjWBWVR%25ahWBWBjb&x=fdde40d498de759392222679f0a1166c9d4b4012bc815be385aa3e9bd1a225ed"]],"content":"mattn いすぎじゃない？\nhttps://image.nostr.build/9b882abc8183d79fdda4c5278228a5f1641b78fa457e643532c5e1c2d89ae6f9.jpg#m=image%2Fjpeg&dim=1067x1920&blurhash=%5DN9%25MXON%5EnotWSf5jcWAo4WAk9t8kBogofM_WFR%25WBjvR%24s%3Bjrj%3FogRiahRjWBa%23WTj%5DWUa%7DfRRjWERjWBWVR%25ahWBWBjb&x=fdde40d498de759392222679f0a1166c9d4b4012bc815be385aa3e9bd1a225ed","sig":"757a1864233031b013eef28b4e47e16bfe15055e5488735f869270f4488875aad56399fc2b28468617470698b586ddeff5261e7dc386178817d2ce0d6ea36301"})");

  _ok(check_event(ev), "check_event should be succeeded for valid sig");

  ev.sig = "757a1864233031b013eef28b4e47e16bfe15055e5488735f869270f4488875aad56399fc2b28468617470698b586ddeff5261e7dc386178817d2ce0d6ea36302";
  _ok(!check_event(ev), "check_event should be failed for invalid sig");

  // published by 7c3d4e56... with a delegation from 1a459a8a...
  ev = string2event(
      R"({"id":"5a4ea696fcf9ae078b8b443a4b4bf7fc7d5955c51e43b45b723077a56315b824","pubkey":"7c3d4e568e9c61b6bda3f564cab9159b35ff96d941300d37d8fcef8487dac111","created_at":1677000000,"kind":1,"tags":[["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1&created_at>1676067553&created_at<1678659553","d9da646114a604c71e19fa10b15c93494ae2175b0264ad9b210abd2db6a0aa002bcf32aefab11e89a04c3c22bc7bf9a6536d189cea3889ca8b32f2d397144a95"]],"content":"delegated note","sig":"b4c42343cce8f0cced343818d8b2273a05a4a9c63c34b60191217c499de82cb12eec3858daf9b0adb3c8f08b31cfc6cd0a0e181c20e5693699aa0a28406a4281"})");
  _ok(check_event(ev), "check_event should be succeeded for valid delegation");

  auto tag = delegation_tag_from_tag(ev.tags[0]);
  _ok(validate_delegation_tag(tag, parse_public_key(ev.pubkey), event_properties_from_event(ev)) == validation_result_t::ok, "delegation of the event validates");

  ev = string2event(
      R"({"id":"f68de76d9952a296ea395c925506fb9d6695679a6a2903cefca045682f5a995a","pubkey":"7c3d4e568e9c61b6bda3f564cab9159b35ff96d941300d37d8fcef8487dac111","created_at":1677000000,"kind":7,"tags":[["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1&created_at>1676067553&created_at<1678659553","d9da646114a604c71e19fa10b15c93494ae2175b0264ad9b210abd2db6a0aa002bcf32aefab11e89a04c3c22bc7bf9a6536d189cea3889ca8b32f2d397144a95"]],"content":"+","sig":"5439cb066a326a65dc362c239a5d22da24867837b69e341e6aac6fe844be43223e1dbac7a34ebda4ed9a385661cb1b280fa1fba49bc0557d1555cd10f0dd8b67"})");
  _ok(!check_event(ev), "check_event should be failed for delegated event of wrong kind");

  ev = string2event(
      R"({"id":"b79b14257f090da3e37105b7275b3d64de0254846b2653671a3e6fff848de4ea","pubkey":"7c3d4e568e9c61b6bda3f564cab9159b35ff96d941300d37d8fcef8487dac111","created_at":1679000000,"kind":1,"tags":[["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1&created_at>1676067553&created_at<1678659553","d9da646114a604c71e19fa10b15c93494ae2175b0264ad9b210abd2db6a0aa002bcf32aefab11e89a04c3c22bc7bf9a6536d189cea3889ca8b32f2d397144a95"]],"content":"too late","sig":"337ed2aca07abaa2f536b7dd8cfd265e218addc3f066b4177f5653d931495042e24a41fd7f2ec44852b3f5d5f60d9c48d28bc5e1cc4260d4ee0556b9510cf396"})");
  _ok(!check_event(ev), "check_event should be failed for delegated event out of window");

  // properly signed, but created_at must not wrap around to pass created_at>
  ev = string2event(
      R"({"id":"25725d3565cd4762dcf92c89e34a289cd8e81781840adcc8ef5abc5b8d8f914d","pubkey":"7c3d4e568e9c61b6bda3f564cab9159b35ff96d941300d37d8fcef8487dac111","created_at":-1,"kind":1,"tags":[["delegation","1a459a8a6aa6441d480ba665fb8fb21a4cfe8bcacb7d87300f8046a558a3fce4","kind=1&created_at>1676067553","198573a748c06dc79d8da6433f8a79bb6bb6bf6216fc743df761db0aa2f37108a0e2bd7cecb8248b38df24c010ab68d447fba05ceb29625f64721c748f83e6f0"]],"content":"before the epoch","sig":"682517a65a83f33a77ac4ff38bd1b05c8282e95e01196e3fd8812a8b3f1ae8900126270603aa87f671759e615f525121bfa9c5f1f271c4b88db634af3e28665b"})");
  _ok(!check_event(ev), "check_event should be failed for negative created_at");
}

int main() {
  spdlog::set_level(spdlog::level::off);

  subtest("test_procura_condition", test_procura_condition);
  subtest("test_procura_conditions", test_procura_conditions);
  subtest("test_procura_evaluate", test_procura_evaluate);
  subtest("test_procura_keys", test_procura_keys);
  subtest("test_procura_token", test_procura_token);
  subtest("test_procura_sign", test_procura_sign);
  subtest("test_procura_create_and_validate", test_procura_create_and_validate);
  subtest("test_procura_deserialize", test_procura_deserialize);
  subtest("test_procura_concurrent_use", test_procura_concurrent_use);
  subtest("test_procura_check_event", test_procura_check_event);
  return done_testing();
}
