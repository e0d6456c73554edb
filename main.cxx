#define INITIALIZE_LOGGER

#include "procura.hxx"
#include "version.h"

#include <cstdlib>
#include <iostream>

#include <argparse/argparse.hpp>
#include <openssl/crypto.h>

static std::string env(const char *name, const char *default_value) {
  const char *value = std::getenv(name);
  if (value == nullptr) {
    value = default_value;
  }
  return value;
}

static int do_token(const argparse::ArgumentParser &cmd) {
  auto delegatee = parse_public_key(cmd.get<std::string>("-delegatee"));
  auto conditions = cmd.get<std::string>("-conditions");
  // keep the same syntax rules as create
  parse_conditions(conditions);
  std::cout << build_token(delegatee, conditions) << std::endl;
  return 0;
}

static int do_create(const argparse::ArgumentParser &cmd) {
  auto secret_key = cmd.get<std::string>("-secret-key");
  if (secret_key.empty()) {
    console->error("!! secret key is required (-secret-key or "
                   "PROCURA_SECRET_KEY)");
    return 1;
  }
  keys_t keys{};
  struct cleanse_guard {
    std::string &text;
    seckey_t &key;
    ~cleanse_guard() {
      OPENSSL_cleanse(text.data(), text.size());
      OPENSSL_cleanse(key.data(), key.size());
    }
  } guard{secret_key, keys.secret_key};
  keys = keys_from_secret_key(secret_key);
  auto delegatee = parse_public_key(cmd.get<std::string>("-delegatee"));
  auto tag = create_delegation_tag(keys, delegatee,
                                   cmd.get<std::string>("-conditions"));
  console->debug("created delegation from {} to {}",
                 bytes2hex(tag.delegator_pubkey), bytes2hex(delegatee));
  std::cout << serialize_delegation_tag(tag) << std::endl;
  return 0;
}

static int do_validate(const argparse::ArgumentParser &cmd) {
  auto tag = deserialize_delegation_tag(cmd.get<std::string>("-tag"));
  auto delegatee = parse_public_key(cmd.get<std::string>("-delegatee"));
  event_properties_t props{
      cmd.get<uint64_t>("-kind"),
      cmd.get<uint64_t>("-created-at"),
  };
  auto result = validate_delegation_tag(tag, delegatee, props);
  std::cout << validation_result_string(result) << std::endl;
  return result == validation_result_t::ok ? 0 : 1;
}

static int do_parse(const argparse::ArgumentParser &cmd) {
  auto tag = deserialize_delegation_tag(cmd.get<std::string>("-tag"));
  nlohmann::json conditions = nlohmann::json::array();
  for (const auto &c : tag.conditions) {
    conditions.push_back(format_condition(c));
  }
  nlohmann::json out = {
      {"delegator", bytes2hex(tag.delegator_pubkey)},
      {"delegator_npub", public_key_to_npub(tag.delegator_pubkey)},
      {"conditions", conditions},
      {"signature", bytes2hex(tag.signature)},
  };
  std::cout << out.dump(2) << std::endl;
  return 0;
}

static int do_check(const argparse::ArgumentParser &cmd) {
  const event_t ev = nlohmann::json::parse(cmd.get<std::string>("-event"));
  if (!check_event(ev)) {
    std::cout << "invalid" << std::endl;
    return 1;
  }
  std::cout << "ok" << std::endl;
  return 0;
}

int main(int argc, char *argv[]) {
  argparse::ArgumentParser program("procura", VERSION);
  program.add_description("NIP-26 delegation token tool");
  program.add_argument("-loglevel")
      .default_value(env("SPDLOG_LEVEL", "info"))
      .help("log level")
      .metavar("LEVEL")
      .nargs(1);

  argparse::ArgumentParser token_command("token");
  token_command.add_description("print the delegation token to be signed");
  token_command.add_argument("-delegatee")
      .required()
      .help("delegatee public key (hex or npub)")
      .metavar("PUBKEY");
  token_command.add_argument("-conditions")
      .default_value(std::string(""))
      .help("conditions query string")
      .metavar("CONDITIONS");

  argparse::ArgumentParser create_command("create");
  create_command.add_description("create a signed delegation tag");
  create_command.add_argument("-secret-key")
      .default_value(env("PROCURA_SECRET_KEY", ""))
      .help("delegator secret key (hex or nsec)")
      .metavar("SECKEY");
  create_command.add_argument("-delegatee")
      .required()
      .help("delegatee public key (hex or npub)")
      .metavar("PUBKEY");
  create_command.add_argument("-conditions")
      .default_value(std::string(""))
      .help("conditions query string")
      .metavar("CONDITIONS");

  argparse::ArgumentParser validate_command("validate");
  validate_command.add_description(
      "validate a delegation tag for a delegatee and event");
  validate_command.add_argument("-tag")
      .required()
      .help("delegation tag as JSON array")
      .metavar("TAG");
  validate_command.add_argument("-delegatee")
      .required()
      .help("delegatee public key (hex or npub)")
      .metavar("PUBKEY");
  validate_command.add_argument("-kind")
      .required()
      .help("event kind")
      .metavar("KIND")
      .scan<'u', uint64_t>();
  validate_command.add_argument("-created-at")
      .required()
      .help("event creation time (unix seconds)")
      .metavar("TIME")
      .scan<'u', uint64_t>();

  argparse::ArgumentParser parse_command("parse");
  parse_command.add_description("decode a delegation tag");
  parse_command.add_argument("-tag")
      .required()
      .help("delegation tag as JSON array")
      .metavar("TAG");

  argparse::ArgumentParser check_command("check");
  check_command.add_description(
      "verify an event id, signature and delegation tags");
  check_command.add_argument("-event")
      .required()
      .help("event as JSON object")
      .metavar("EVENT");

  program.add_subparser(token_command);
  program.add_subparser(create_command);
  program.add_subparser(validate_command);
  program.add_subparser(parse_command);
  program.add_subparser(check_command);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception &err) {
    std::cerr << err.what() << std::endl;
    std::cerr << program;
    return 1;
  }

  spdlog::set_level(
      spdlog::level::from_str(program.get<std::string>("-loglevel")));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

  try {
    if (program.is_subcommand_used(token_command)) {
      return do_token(token_command);
    } else if (program.is_subcommand_used(create_command)) {
      return do_create(create_command);
    } else if (program.is_subcommand_used(validate_command)) {
      return do_validate(validate_command);
    } else if (program.is_subcommand_used(parse_command)) {
      return do_parse(parse_command);
    } else if (program.is_subcommand_used(check_command)) {
      return do_check(check_command);
    }
  } catch (const std::exception &e) {
    console->error("!! {}", e.what());
    return 1;
  }

  std::cerr << program;
  return 1;
}
