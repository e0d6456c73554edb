#include "procura.hxx"

#include <charconv>
#include <sstream>

static const std::string kind_prefix = "kind=";
static const std::string created_before_prefix = "created_at<";
static const std::string created_after_prefix = "created_at>";

static inline bool has_prefix(const std::string &s, const std::string &prefix) {
  return !s.compare(0, prefix.size(), prefix);
}

static uint64_t parse_u64(const std::string &condition, size_t offset) {
  const char *first = condition.data() + offset;
  const char *last = condition.data() + condition.size();
  // an explicit plus sign is valid, as in Rust's u64::from_str
  if (first != last && *first == '+')
    ++first;
  uint64_t n = 0;
  auto [ptr, ec] = std::from_chars(first, last, n, 10);
  if (first == last || ec != std::errc() || ptr != last) {
    throw delegation_error(delegation_errc::numeric_parse,
                           "invalid condition, cannot parse expected number: " +
                               condition);
  }
  return n;
}

condition_t parse_condition(const std::string &s) {
  if (has_prefix(s, kind_prefix)) {
    return {condition_t::type_t::kind, parse_u64(s, kind_prefix.size())};
  }
  if (has_prefix(s, created_before_prefix)) {
    return {condition_t::type_t::created_before,
            parse_u64(s, created_before_prefix.size())};
  }
  if (has_prefix(s, created_after_prefix)) {
    return {condition_t::type_t::created_after,
            parse_u64(s, created_after_prefix.size())};
  }
  throw delegation_error(delegation_errc::invalid_condition,
                         "invalid condition in conditions string: " + s);
}

std::string format_condition(const condition_t &c) {
  switch (c.type) {
  case condition_t::type_t::kind:
    return kind_prefix + std::to_string(c.value);
  case condition_t::type_t::created_before:
    return created_before_prefix + std::to_string(c.value);
  case condition_t::type_t::created_after:
    return created_after_prefix + std::to_string(c.value);
  }
  return "";
}

conditions_t parse_conditions(const std::string &s) {
  conditions_t conditions;
  if (s.empty()) {
    return conditions;
  }

  // getline drops a trailing empty field, so split by hand
  size_t start = 0;
  while (true) {
    auto pos = s.find('&', start);
    if (pos == std::string::npos) {
      conditions.push_back(parse_condition(s.substr(start)));
      break;
    }
    conditions.push_back(parse_condition(s.substr(start, pos - start)));
    start = pos + 1;
  }
  return conditions;
}

std::string format_conditions(const conditions_t &conditions) {
  std::stringstream ss;
  for (size_t i = 0; i < conditions.size(); ++i) {
    if (i > 0)
      ss << '&';
    ss << format_condition(conditions[i]);
  }
  return ss.str();
}

validation_result_t evaluate(const condition_t &c,
                             const event_properties_t &ep) {
  switch (c.type) {
  case condition_t::type_t::kind:
    if (ep.kind != c.value) {
      return validation_result_t::invalid_kind;
    }
    break;
  case condition_t::type_t::created_before:
    if (ep.created_time >= c.value) {
      return validation_result_t::created_too_late;
    }
    break;
  case condition_t::type_t::created_after:
    if (ep.created_time <= c.value) {
      return validation_result_t::created_too_early;
    }
    break;
  }
  return validation_result_t::ok;
}

validation_result_t evaluate(const conditions_t &conditions,
                             const event_properties_t &ep) {
  for (const auto &c : conditions) {
    auto result = evaluate(c, ep);
    if (result != validation_result_t::ok) {
      return result;
    }
  }
  return validation_result_t::ok;
}

const char *validation_result_string(validation_result_t result) {
  switch (result) {
  case validation_result_t::ok:
    return "ok";
  case validation_result_t::invalid_signature:
    return "signature does not match";
  case validation_result_t::invalid_kind:
    return "event kind does not match";
  case validation_result_t::created_too_early:
    return "creation time is earlier than validity period";
  case validation_result_t::created_too_late:
    return "creation time is later than validity period";
  }
  return "unknown";
}

event_properties_t event_properties_from_event(const event_t &ev) {
  return {static_cast<uint64_t>(ev.kind), static_cast<uint64_t>(ev.created_at)};
}
