#include "safelayer/guards/factory.hpp"

#include "safelayer/common/fs.hpp"
#include "safelayer/guards/keyword.hpp"
#include "safelayer/guards/policy_guard.hpp"
#include "safelayer/guards/speech.hpp"
#include "safelayer/guards/tone.hpp"

namespace safelayer::guards {

namespace {

using GuardResult = common::Result<std::shared_ptr<Guard>>;

const std::string *config_value(const policy::GuardPolicy &policy, const std::string &key) {
  const auto it = policy.custom_config.find(key);
  return it == policy.custom_config.end() ? nullptr : &it->second;
}

common::Result<bool> config_bool(const std::string &slot, const policy::GuardPolicy &policy,
                                 const std::string &key, const bool fallback) {
  const std::string *raw = config_value(policy, key);
  if (raw == nullptr) {
    return common::Result<bool>::success(fallback);
  }
  const std::string value = common::to_lower(common::trim(*raw));
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    return common::Result<bool>::success(true);
  }
  if (value == "false" || value == "no" || value == "off" || value == "0") {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure("Guard '" + slot + "' custom_config." + key +
                                           " must be a boolean",
                                       common::ErrorKind::InvalidValue);
}

GuardResult create_pii(const std::string &slot, const policy::GuardPolicy &policy,
                       const GuardFactoryOptions &options) {
  auto mask_enabled = config_bool(slot, policy, "mask", true);
  if (!mask_enabled.ok()) {
    return GuardResult::failure_from(mask_enabled);
  }

  PiiDetectorOptions detector_options = options.pii;
  if (const std::string *backend = config_value(policy, "backend"); backend != nullptr) {
    detector_options.backend = common::to_lower(common::trim(*backend));
  }
  if (const std::string *entities = config_value(policy, "entities"); entities != nullptr) {
    detector_options.presidio.entities = common::split_list(*entities);
  }
  if (const std::string *language = config_value(policy, "language"); language != nullptr) {
    detector_options.presidio.language = common::trim(*language);
  }

  const bool thresholded = policy.action == policy::PolicyAction::Mask ||
                           policy.action == policy::PolicyAction::Block;
  PiiGuardOptions guard_options{.mask_enabled = mask_enabled.value(),
                                .explain = options.explain,
                                .min_score = thresholded ? policy.threshold : 0.0};
  return GuardResult::success(std::make_shared<PiiGuard>(
      guard_options, make_pii_detector(detector_options, options.http_client)));
}

GuardResult create_tone(const std::string &slot, const policy::GuardPolicy &policy,
                        const GuardFactoryOptions &options) {
  ToneGuardOptions guard_options;
  guard_options.explain = options.explain;
  if (const std::string *denylist = config_value(policy, "denylist"); denylist != nullptr) {
    guard_options.denylist = common::split_list(*denylist);
  }
  if (const std::string *mask_char = config_value(policy, "mask_char"); mask_char != nullptr) {
    if (mask_char->size() != 1) {
      return GuardResult::failure("Guard '" + slot +
                                      "' custom_config.mask_char must be a single character",
                                  common::ErrorKind::InvalidValue);
    }
    guard_options.mask_char = mask_char->front();
  }
  return GuardResult::success(std::make_shared<ToneGuard>(std::move(guard_options)));
}

GuardResult create_keyword(const std::string &slot, const policy::GuardPolicy &policy,
                           const GuardFactoryOptions &options) {
  KeywordGuardOptions guard_options;
  guard_options.explain = options.explain;
  if (const std::string *keywords = config_value(policy, "keywords"); keywords != nullptr) {
    guard_options.keywords = common::split_list(*keywords);
  }
  if (guard_options.keywords.empty()) {
    return GuardResult::failure("Guard '" + slot + "' requires custom_config.keywords",
                                common::ErrorKind::InvalidValue);
  }
  if (const std::string *replacement = config_value(policy, "replacement");
      replacement != nullptr) {
    guard_options.replacement = *replacement;
  }
  if (const std::string *entity = config_value(policy, "entity"); entity != nullptr) {
    guard_options.entity = *entity;
  }
  for (const auto &keyword : guard_options.keywords) {
    if (guard_options.replacement.find(keyword) != std::string::npos) {
      return GuardResult::failure("Guard '" + slot + "' replacement contains keyword '" +
                                      keyword + "'",
                                  common::ErrorKind::InvalidValue);
    }
  }
  return GuardResult::success(std::make_shared<KeywordGuard>(std::move(guard_options)));
}

} // namespace

std::vector<std::string> known_guard_types() { return {"pii", "tone", "tts", "keyword"}; }

common::Result<std::shared_ptr<Guard>> create_guard(const std::string &slot,
                                                    const policy::GuardPolicy &policy,
                                                    const GuardFactoryOptions &options) {
  const std::string type = common::to_lower(common::trim(policy.guard_type));
  if (type == "pii") {
    return create_pii(slot, policy, options);
  }
  if (type == "tone") {
    return create_tone(slot, policy, options);
  }
  if (type == "tts") {
    return GuardResult::success(std::make_shared<SpeechGuard>(options.explain));
  }
  if (type == "keyword") {
    return create_keyword(slot, policy, options);
  }
  return GuardResult::failure("Unknown guard type '" + policy.guard_type + "' in slot '" + slot +
                                  "'",
                              common::ErrorKind::InvalidValue);
}

common::Result<std::vector<std::shared_ptr<Guard>>>
build_guards(const policy::PolicySet &policy, const GuardFactoryOptions &options) {
  std::vector<std::shared_ptr<Guard>> guards;
  for (const auto &[slot, guard_policy] : policy.guards) {
    if (!guard_policy.enabled) {
      continue;
    }
    auto guard = create_guard(slot, guard_policy, options);
    if (!guard.ok()) {
      return common::Result<std::vector<std::shared_ptr<Guard>>>::failure_from(guard);
    }
    guards.push_back(std::make_shared<PolicyGuard>(slot, guard_policy, guard.value()));
  }
  return common::Result<std::vector<std::shared_ptr<Guard>>>::success(std::move(guards));
}

} // namespace safelayer::guards
