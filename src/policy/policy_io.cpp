#include "safelayer/policy/policy_io.hpp"

#include "safelayer/common/fs.hpp"
#include "safelayer/common/json_util.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <fstream>
#include <sstream>

namespace safelayer::policy {

namespace {

std::string format_threshold(const double value) {
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    std::ostringstream out;
    out << value;
    return out.str();
  }
  return std::string(buffer, ptr);
}

common::Status flatten_node(const YAML::Node &node, const std::string &prefix, ConfigMap &out) {
  switch (node.Type()) {
  case YAML::NodeType::Null:
  case YAML::NodeType::Undefined:
    out[prefix] = "";
    return common::Status::success();
  case YAML::NodeType::Scalar:
    out[prefix] = node.Scalar();
    return common::Status::success();
  case YAML::NodeType::Sequence: {
    std::string joined;
    for (const auto &item : node) {
      if (!item.IsScalar()) {
        return common::Status::error("Only scalar lists are supported at '" + prefix + "'",
                                     common::ErrorKind::InvalidValue);
      }
      if (!joined.empty()) {
        joined += ",";
      }
      joined += item.Scalar();
    }
    out[prefix] = joined;
    return common::Status::success();
  }
  case YAML::NodeType::Map:
    for (const auto &entry : node) {
      const std::string key = entry.first.as<std::string>();
      auto status = flatten_node(entry.second, prefix.empty() ? key : prefix + "." + key, out);
      if (!status.ok()) {
        return status;
      }
    }
    return common::Status::success();
  }
  return common::Status::success();
}

common::Result<ConfigMap> parse_config_map(const YAML::Node &node, const std::string &field) {
  ConfigMap out;
  if (!node || node.IsNull()) {
    return common::Result<ConfigMap>::success(std::move(out));
  }
  if (!node.IsMap()) {
    return common::Result<ConfigMap>::failure("'" + field + "' must be a mapping",
                                              common::ErrorKind::InvalidValue);
  }
  auto status = flatten_node(node, "", out);
  if (!status.ok()) {
    return common::Result<ConfigMap>::failure_from(status);
  }
  return common::Result<ConfigMap>::success(std::move(out));
}

common::Result<std::string> scalar_field(const YAML::Node &parent, const std::string &key,
                                         const std::string &fallback) {
  const YAML::Node node = parent[key];
  if (!node || node.IsNull()) {
    return common::Result<std::string>::success(fallback);
  }
  if (!node.IsScalar()) {
    return common::Result<std::string>::failure("'" + key + "' must be a string",
                                                common::ErrorKind::InvalidValue);
  }
  return common::Result<std::string>::success(node.Scalar());
}

common::Result<GuardPolicy> parse_guard(const std::string &slot, const YAML::Node &node) {
  GuardPolicy guard;
  guard.guard_type = slot;
  if (!node || node.IsNull()) {
    return common::Result<GuardPolicy>::success(std::move(guard));
  }
  if (!node.IsMap()) {
    return common::Result<GuardPolicy>::failure("Guard '" + slot + "' must be a mapping",
                                                common::ErrorKind::InvalidValue);
  }

  auto guard_type = scalar_field(node, "guard_type", slot);
  if (!guard_type.ok()) {
    return common::Result<GuardPolicy>::failure_from(guard_type);
  }
  guard.guard_type = guard_type.value();

  if (const YAML::Node enabled = node["enabled"]; enabled && !enabled.IsNull()) {
    if (!enabled.IsScalar() || !YAML::convert<bool>::decode(enabled, guard.enabled)) {
      return common::Result<GuardPolicy>::failure("Guard '" + slot +
                                                      "' enabled must be a boolean",
                                                  common::ErrorKind::InvalidValue);
    }
  }

  if (const YAML::Node action = node["action"]; action && !action.IsNull()) {
    auto parsed = parse_action(action.IsScalar() ? action.Scalar() : "");
    if (!parsed.ok()) {
      return common::Result<GuardPolicy>::failure("Guard '" + slot + "': " + parsed.error(),
                                                  parsed.kind());
    }
    guard.action = parsed.value();
  }

  if (const YAML::Node severity = node["severity"]; severity && !severity.IsNull()) {
    auto parsed = parse_severity(severity.IsScalar() ? severity.Scalar() : "");
    if (!parsed.ok()) {
      return common::Result<GuardPolicy>::failure("Guard '" + slot + "': " + parsed.error(),
                                                  parsed.kind());
    }
    guard.severity = parsed.value();
  }

  if (const YAML::Node threshold = node["threshold"]; threshold && !threshold.IsNull()) {
    double value = 0.0;
    if (!threshold.IsScalar() || !YAML::convert<double>::decode(threshold, value)) {
      return common::Result<GuardPolicy>::failure("Guard '" + slot +
                                                      "' threshold must be a number",
                                                  common::ErrorKind::InvalidValue);
    }
    if (!(value >= 0.0 && value <= 1.0)) {
      return common::Result<GuardPolicy>::failure("Guard '" + slot +
                                                      "' threshold must be between 0 and 1",
                                                  common::ErrorKind::InvalidValue);
    }
    guard.threshold = value;
  }

  auto custom = parse_config_map(node["custom_config"], "custom_config");
  if (!custom.ok()) {
    return common::Result<GuardPolicy>::failure("Guard '" + slot + "': " + custom.error(),
                                                custom.kind());
  }
  guard.custom_config = std::move(custom.value());

  return common::Result<GuardPolicy>::success(std::move(guard));
}

common::Result<PolicySet> build_policy(const YAML::Node &root, const std::string &default_name) {
  if (!root.IsMap()) {
    return common::Result<PolicySet>::failure("Policy document must be a mapping",
                                              common::ErrorKind::Parse);
  }

  PolicySet policy;

  auto name = scalar_field(root, "name", default_name);
  if (!name.ok()) {
    return common::Result<PolicySet>::failure_from(name);
  }
  policy.name = name.value();

  auto version = scalar_field(root, "version", "1.0.0");
  if (!version.ok()) {
    return common::Result<PolicySet>::failure_from(version);
  }
  policy.version = version.value();

  auto description = scalar_field(root, "description", "");
  if (!description.ok()) {
    return common::Result<PolicySet>::failure_from(description);
  }
  policy.description = description.value();

  if (const YAML::Node parent = root["parent_policy"]; parent && !parent.IsNull()) {
    if (!parent.IsScalar()) {
      return common::Result<PolicySet>::failure("'parent_policy' must be a string",
                                                common::ErrorKind::InvalidValue);
    }
    policy.parent_policy = parent.Scalar();
  }

  auto metadata = parse_config_map(root["metadata"], "metadata");
  if (!metadata.ok()) {
    return common::Result<PolicySet>::failure_from(metadata);
  }
  policy.metadata = std::move(metadata.value());

  if (const YAML::Node guards = root["guards"]; guards && !guards.IsNull()) {
    if (!guards.IsMap()) {
      return common::Result<PolicySet>::failure("'guards' must be a mapping",
                                                common::ErrorKind::InvalidValue);
    }
    for (const auto &entry : guards) {
      const std::string slot = entry.first.as<std::string>();
      auto guard = parse_guard(slot, entry.second);
      if (!guard.ok()) {
        return common::Result<PolicySet>::failure_from(guard);
      }
      policy.set_guard(slot, std::move(guard.value()));
    }
  }

  return common::Result<PolicySet>::success(std::move(policy));
}

void emit_config_map(YAML::Emitter &out, const ConfigMap &values) {
  out << YAML::BeginMap;
  for (const auto &[key, value] : values) {
    out << YAML::Key << key << YAML::Value << value;
  }
  out << YAML::EndMap;
}

void write_json_map(std::ostringstream &out, const ConfigMap &values, const std::string &indent) {
  if (values.empty()) {
    out << "{}";
    return;
  }
  out << "{\n";
  std::size_t index = 0;
  for (const auto &[key, value] : values) {
    out << indent << "  \"" << common::json_escape(key) << "\": \"" << common::json_escape(value)
        << "\"";
    out << (++index < values.size() ? ",\n" : "\n");
  }
  out << indent << "}";
}

} // namespace

common::Result<PolicyFormat> policy_format_for(const std::filesystem::path &path) {
  const std::string ext = common::to_lower(path.extension().string());
  if (ext == ".yaml" || ext == ".yml") {
    return common::Result<PolicyFormat>::success(PolicyFormat::Yaml);
  }
  if (ext == ".json") {
    return common::Result<PolicyFormat>::success(PolicyFormat::Json);
  }
  return common::Result<PolicyFormat>::failure("Unsupported policy file format: " + path.string(),
                                               common::ErrorKind::UnsupportedFormat);
}

common::Result<PolicySet> parse_policy(const std::string &content,
                                       const std::string &default_name) {
  try {
    return build_policy(YAML::Load(content), default_name);
  } catch (const YAML::ParserException &e) {
    return common::Result<PolicySet>::failure(std::string("Malformed policy document: ") +
                                                  e.what(),
                                              common::ErrorKind::Parse);
  } catch (const YAML::Exception &e) {
    return common::Result<PolicySet>::failure(std::string("Invalid policy document: ") + e.what(),
                                              common::ErrorKind::InvalidValue);
  }
}

common::Result<PolicySet> load_policy_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<PolicySet>::failure("Policy file not found: " + path.string(),
                                              common::ErrorKind::NotFound);
  }
  auto format = policy_format_for(path);
  if (!format.ok()) {
    return common::Result<PolicySet>::failure_from(format);
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<PolicySet>::failure_from(content);
  }
  auto policy = parse_policy(content.value(), path.stem().string());
  if (!policy.ok()) {
    return common::Result<PolicySet>::failure(path.string() + ": " + policy.error(),
                                              policy.kind());
  }
  return policy;
}

common::Result<std::string> serialize_policy_yaml(const PolicySet &policy) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << policy.name;
  out << YAML::Key << "version" << YAML::Value << policy.version;
  out << YAML::Key << "description" << YAML::Value << policy.description;
  out << YAML::Key << "parent_policy" << YAML::Value;
  if (policy.parent_policy.has_value()) {
    out << *policy.parent_policy;
  } else {
    out << YAML::Null;
  }
  out << YAML::Key << "metadata" << YAML::Value;
  emit_config_map(out, policy.metadata);

  out << YAML::Key << "guards" << YAML::Value << YAML::BeginMap;
  for (const auto &[slot, guard] : policy.guards) {
    out << YAML::Key << slot << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "guard_type" << YAML::Value << guard.guard_type;
    out << YAML::Key << "enabled" << YAML::Value << guard.enabled;
    out << YAML::Key << "action" << YAML::Value << to_string(guard.action);
    out << YAML::Key << "severity" << YAML::Value << to_string(guard.severity);
    out << YAML::Key << "threshold" << YAML::Value << format_threshold(guard.threshold);
    out << YAML::Key << "custom_config" << YAML::Value;
    emit_config_map(out, guard.custom_config);
    out << YAML::EndMap;
  }
  out << YAML::EndMap;
  out << YAML::EndMap;

  if (!out.good()) {
    return common::Result<std::string>::failure("Failed to emit policy: " + out.GetLastError(),
                                                common::ErrorKind::Generic);
  }
  return common::Result<std::string>::success(std::string(out.c_str()) + "\n");
}

std::string serialize_policy_json(const PolicySet &policy) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"name\": \"" << common::json_escape(policy.name) << "\",\n";
  out << "  \"version\": \"" << common::json_escape(policy.version) << "\",\n";
  out << "  \"description\": \"" << common::json_escape(policy.description) << "\",\n";
  out << "  \"parent_policy\": ";
  if (policy.parent_policy.has_value()) {
    out << "\"" << common::json_escape(*policy.parent_policy) << "\"";
  } else {
    out << "null";
  }
  out << ",\n";
  out << "  \"metadata\": ";
  write_json_map(out, policy.metadata, "  ");
  out << ",\n";
  out << "  \"guards\": {";
  if (policy.guards.empty()) {
    out << "}\n";
  } else {
    out << "\n";
    std::size_t index = 0;
    for (const auto &[slot, guard] : policy.guards) {
      out << "    \"" << common::json_escape(slot) << "\": {\n";
      out << "      \"guard_type\": \"" << common::json_escape(guard.guard_type) << "\",\n";
      out << "      \"enabled\": " << (guard.enabled ? "true" : "false") << ",\n";
      out << "      \"action\": \"" << to_string(guard.action) << "\",\n";
      out << "      \"severity\": \"" << to_string(guard.severity) << "\",\n";
      out << "      \"threshold\": " << format_threshold(guard.threshold) << ",\n";
      out << "      \"custom_config\": ";
      write_json_map(out, guard.custom_config, "      ");
      out << "\n    }";
      out << (++index < policy.guards.size() ? ",\n" : "\n");
    }
    out << "  }\n";
  }
  out << "}\n";
  return out.str();
}

common::Status save_policy_file(const PolicySet &policy, const std::filesystem::path &path) {
  auto format = policy_format_for(path);
  if (!format.ok()) {
    return common::Status::error(format.error(), format.kind());
  }

  std::string content;
  if (format.value() == PolicyFormat::Json) {
    content = serialize_policy_json(policy);
  } else {
    auto yaml = serialize_policy_yaml(policy);
    if (!yaml.ok()) {
      return common::Status::error(yaml.error(), yaml.kind());
    }
    content = yaml.value();
  }

  auto dir = common::ensure_dir(path.parent_path());
  if (!dir.ok()) {
    return common::Status::error(dir.error(), dir.kind());
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Failed to open policy file for writing: " + path.string(),
                                 common::ErrorKind::Io);
  }
  file << content;
  if (!file) {
    return common::Status::error("Failed to write policy file: " + path.string(),
                                 common::ErrorKind::Io);
  }
  return common::Status::success();
}

} // namespace safelayer::policy
