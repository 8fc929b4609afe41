#pragma once

#include <cstdint>
#include <string>

namespace safelayer::config {

struct PolicyConfig {
  std::string dir = "~/.safelayer/policies";
  /// Policy file loaded and activated at startup; empty keeps the built-in default.
  std::string file;
};

struct AuditConfig {
  bool enabled = true;
  std::string path = "~/.safelayer/audit.log";
  bool include_excerpt = false;
};

struct GuardsConfig {
  bool explain = false;
  bool isolate_failures = false;
};

struct PiiConfig {
  std::string backend = "pattern";
  std::string presidio_url = "http://127.0.0.1:5002";
  std::uint64_t timeout_ms = 3000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  PolicyConfig policy;
  AuditConfig audit;
  GuardsConfig guards;
  PiiConfig pii;
  ObservabilityConfig observability;
};

} // namespace safelayer::config
