#pragma once

#include "safelayer/guards/guard.hpp"

#include <string>
#include <vector>

namespace safelayer::guards {

struct KeywordGuardOptions {
  std::vector<std::string> keywords;
  std::string replacement = "[REDACTED]";
  std::string entity = "secret";
  bool explain = false;
};

/// Redacts literal, case-sensitive keywords. The replacement must not contain a keyword.
class KeywordGuard final : public Guard {
public:
  explicit KeywordGuard(KeywordGuardOptions options);

  [[nodiscard]] std::string_view name() const override { return "KeywordGuard"; }
  [[nodiscard]] common::Result<std::vector<Finding>> check(const std::string &text) const override;
  [[nodiscard]] common::Result<std::string> mask(const std::string &text) const override;

private:
  KeywordGuardOptions options_;
};

} // namespace safelayer::guards
