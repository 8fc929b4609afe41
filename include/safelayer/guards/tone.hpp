#pragma once

#include "safelayer/guards/guard.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace safelayer::guards {

[[nodiscard]] std::vector<std::string> default_profanity_list();

struct ToneGuardOptions {
  std::vector<std::string> denylist = default_profanity_list();
  char mask_char = '*';
  /// Detect only; `mask` returns the text unchanged.
  bool warn_only = false;
  bool explain = false;
};

/// Case-insensitive whole-word denylist. Each match is replaced by `mask_char` repeated once
/// per byte of the matched word, so the output keeps the original length.
class ToneGuard final : public Guard {
public:
  explicit ToneGuard(ToneGuardOptions options = {});

  [[nodiscard]] std::string_view name() const override { return "ToneGuard"; }
  [[nodiscard]] common::Result<std::vector<Finding>> check(const std::string &text) const override;
  [[nodiscard]] common::Result<std::string> mask(const std::string &text) const override;

  [[nodiscard]] const std::vector<std::string> &denylist() const { return options_.denylist; }

private:
  ToneGuardOptions options_;
  std::optional<std::regex> pattern_;
};

} // namespace safelayer::guards
