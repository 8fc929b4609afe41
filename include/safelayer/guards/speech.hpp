#pragma once

#include "safelayer/guards/guard.hpp"

#include <string>
#include <vector>

namespace safelayer::guards {

/// Flags content a speech synthesizer must not receive: script blocks, markup tags, non-ASCII
/// runs and control characters other than tab, line feed and carriage return. Masking strips
/// every flagged span and repeats until nothing is left to strip.
class SpeechGuard final : public Guard {
public:
  explicit SpeechGuard(bool explain = false);

  [[nodiscard]] std::string_view name() const override { return "TTSGuard"; }
  [[nodiscard]] common::Result<std::vector<Finding>> check(const std::string &text) const override;
  [[nodiscard]] common::Result<std::string> mask(const std::string &text) const override;
};

} // namespace safelayer::guards
