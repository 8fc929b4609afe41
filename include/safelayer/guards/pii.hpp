#pragma once

#include "safelayer/common/http.hpp"
#include "safelayer/guards/guard.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace safelayer::guards {

/// Entity recognition backend used by PiiGuard.
class IPiiDetector {
public:
  virtual ~IPiiDetector() = default;

  [[nodiscard]] virtual std::string_view id() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<Finding>> detect(const std::string &text) const = 0;
};

/// Linear scan for e-mail addresses and phone numbers (entities "email" and "phone").
class PatternPiiDetector final : public IPiiDetector {
public:
  [[nodiscard]] std::string_view id() const override { return "pattern"; }
  [[nodiscard]] common::Result<std::vector<Finding>> detect(const std::string &text) const override;
};

struct PresidioConfig {
  std::string base_url = "http://127.0.0.1:5002";
  std::string language = "en";
  std::vector<std::string> entities = {"EMAIL_ADDRESS", "PHONE_NUMBER"};
  std::uint64_t timeout_ms = 3000;
};

/// Delegates detection to a Presidio analyzer service over HTTP.
class PresidioPiiDetector final : public IPiiDetector {
public:
  PresidioPiiDetector(PresidioConfig config, std::shared_ptr<common::HttpClient> client);

  [[nodiscard]] std::string_view id() const override { return "presidio"; }
  [[nodiscard]] common::Result<std::vector<Finding>> detect(const std::string &text) const override;
  [[nodiscard]] bool health_check() const;

private:
  PresidioConfig config_;
  std::shared_ptr<common::HttpClient> client_;
};

/// Parses an /analyze response. Presidio reports code point offsets; the findings carry byte
/// offsets into `text`.
[[nodiscard]] common::Result<std::vector<Finding>>
parse_presidio_response(const std::string &body, const std::string &text);

/// Byte offset of the given code point index in a UTF-8 string (clamped to the size).
[[nodiscard]] std::size_t utf8_byte_offset(const std::string &text, std::size_t codepoint_index);

struct PiiDetectorOptions {
  std::string backend = "pattern";
  PresidioConfig presidio;
};

/// Picks the Presidio backend when requested and reachable, the pattern detector otherwise.
[[nodiscard]] std::unique_ptr<IPiiDetector>
make_pii_detector(const PiiDetectorOptions &options,
                  std::shared_ptr<common::HttpClient> client = nullptr);

struct PiiGuardOptions {
  bool mask_enabled = true;
  bool explain = false;
  /// Findings scored below this are neither reported nor masked.
  double min_score = 0.0;
};

class PiiGuard final : public Guard {
public:
  explicit PiiGuard(PiiGuardOptions options = {}, std::unique_ptr<IPiiDetector> detector = nullptr);

  [[nodiscard]] std::string_view name() const override { return "PIIGuard"; }
  [[nodiscard]] common::Result<std::vector<Finding>> check(const std::string &text) const override;
  [[nodiscard]] common::Result<std::string> mask(const std::string &text) const override;

  [[nodiscard]] std::string_view detector_id() const { return detector_->id(); }
  [[nodiscard]] static std::string placeholder_for(const std::string &entity);

private:
  PiiGuardOptions options_;
  std::unique_ptr<IPiiDetector> detector_;
};

} // namespace safelayer::guards
