#include "safelayer/guards/pii.hpp"

#include "safelayer/common/fs.hpp"
#include "safelayer/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace safelayer::guards {

namespace {

std::string upper_label(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

void push_finding(const std::string &entity, const std::size_t start, const std::size_t end,
                  std::vector<Finding> &out) {
  out.push_back(Finding{.entity = entity,
                        .start = start,
                        .end = end,
                        .explanation = upper_label(entity) + " @ " + std::to_string(start) + "-" +
                                       std::to_string(end),
                        .detector = "pattern",
                        .score = 1.0});
}

bool is_word_byte(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '_';
}

bool is_digit_byte(const char ch) { return ch >= '0' && ch <= '9'; }

bool is_email_byte(const char ch) { return is_word_byte(ch) || ch == '.' || ch == '-'; }

// local@domain.tld where local and domain are runs of [A-Za-z0-9_.-]; the domain ends at its
// last dot that is followed by a word character. Each byte is visited a bounded number of times.
void collect_emails(const std::string &text, std::vector<Finding> &out) {
  std::size_t resume = 0;
  for (auto at = text.find('@'); at != std::string::npos; at = text.find('@', at + 1)) {
    if (at < resume) {
      continue;
    }
    std::size_t start = at;
    while (start > resume && is_email_byte(text[start - 1])) {
      --start;
    }
    if (start == at) {
      continue;
    }
    std::size_t domain_end = at + 1;
    while (domain_end < text.size() && is_email_byte(text[domain_end])) {
      ++domain_end;
    }

    std::size_t dot = std::string::npos;
    for (std::size_t k = domain_end; k-- > at + 2;) {
      if (text[k] == '.' && k + 1 < domain_end && is_word_byte(text[k + 1])) {
        dot = k;
        break;
      }
    }
    if (dot == std::string::npos) {
      continue;
    }
    std::size_t end = dot + 1;
    while (end < domain_end && is_word_byte(text[end])) {
      ++end;
    }
    push_finding("email", start, end, out);
    resume = end;
  }
}

bool digits_at(const std::string &text, const std::size_t at, const std::size_t count) {
  if (at + count > text.size()) {
    return false;
  }
  for (std::size_t i = at; i < at + count; ++i) {
    if (!is_digit_byte(text[i])) {
      return false;
    }
  }
  return true;
}

bool phone_separator_at(const std::string &text, const std::size_t at) {
  return at < text.size() && (text[at] == '-' || text[at] == '.' || text[at] == ' ');
}

bool word_boundary_at(const std::string &text, const std::size_t at) {
  return at == text.size() || !is_word_byte(text[at]);
}

/// Ten digits, or ddd-ddd-dddd with '-', '.' or ' ' separators, not embedded in a longer word.
std::size_t phone_end(const std::string &text, const std::size_t start) {
  if (start > 0 && is_word_byte(text[start - 1])) {
    return std::string::npos;
  }
  if (digits_at(text, start, 10) && word_boundary_at(text, start + 10)) {
    return start + 10;
  }
  if (digits_at(text, start, 3) && phone_separator_at(text, start + 3) &&
      digits_at(text, start + 4, 3) && phone_separator_at(text, start + 7) &&
      digits_at(text, start + 8, 4) && word_boundary_at(text, start + 12)) {
    return start + 12;
  }
  return std::string::npos;
}

void collect_phones(const std::string &text, std::vector<Finding> &out) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t end = is_digit_byte(text[pos]) ? phone_end(text, pos) : std::string::npos;
    if (end == std::string::npos) {
      ++pos;
      continue;
    }
    push_finding("phone", pos, end, out);
    pos = end;
  }
}

std::string build_analyze_request(const std::string &text, const PresidioConfig &config) {
  std::ostringstream out;
  out << "{\"text\":\"" << common::json_escape(text) << "\",\"language\":\""
      << common::json_escape(config.language) << "\",\"entities\":[";
  for (std::size_t i = 0; i < config.entities.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\"" << common::json_escape(config.entities[i]) << "\"";
  }
  out << "]}";
  return out.str();
}

std::string trim_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

common::Result<std::vector<Finding>> PatternPiiDetector::detect(const std::string &text) const {
  std::vector<Finding> findings;
  collect_emails(text, findings);
  collect_phones(text, findings);
  return common::Result<std::vector<Finding>>::success(std::move(findings));
}

std::size_t utf8_byte_offset(const std::string &text, const std::size_t codepoint_index) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0U) == 0x80U) {
      continue;
    }
    if (seen == codepoint_index) {
      return i;
    }
    ++seen;
  }
  return text.size();
}

common::Result<std::vector<Finding>> parse_presidio_response(const std::string &body,
                                                             const std::string &text) {
  const std::string trimmed = common::trim(body);
  if (trimmed.empty() || trimmed.front() != '[') {
    return common::Result<std::vector<Finding>>::failure(
        "Presidio response is not a JSON array", common::ErrorKind::Parse);
  }

  std::vector<Finding> findings;
  for (const auto &object : common::json_split_top_level_objects(trimmed)) {
    const std::string entity = common::json_get_string(object, "entity_type");
    const std::string start_raw = common::json_get_number(object, "start");
    const std::string end_raw = common::json_get_number(object, "end");
    const std::string score_raw = common::json_get_number(object, "score");
    if (entity.empty() || start_raw.empty() || end_raw.empty()) {
      return common::Result<std::vector<Finding>>::failure(
          "Presidio result is missing entity_type/start/end", common::ErrorKind::Parse);
    }

    std::size_t cp_start = 0;
    std::size_t cp_end = 0;
    double score = 1.0;
    try {
      cp_start = static_cast<std::size_t>(std::stoull(start_raw));
      cp_end = static_cast<std::size_t>(std::stoull(end_raw));
      if (!score_raw.empty()) {
        score = std::stod(score_raw);
      }
    } catch (const std::exception &) {
      return common::Result<std::vector<Finding>>::failure(
          "Presidio result has a non-numeric offset or score", common::ErrorKind::Parse);
    }

    const std::size_t start = utf8_byte_offset(text, cp_start);
    const std::size_t end = std::max(start, utf8_byte_offset(text, cp_end));
    std::ostringstream explanation;
    explanation << "Presidio: " << entity << " @ " << start << "-" << end;
    findings.push_back(Finding{.entity = entity,
                               .start = start,
                               .end = end,
                               .explanation = explanation.str(),
                               .detector = "presidio",
                               .score = score});
  }

  std::stable_sort(findings.begin(), findings.end(),
                   [](const Finding &a, const Finding &b) { return a.start < b.start; });
  return common::Result<std::vector<Finding>>::success(std::move(findings));
}

PresidioPiiDetector::PresidioPiiDetector(PresidioConfig config,
                                         std::shared_ptr<common::HttpClient> client)
    : config_(std::move(config)), client_(std::move(client)) {
  config_.base_url = trim_trailing_slash(config_.base_url);
}

common::Result<std::vector<Finding>> PresidioPiiDetector::detect(const std::string &text) const {
  if (text.empty()) {
    return common::Result<std::vector<Finding>>::success({});
  }

  const auto response = client_->post_json(config_.base_url + "/analyze", {},
                                            build_analyze_request(text, config_),
                                            config_.timeout_ms);
  if (response.network_error) {
    return common::Result<std::vector<Finding>>::failure(
        "Presidio request failed: " + response.network_error_message,
        common::ErrorKind::Network);
  }
  if (!response.success()) {
    return common::Result<std::vector<Finding>>::failure(
        "Presidio returned HTTP " + std::to_string(response.status), common::ErrorKind::Network);
  }
  return parse_presidio_response(response.body, text);
}

bool PresidioPiiDetector::health_check() const {
  const auto response = client_->get(config_.base_url + "/health", {}, config_.timeout_ms);
  return response.success();
}

std::unique_ptr<IPiiDetector> make_pii_detector(const PiiDetectorOptions &options,
                                                std::shared_ptr<common::HttpClient> client) {
  if (common::to_lower(common::trim(options.backend)) != "presidio") {
    return std::make_unique<PatternPiiDetector>();
  }
  if (client == nullptr) {
    client = std::make_shared<common::CurlHttpClient>();
  }
  auto presidio = std::make_unique<PresidioPiiDetector>(options.presidio, std::move(client));
  if (!presidio->health_check()) {
    return std::make_unique<PatternPiiDetector>();
  }
  return presidio;
}

PiiGuard::PiiGuard(PiiGuardOptions options, std::unique_ptr<IPiiDetector> detector)
    : Guard(options.explain), options_(options), detector_(std::move(detector)) {
  if (detector_ == nullptr) {
    detector_ = std::make_unique<PatternPiiDetector>();
  }
}

std::string PiiGuard::placeholder_for(const std::string &entity) {
  const std::string lowered = common::to_lower(entity);
  if (lowered == "email" || lowered == "email_address") {
    return "[EMAIL MASKED]";
  }
  if (lowered == "phone" || lowered == "phone_number") {
    return "[PHONE MASKED]";
  }
  return "[" + upper_label(entity) + " MASKED]";
}

common::Result<std::vector<Finding>> PiiGuard::check(const std::string &text) const {
  auto detected = detector_->detect(text);
  if (!detected.ok()) {
    return detected;
  }
  std::vector<Finding> findings;
  findings.reserve(detected.value().size());
  for (auto &finding : detected.value()) {
    if (finding.score < options_.min_score) {
      continue;
    }
    finding.detector = std::string(name());
    findings.push_back(std::move(finding));
  }
  return common::Result<std::vector<Finding>>::success(std::move(findings));
}

common::Result<std::string> PiiGuard::mask(const std::string &text) const {
  if (!options_.mask_enabled) {
    return common::Result<std::string>::success(text);
  }
  auto findings = check(text);
  if (!findings.ok()) {
    return common::Result<std::string>::failure_from(findings);
  }

  auto spans = findings.value();
  std::sort(spans.begin(), spans.end(), [](const Finding &a, const Finding &b) {
    if (a.start != b.start) {
      return a.start < b.start;
    }
    return a.end > b.end;
  });

  std::vector<Finding> kept;
  std::size_t covered_until = 0;
  for (auto &span : spans) {
    if (span.end <= span.start || span.end > text.size()) {
      continue;
    }
    if (!kept.empty() && span.start < covered_until) {
      continue;
    }
    covered_until = span.end;
    kept.push_back(std::move(span));
  }

  std::string masked = text;
  for (auto it = kept.rbegin(); it != kept.rend(); ++it) {
    masked.replace(it->start, it->end - it->start, placeholder_for(it->entity));
  }
  return common::Result<std::string>::success(std::move(masked));
}

} // namespace safelayer::guards
