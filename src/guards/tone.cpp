#include "safelayer/guards/tone.hpp"

#include "safelayer/common/fs.hpp"

namespace safelayer::guards {

namespace {

std::string escape_regex(const std::string &word) {
  std::string out;
  out.reserve(word.size() * 2);
  for (const char ch : word) {
    switch (ch) {
    case '.':
    case '+':
    case '*':
    case '?':
    case '^':
    case '$':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
    case '|':
    case '\\':
      out += '\\';
      out += ch;
      break;
    default:
      out += ch;
      break;
    }
  }
  return out;
}

} // namespace

std::vector<std::string> default_profanity_list() { return {"damn", "crap", "shit", "fuck"}; }

ToneGuard::ToneGuard(ToneGuardOptions options)
    : Guard(options.explain), options_(std::move(options)) {
  std::string alternation;
  for (const auto &raw : options_.denylist) {
    const std::string word = common::trim(raw);
    if (word.empty()) {
      continue;
    }
    if (!alternation.empty()) {
      alternation += '|';
    }
    alternation += escape_regex(word);
  }
  if (!alternation.empty()) {
    pattern_.emplace("\\b(" + alternation + ")\\b", std::regex::icase);
  }
}

common::Result<std::vector<Finding>> ToneGuard::check(const std::string &text) const {
  std::vector<Finding> findings;
  if (!pattern_.has_value()) {
    return common::Result<std::vector<Finding>>::success(std::move(findings));
  }

  try {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), *pattern_);
         it != std::sregex_iterator(); ++it) {
      const auto start = static_cast<std::size_t>(it->position(0));
      const auto end = start + static_cast<std::size_t>(it->length(0));
      findings.push_back(make_finding("profanity", start, end,
                                      "Profanity: " + it->str(0) + " @ " +
                                          std::to_string(start) + "-" + std::to_string(end)));
    }
  } catch (const std::regex_error &ex) {
    return common::Result<std::vector<Finding>>::failure(
        std::string("profanity matching failed: ") + ex.what(), common::ErrorKind::GuardFailure);
  }
  return common::Result<std::vector<Finding>>::success(std::move(findings));
}

common::Result<std::string> ToneGuard::mask(const std::string &text) const {
  if (options_.warn_only || !pattern_.has_value()) {
    return common::Result<std::string>::success(text);
  }

  const auto findings = check(text);
  if (!findings.ok()) {
    return common::Result<std::string>::failure_from(findings);
  }

  std::string masked = text;
  for (const auto &finding : findings.value()) {
    for (std::size_t i = finding.start; i < finding.end; ++i) {
      masked[i] = options_.mask_char;
    }
  }
  return common::Result<std::string>::success(std::move(masked));
}

} // namespace safelayer::guards
