#include "safelayer/guards/keyword.hpp"

#include <algorithm>

namespace safelayer::guards {

KeywordGuard::KeywordGuard(KeywordGuardOptions options)
    : Guard(options.explain), options_(std::move(options)) {
  options_.keywords.erase(std::remove_if(options_.keywords.begin(), options_.keywords.end(),
                                         [](const std::string &k) { return k.empty(); }),
                          options_.keywords.end());
  // Longest first so overlapping keywords redact the widest match.
  std::stable_sort(options_.keywords.begin(), options_.keywords.end(),
                   [](const std::string &a, const std::string &b) { return a.size() > b.size(); });
}

common::Result<std::vector<Finding>> KeywordGuard::check(const std::string &text) const {
  std::vector<Finding> findings;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t best = std::string::npos;
    const std::string *best_keyword = nullptr;
    for (const auto &keyword : options_.keywords) {
      const auto found = text.find(keyword, pos);
      if (found != std::string::npos && (best == std::string::npos || found < best)) {
        best = found;
        best_keyword = &keyword;
      }
    }
    if (best_keyword == nullptr) {
      break;
    }
    const std::size_t end = best + best_keyword->size();
    findings.push_back(make_finding(options_.entity, best, end,
                                    "Found " + options_.entity + " keyword @ " +
                                        std::to_string(best) + "-" + std::to_string(end)));
    pos = end;
  }
  return common::Result<std::vector<Finding>>::success(std::move(findings));
}

common::Result<std::string> KeywordGuard::mask(const std::string &text) const {
  const auto findings = check(text);
  if (!findings.ok()) {
    return common::Result<std::string>::failure_from(findings);
  }
  std::string masked = text;
  const auto &spans = findings.value();
  for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
    masked.replace(it->start, it->end - it->start, options_.replacement);
  }
  return common::Result<std::string>::success(std::move(masked));
}

} // namespace safelayer::guards
