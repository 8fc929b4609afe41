#include "safelayer/guards/speech.hpp"

#include <algorithm>
#include <string_view>

namespace safelayer::guards {

namespace {

struct Span {
  std::size_t start = 0;
  std::size_t end = 0;
  const char *label = "";
};

bool is_space_byte(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool is_alpha_byte(const char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

bool is_word_byte(const char ch) {
  return is_alpha_byte(ch) || (ch >= '0' && ch <= '9') || ch == '_';
}

std::size_t skip_spaces(const std::string &text, std::size_t pos) {
  while (pos < text.size() && is_space_byte(text[pos])) {
    ++pos;
  }
  return pos;
}

bool script_keyword_at(const std::string &text, const std::size_t pos) {
  static constexpr std::string_view keyword = "script";
  if (pos + keyword.size() > text.size()) {
    return false;
  }
  for (std::size_t i = 0; i < keyword.size(); ++i) {
    const char ch = text[pos + i];
    const char lowered = (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
    if (lowered != keyword[i]) {
      return false;
    }
  }
  return true;
}

/// End of `< script` (any case, whole word) starting at `open`, or npos.
std::size_t script_open_end(const std::string &text, const std::size_t open) {
  const std::size_t name = skip_spaces(text, open + 1);
  if (!script_keyword_at(text, name)) {
    return std::string::npos;
  }
  const std::size_t after = name + 6;
  if (after < text.size() && is_word_byte(text[after])) {
    return std::string::npos;
  }
  return after;
}

/// End of `< / script >` (any case, optional spaces) starting at `open`, or npos.
std::size_t script_close_end(const std::string &text, const std::size_t open) {
  std::size_t pos = skip_spaces(text, open + 1);
  if (pos >= text.size() || text[pos] != '/') {
    return std::string::npos;
  }
  pos = skip_spaces(text, pos + 1);
  if (!script_keyword_at(text, pos)) {
    return std::string::npos;
  }
  pos = skip_spaces(text, pos + 6);
  if (pos >= text.size() || text[pos] != '>') {
    return std::string::npos;
  }
  return pos + 1;
}

// A script block runs to the first closing tag, or to the end of the text when unclosed.
void collect_script_blocks(const std::string &text, std::vector<Span> &out) {
  std::size_t pos = text.find('<');
  while (pos != std::string::npos) {
    const std::size_t body = script_open_end(text, pos);
    if (body == std::string::npos) {
      pos = text.find('<', pos + 1);
      continue;
    }
    std::size_t end = text.size();
    for (auto close = text.find('<', body); close != std::string::npos;
         close = text.find('<', close + 1)) {
      if (const std::size_t close_end = script_close_end(text, close);
          close_end != std::string::npos) {
        end = close_end;
        break;
      }
    }
    out.push_back(Span{pos, end, "script block"});
    pos = text.find('<', end);
  }
}

// Any `<` or `</` followed by a letter, `!` or `?` and closed by `>` before the next `<` counts
// as markup. This also catches prose such as "x<y and z>w"; "a < b" is left alone.
std::size_t tag_end(const std::string &text, const std::size_t open) {
  std::size_t pos = open + 1;
  if (pos < text.size() && text[pos] == '/') {
    ++pos;
  }
  if (pos >= text.size() || !(is_alpha_byte(text[pos]) || text[pos] == '!' || text[pos] == '?')) {
    return std::string::npos;
  }
  const std::size_t close = text.find_first_of("<>", pos + 1);
  if (close == std::string::npos || text[close] != '>') {
    return std::string::npos;
  }
  return close + 1;
}

void collect_tags(const std::string &text, std::vector<Span> &out) {
  std::size_t pos = text.find('<');
  while (pos != std::string::npos) {
    const std::size_t end = tag_end(text, pos);
    if (end == std::string::npos) {
      pos = text.find('<', pos + 1);
      continue;
    }
    out.push_back(Span{pos, end, "markup tag"});
    pos = text.find('<', end);
  }
}

bool is_disallowed_control(const unsigned char byte) {
  if (byte == '\t' || byte == '\n' || byte == '\r') {
    return false;
  }
  return byte < 0x20U || byte == 0x7FU;
}

template <typename Predicate>
void collect_runs(const std::string &text, Predicate predicate, const char *label,
                  std::vector<Span> &out) {
  std::size_t i = 0;
  while (i < text.size()) {
    if (!predicate(static_cast<unsigned char>(text[i]))) {
      ++i;
      continue;
    }
    const std::size_t start = i;
    while (i < text.size() && predicate(static_cast<unsigned char>(text[i]))) {
      ++i;
    }
    out.push_back(Span{start, i, label});
  }
}

/// Flagged spans in text order with overlaps resolved in favour of the earlier, longer span.
std::vector<Span> flagged_spans(const std::string &text) {
  std::vector<Span> candidates;
  collect_script_blocks(text, candidates);
  collect_tags(text, candidates);
  collect_runs(
      text, [](const unsigned char byte) { return byte >= 0x80U; }, "non-ASCII run", candidates);
  collect_runs(text, is_disallowed_control, "control characters", candidates);

  std::sort(candidates.begin(), candidates.end(), [](const Span &a, const Span &b) {
    if (a.start != b.start) {
      return a.start < b.start;
    }
    return a.end > b.end;
  });

  std::vector<Span> spans;
  std::size_t covered_until = 0;
  for (const auto &candidate : candidates) {
    if (!spans.empty() && candidate.start < covered_until) {
      continue;
    }
    covered_until = candidate.end;
    spans.push_back(candidate);
  }
  return spans;
}

} // namespace

SpeechGuard::SpeechGuard(const bool explain) : Guard(explain) {}

common::Result<std::vector<Finding>> SpeechGuard::check(const std::string &text) const {
  std::vector<Finding> findings;
  for (const auto &span : flagged_spans(text)) {
    findings.push_back(make_finding("invalid_tts", span.start, span.end,
                                    std::string("Invalid pattern matched: ") + span.label + " @ " +
                                        std::to_string(span.start) + "-" +
                                        std::to_string(span.end)));
  }
  return common::Result<std::vector<Finding>>::success(std::move(findings));
}

common::Result<std::string> SpeechGuard::mask(const std::string &text) const {
  std::string current = text;
  // Removing a span can join fragments into a new tag, so strip until a fixed point.
  while (true) {
    const auto spans = flagged_spans(current);
    if (spans.empty()) {
      break;
    }
    std::string kept;
    kept.reserve(current.size());
    std::size_t copied_until = 0;
    for (const auto &span : spans) {
      kept.append(current, copied_until, span.start - copied_until);
      copied_until = span.end;
    }
    kept.append(current, copied_until, std::string::npos);
    current = std::move(kept);
  }
  return common::Result<std::string>::success(std::move(current));
}

} // namespace safelayer::guards
