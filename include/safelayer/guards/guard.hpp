#pragma once

#include "safelayer/common/result.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace safelayer::guards {

/// One detected violation. Offsets are byte offsets into the text passed to the `check` call
/// that produced the finding; any later mask of that text invalidates them.
struct Finding {
  std::string entity;
  std::size_t start = 0;
  std::size_t end = 0;
  std::string explanation;
  std::string detector;
  double score = 1.0;
};

/// A pluggable detector/rewriter for one category of unsafe content.
///
/// Implementations must be deterministic and must not keep per-call state: `check` and `mask`
/// are const so one instance can serve concurrent pipeline runs.
class Guard {
public:
  explicit Guard(bool explain = false);
  virtual ~Guard() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<Finding>> check(const std::string &text) const = 0;
  /// Must be idempotent once no violation of this guard's kind remains.
  [[nodiscard]] virtual common::Result<std::string> mask(const std::string &text) const = 0;

  /// Prints the finding's explanation when the explain flag is set. Never alters text.
  virtual void explain(const Finding &finding) const;

  [[nodiscard]] bool explain_enabled() const { return explain_; }
  void set_explain_stream(std::ostream &out) { explain_out_ = &out; }

protected:
  [[nodiscard]] Finding make_finding(std::string entity, std::size_t start, std::size_t end,
                                     std::string explanation, double score = 1.0) const;

private:
  bool explain_;
  std::ostream *explain_out_;
};

} // namespace safelayer::guards
