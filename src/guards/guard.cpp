#include "safelayer/guards/guard.hpp"

#include <iostream>

namespace safelayer::guards {

Guard::Guard(const bool explain) : explain_(explain), explain_out_(&std::cerr) {}

void Guard::explain(const Finding &finding) const {
  if (!explain_) {
    return;
  }
  *explain_out_ << "[" << name() << "][EXPLAIN] " << finding.explanation << "\n";
}

Finding Guard::make_finding(std::string entity, const std::size_t start, const std::size_t end,
                            std::string explanation, const double score) const {
  return Finding{.entity = std::move(entity),
                 .start = start,
                 .end = end,
                 .explanation = std::move(explanation),
                 .detector = std::string(name()),
                 .score = score};
}

} // namespace safelayer::guards
