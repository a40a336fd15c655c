#include "cw/core/diagnostics.hpp"

#include <algorithm>

namespace cw {

const char* to_string(DiagnosticCode code) noexcept {
  switch (code) {
    case DiagnosticCode::SourceParseError:          return "SourceParseError";
    case DiagnosticCode::MissingFieldError:         return "MissingFieldError";
    case DiagnosticCode::UndefinedAggregateWarning: return "UndefinedAggregateWarning";
    case DiagnosticCode::DuplicateKeyWarning:       return "DuplicateKeyWarning";
    case DiagnosticCode::UnknownSide:               return "UnknownSide";
    case DiagnosticCode::InvalidRow:                return "InvalidRow";
    case DiagnosticCode::ItmFlagMismatch:           return "ItmFlagMismatch";
    case DiagnosticCode::CrossedQuote:              return "CrossedQuote";
  }
  return "Unknown";
}

std::string format_diagnostic(const Diagnostic& d) {
  std::string out = "[";
  out += to_string(d.code);
  out += "] ";
  if (!d.source.empty()) {
    out += d.source;
    out += ": ";
  }
  out += d.message;
  return out;
}

std::size_t count_code(const std::vector<Diagnostic>& diags, DiagnosticCode code) noexcept {
  return static_cast<std::size_t>(std::count_if(diags.begin(), diags.end(),
    [code](const Diagnostic& d){ return d.code == code; }));
}

} // namespace cw
