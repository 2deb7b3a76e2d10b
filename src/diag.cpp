#include "diag.hpp"

#include <llvm/Support/raw_ostream.h>

namespace modpath {

static const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DuplicateModuleName:
      return "DuplicateModuleName";
    case ErrorKind::CyclicModuleGraph:
      return "CyclicModuleGraph";
    case ErrorKind::DuplicateDeclaration:
      return "DuplicateDeclaration";
    case ErrorKind::UnresolvedImport:
      return "UnresolvedImport";
    case ErrorKind::DuplicateImport:
      return "DuplicateImport";
    case ErrorKind::CyclicImport:
      return "CyclicImport";
    case ErrorKind::UnknownModule:
      return "UnknownModule";
    case ErrorKind::UnknownDeclaration:
      return "UnknownDeclaration";
    case ErrorKind::UnresolvedName:
      return "UnresolvedName";
    case ErrorKind::AmbiguousName:
      return "AmbiguousName";
    case ErrorKind::ImportShadowed:
      return "ImportShadowed";
  }
  return "Unknown";
}

void print_diagnostic(llvm::raw_ostream& os, const SourceManager& sm, const Diagnostic& d) {
  os << sm.describe(d.span) << ": " << severity_name(d.severity) << "["
     << error_kind_name(d.kind) << "]: " << d.message << "\n";
  for (const Candidate& c : d.candidates) {
    os << sm.describe(c.span) << ": note: candidate `" << c.path << "` declared here\n";
  }
}

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d) {
  std::string out{};
  llvm::raw_string_ostream os(out);
  print_diagnostic(os, sm, d);
  os.flush();
  if (!out.empty() && out.back() == '\n') out.pop_back();
  return out;
}

}  // namespace modpath
