#pragma once

#include "source.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace llvm {
class raw_ostream;
}

namespace modpath {

enum class Severity : std::uint8_t { Error, Warning, Note };

enum class ErrorKind : std::uint8_t {
  DuplicateModuleName,
  CyclicModuleGraph,
  DuplicateDeclaration,
  UnresolvedImport,
  DuplicateImport,
  CyclicImport,
  UnknownModule,
  UnknownDeclaration,
  UnresolvedName,
  AmbiguousName,
  ImportShadowed,
};

std::string_view error_kind_name(ErrorKind kind);

// A declaration that took part in a failed resolution, kept so the report can
// list "candidates are: ...".
struct Candidate {
  std::uint32_t decl = 0;  // DeclId
  std::string path{};      // canonical path, `crate::a::Name`
  Span span{};
};

struct Diagnostic {
  Severity severity = Severity::Error;
  ErrorKind kind{};
  Span span{};
  std::uint32_t module = std::numeric_limits<std::uint32_t>::max();  // ModuleId
  std::string path{};  // surface text of the offending path or name
  std::string message{};
  std::vector<Candidate> candidates{};
};

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d);
void print_diagnostic(llvm::raw_ostream& os, const SourceManager& sm, const Diagnostic& d);

}  // namespace modpath
