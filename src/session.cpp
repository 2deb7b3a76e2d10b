#include "session.hpp"

#include <llvm/Support/Threading.h>
#include <llvm/Support/raw_ostream.h>

#include <utility>

namespace modpath {

std::filesystem::path normalize_path(std::filesystem::path path) {
  return path.lexically_normal();
}

FileId Session::add_file(std::filesystem::path path) {
  std::filesystem::path normalized = normalize_path(std::move(path));
  return sources.add_file(normalized.generic_string());
}

void Session::report(Diagnostic d) {
  diags.push_back(std::move(d));
}

void Session::report_all(std::vector<Diagnostic> ds) {
  for (auto& d : ds) diags.push_back(std::move(d));
}

bool Session::has_errors() const {
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) return true;
  }
  return false;
}

std::size_t Session::count(ErrorKind kind) const {
  std::size_t n = 0;
  for (const auto& d : diags) {
    if (d.kind == kind) n++;
  }
  return n;
}

unsigned Session::effective_jobs() const {
  if (options.jobs != 0) return options.jobs;
  unsigned n = llvm::hardware_concurrency().compute_thread_count();
  return n == 0 ? 1 : n;
}

void Session::print_diagnostics(llvm::raw_ostream& os) const {
  for (const auto& d : diags) print_diagnostic(os, sources, d);
}

}  // namespace modpath
