#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "diag.hpp"
#include "options.hpp"
#include "source.hpp"

namespace modpath {

std::filesystem::path normalize_path(std::filesystem::path path);

// One compilation unit's worth of shared state: file names, options, and
// every diagnostic reported by any pass.
struct Session {
    SourceManager sources{};
    ResolveOptions options{};
    std::vector<Diagnostic> diags{};

    FileId add_file(std::filesystem::path path);

    void report(Diagnostic d);
    void report_all(std::vector<Diagnostic> ds);

    bool has_errors() const;
    std::size_t count(ErrorKind kind) const;

    // Worker count with `jobs == 0` expanded to the hardware thread count.
    unsigned effective_jobs() const;

    void print_diagnostics(llvm::raw_ostream& os) const;
};

}  // namespace modpath
