#pragma once

#include <cstdint>

namespace modpath {

// What happens when a `use` binds a name that a local declaration of the same
// namespace already owns in that module. In both modes the import is dropped
// and bare lookups find the local declaration.
enum class ImportShadowing : std::uint8_t {
    Reject,     // reported as DuplicateImport (error)
    LocalWins,  // reported as ImportShadowed (warning)
};

struct ResolveOptions {
    ImportShadowing import_shadowing = ImportShadowing::Reject;

    // Worker threads for per-module passes. 0 picks the hardware thread
    // count, 1 runs everything on the calling thread.
    unsigned jobs = 1;

    // Fall back to builtin type names (`u64`, `bool`, ...) for bare type paths.
    bool primitives = true;

    // Enables the LLVM_DEBUG traces of every pass (assertion builds only).
    bool trace = false;
};

}  // namespace modpath
