#pragma once

#include "resolve.hpp"

namespace modpath {

// Construction passes run in this order by `resolve_crate`. Each one only
// mutates `crate`; later passes may rely on earlier ones being complete.

// Returns false when there is no root module to build on.
bool build_module_tree(Session& session, const CrateInput& input, ResolvedCrate& crate);

void collect_declarations(Session& session, ResolvedCrate& crate);

void resolve_imports(Session& session, ResolvedCrate& crate);

}  // namespace modpath
