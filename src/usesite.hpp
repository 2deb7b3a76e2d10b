#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include <llvm/ADT/DenseMap.h>

#include "lookup.hpp"

namespace llvm {
class raw_ostream;
}

namespace modpath {

// Every type or trait path written in `module`'s own items, in source order:
// struct fields, enum payloads, fn and trait method signatures, alias
// targets, const types, impl headers and impl method signatures. Items of
// nested inline modules belong to those modules.
std::vector<UseSite> collect_use_sites(const ResolvedCrate& crate, ModuleId module);

// A unit mounted under two `mod` declarations shares its AST between two
// modules, so entries are keyed by the module as well as the node.
struct ResolutionMap {
    std::vector<ResolvedReference> refs{};
    llvm::DenseMap<std::pair<ModuleId, const Path*>, std::size_t> by_node{};

    const ResolvedReference* find(ModuleId module, const Path* node) const;
    std::size_t size() const { return refs.size(); }
    std::size_t failures() const;
};

// Resolves every use site of the crate (per module, in parallel when
// `session.options.jobs` allows) and reports each failure to the session.
ResolutionMap resolve_use_sites(Session& session, const ResolvedCrate& crate);

void dump_resolutions(llvm::raw_ostream& os, const ResolvedCrate& crate,
                      const ResolutionMap& map);

}  // namespace modpath
