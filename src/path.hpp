#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "resolve.hpp"

namespace modpath {

struct PathSegment {
    std::string name{};
    Span span{};
};

// A path detached from the AST: root anchor plus segments, the last of which
// is the bare name being looked up.
struct QualifiedPath {
    PathRoot root = PathRoot::Plain;
    std::uint32_t super_count = 0;
    std::vector<PathSegment> segments{};

    bool empty() const { return segments.empty(); }
    bool is_bare() const {
        return root == PathRoot::Plain && segments.size() == 1;
    }
    const PathSegment& last() const { return segments.back(); }
    Span span() const;
    std::string str() const;
};

QualifiedPath path_from_ast(const Path* path);

// `prefix::rest`, as written inside a use group. `rest` must be plain.
std::optional<QualifiedPath> join_paths(const QualifiedPath& prefix,
                                        const QualifiedPath& rest);

// Accepts `a::b::C`, `::a::C`, `crate::C`, `self::C`, `super::super::C`.
// Returns nullopt for empty segments, keywords out of place, or segments that
// are not identifiers.
std::optional<QualifiedPath> parse_path(std::string_view text);

// `crate::m::n::Name`. Resolving it from any module yields `decl`.
std::string canonical_path(const ResolvedCrate& crate, DeclId decl);

// Shortest `self::`/`super::` path from module `from` to `decl`.
std::string relative_path(const ResolvedCrate& crate, ModuleId from, DeclId decl);

std::vector<Candidate> describe_candidates(const ResolvedCrate& crate,
                                           llvm::ArrayRef<DeclId> decls);

}  // namespace modpath
