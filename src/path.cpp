#include "path.hpp"

#include <algorithm>
#include <cctype>

namespace modpath {

static bool is_keyword(std::string_view s) {
    return s == "crate" || s == "self" || s == "super";
}

static bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    auto head = static_cast<unsigned char>(s.front());
    if (!std::isalpha(head) && head != '_') return false;
    for (char c : s.substr(1)) {
        auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') return false;
    }
    return true;
}

Span QualifiedPath::span() const {
    if (segments.empty()) return Span{};
    Span out = segments.front().span;
    out.end = segments.back().span.end;
    return out;
}

std::string QualifiedPath::str() const {
    std::string out{};
    switch (root) {
        case PathRoot::Plain:
            break;
        case PathRoot::Crate:
            out += "crate::";
            break;
        case PathRoot::Self:
            out += "self::";
            break;
        case PathRoot::Super:
            for (std::uint32_t i = 0; i < super_count; i++) out += "super::";
            break;
    }
    for (size_t i = 0; i < segments.size(); i++) {
        if (i != 0) out += "::";
        out += segments[i].name;
    }
    return out;
}

QualifiedPath path_from_ast(const Path* path) {
    QualifiedPath out{};
    if (!path) return out;
    out.root = path->root;
    out.super_count = path->root == PathRoot::Super ? path->super_count : 0;
    out.segments.reserve(path->segments.size());
    for (const Ident* seg : path->segments) {
        if (!seg) continue;
        out.segments.push_back(PathSegment{.name = seg->text, .span = seg->span});
    }
    return out;
}

std::optional<QualifiedPath> join_paths(const QualifiedPath& prefix,
                                        const QualifiedPath& rest) {
    if (rest.root != PathRoot::Plain) return std::nullopt;
    QualifiedPath out = prefix;
    out.segments.insert(out.segments.end(), rest.segments.begin(),
                        rest.segments.end());
    return out;
}

std::optional<QualifiedPath> parse_path(std::string_view text) {
    if (text.empty()) return std::nullopt;

    QualifiedPath out{};
    bool leading_colons = false;
    if (text.substr(0, 2) == "::") {
        leading_colons = true;
        out.root = PathRoot::Crate;
        text.remove_prefix(2);
    }

    std::vector<std::string_view> parts{};
    while (true) {
        size_t sep = text.find("::");
        parts.push_back(text.substr(0, sep));
        if (sep == std::string_view::npos) break;
        text.remove_prefix(sep + 2);
    }

    size_t i = 0;
    if (!leading_colons) {
        if (parts[0] == "crate") {
            out.root = PathRoot::Crate;
            i = 1;
        } else if (parts[0] == "self") {
            out.root = PathRoot::Self;
            i = 1;
        } else if (parts[0] == "super") {
            out.root = PathRoot::Super;
            while (i < parts.size() && parts[i] == "super") {
                out.super_count++;
                i++;
            }
        }
    }

    if (i >= parts.size()) return std::nullopt;
    for (; i < parts.size(); i++) {
        if (!is_identifier(parts[i]) || is_keyword(parts[i]))
            return std::nullopt;
        out.segments.push_back(PathSegment{.name = std::string(parts[i])});
    }
    return out;
}

std::string canonical_path(const ResolvedCrate& crate, DeclId decl) {
    const Decl& d = crate.decl(decl);
    return crate.module_path(d.module) + "::" + d.name;
}

std::string relative_path(const ResolvedCrate& crate, ModuleId from,
                          DeclId decl) {
    const Decl& d = crate.decl(decl);

    auto chain = [&](ModuleId m) {
        std::vector<ModuleId> out{};
        for (; m != kNoModule; m = crate.module(m).parent) out.push_back(m);
        return out;
    };
    std::vector<ModuleId> up = chain(from);
    std::vector<ModuleId> down = chain(d.module);

    size_t ups = 0;
    auto lca = down.end();
    for (; ups < up.size(); ups++) {
        lca = std::find(down.begin(), down.end(), up[ups]);
        if (lca != down.end()) break;
    }

    std::string out{};
    if (ups == 0) {
        out = "self::";
    } else {
        for (size_t i = 0; i < ups; i++) out += "super::";
    }
    for (auto it = std::make_reverse_iterator(lca); it != down.rend(); ++it) {
        out += crate.module(*it).name;
        out += "::";
    }
    out += d.name;
    return out;
}

std::vector<Candidate> describe_candidates(const ResolvedCrate& crate,
                                           llvm::ArrayRef<DeclId> decls) {
    std::vector<Candidate> out{};
    out.reserve(decls.size());
    for (DeclId id : decls) {
        out.push_back(Candidate{
            .decl = id,
            .path = canonical_path(crate, id),
            .span = crate.decl(id).span,
        });
    }
    return out;
}

}  // namespace modpath
