#include "lookup.hpp"

#include <utility>

namespace modpath {

static DeclSet filter(const ResolvedCrate& crate, llvm::ArrayRef<DeclId> decls,
                      Namespace ns) {
    DeclSet out{};
    for (DeclId id : decls) {
        if (in_namespace(crate.decl(id).kind, ns)) out.push_back(id);
    }
    return out;
}

static LookupResult classify(DeclSet set) {
    if (set.empty()) return LookupNotFound{};
    if (set.size() == 1) return LookupUnique{.decl = set.front()};
    return LookupAmbiguous{.candidates = std::move(set)};
}

static const char* ns_noun(Namespace ns) {
    switch (ns) {
        case Namespace::Type:
            return "type";
        case Namespace::Value:
            return "value";
        case Namespace::Any:
            return "item";
    }
    return "item";
}

LookupResult lookup_local(const ResolvedCrate& crate, ModuleId module,
                          std::string_view name, Namespace ns) {
    return classify(filter(crate, crate.local_decls(module, name), ns));
}

LookupResult lookup_import(const ResolvedCrate& crate, ModuleId module,
                           std::string_view name, Namespace ns,
                           bool reexports_only) {
    const ImportBinding* b = crate.import_binding(module, name);
    if (!b) return LookupNotFound{};
    if (reexports_only && !b->is_pub) return LookupNotFound{};
    return classify(filter(crate, b->decls, ns));
}

LookupResult lookup_in_module(const ResolvedCrate& crate, ModuleId target,
                              ModuleId from, std::string_view name,
                              Namespace ns) {
    LookupResult local = lookup_local(crate, target, name, ns);
    if (!std::holds_alternative<LookupNotFound>(local)) return local;
    return lookup_import(crate, target, name, ns, target != from);
}

std::optional<Primitive> primitive_from_name(std::string_view name) {
    if (name == "u8") return Primitive::U8;
    if (name == "u16") return Primitive::U16;
    if (name == "u32") return Primitive::U32;
    if (name == "u64") return Primitive::U64;
    if (name == "u256") return Primitive::U256;
    if (name == "bool") return Primitive::Bool;
    if (name == "b256") return Primitive::B256;
    if (name == "str") return Primitive::Str;
    return std::nullopt;
}

std::string_view primitive_name(Primitive p) {
    switch (p) {
        case Primitive::U8:
            return "u8";
        case Primitive::U16:
            return "u16";
        case Primitive::U32:
            return "u32";
        case Primitive::U64:
            return "u64";
        case Primitive::U256:
            return "u256";
        case Primitive::Bool:
            return "bool";
        case Primitive::B256:
            return "b256";
        case Primitive::Str:
            return "str";
    }
    return "?";
}

bool same_target(const ResolvedReference& a, const ResolvedReference& b) {
    if (const DeclId* da = a.decl()) {
        const DeclId* db = b.decl();
        return db && *da == *db;
    }
    if (const Primitive* pa = a.primitive()) {
        const Primitive* pb = b.primitive();
        return pb && *pa == *pb;
    }
    return false;
}

std::variant<ModuleId, ResolveError> walk_module_prefix(const ResolvedCrate& crate,
                                                        ModuleId from,
                                                        const QualifiedPath& path) {
    if (path.empty()) {
        return ResolveError{.kind = ErrorKind::UnresolvedName,
                            .in = from,
                            .message = "empty path"};
    }

    ModuleId cur = from;
    size_t first = 0;
    switch (path.root) {
        case PathRoot::Crate:
            cur = crate.root;
            break;
        case PathRoot::Self:
            cur = from;
            break;
        case PathRoot::Super:
            for (std::uint32_t i = 0; i < path.super_count; i++) {
                ModuleId parent = crate.module(cur).parent;
                if (parent == kNoModule) {
                    return ResolveError{
                        .kind = ErrorKind::UnknownModule,
                        .name = "super",
                        .in = cur,
                        .message = "too many `super` in `" + path.str() +
                                   "`: module `" + crate.module_path(cur) +
                                   "` has no parent",
                    };
                }
                cur = parent;
            }
            break;
        case PathRoot::Plain: {
            if (path.segments.size() == 1) return from;
            const std::string& head = path.segments.front().name;
            std::optional<ModuleId> next = crate.child(from, head);
            if (!next) next = crate.child(crate.root, head);
            if (!next) {
                return ResolveError{
                    .kind = ErrorKind::UnknownModule,
                    .name = head,
                    .in = from,
                    .message = "cannot find module `" + head + "` in module `" +
                               crate.module_path(from) + "` or the crate root",
                };
            }
            cur = *next;
            first = 1;
            break;
        }
    }

    for (size_t i = first; i + 1 < path.segments.size(); i++) {
        const std::string& seg = path.segments[i].name;
        std::optional<ModuleId> next = crate.child(cur, seg);
        if (!next) {
            return ResolveError{
                .kind = ErrorKind::UnknownModule,
                .name = seg,
                .in = cur,
                .message = "cannot find module `" + seg + "` in module `" +
                           crate.module_path(cur) + "`",
            };
        }
        cur = *next;
    }
    return cur;
}

static ResolveError ambiguous(const ResolvedCrate& crate, ModuleId in,
                              const std::string& name, Namespace ns,
                              DeclSet candidates) {
    std::string message = "`" + name + "` is ambiguous in module `" +
                          crate.module_path(in) + "`: " +
                          std::to_string(candidates.size()) + " " +
                          ns_noun(ns) + "s match";
    return ResolveError{.kind = ErrorKind::AmbiguousName,
                        .name = name,
                        .in = in,
                        .candidates = std::move(candidates),
                        .message = std::move(message)};
}

static void resolve_bare(const ResolvedCrate& crate,
                         const ResolveOptions& options, ResolvedReference& ref) {
    const UseSite& site = ref.site;
    const std::string& name = site.path.last().name;

    LookupResult r = lookup_local(crate, site.module, name, site.ns);
    if (std::holds_alternative<LookupNotFound>(r))
        r = lookup_import(crate, site.module, name, site.ns, false);

    if (const auto* u = std::get_if<LookupUnique>(&r)) {
        ref.result = u->decl;
        return;
    }
    if (auto* a = std::get_if<LookupAmbiguous>(&r)) {
        ref.result = ambiguous(crate, site.module, name, site.ns,
                               std::move(a->candidates));
        return;
    }

    if (options.primitives && site.ns != Namespace::Value) {
        if (std::optional<Primitive> p = primitive_from_name(name)) {
            ref.result = *p;
            return;
        }
    }

    ref.result = ResolveError{
        .kind = ErrorKind::UnresolvedName,
        .name = name,
        .in = site.module,
        .message = "cannot find " + std::string(ns_noun(site.ns)) + " `" +
                   name + "` in module `" + crate.module_path(site.module) +
                   "`",
    };
}

static void resolve_qualified(const ResolvedCrate& crate,
                              ResolvedReference& ref) {
    const UseSite& site = ref.site;
    auto walked = walk_module_prefix(crate, site.module, site.path);
    if (auto* err = std::get_if<ResolveError>(&walked)) {
        ref.result = std::move(*err);
        return;
    }

    ModuleId target = std::get<ModuleId>(walked);
    const std::string& name = site.path.last().name;
    LookupResult r = lookup_in_module(crate, target, site.module, name, site.ns);

    if (const auto* u = std::get_if<LookupUnique>(&r)) {
        ref.result = u->decl;
        return;
    }
    if (auto* a = std::get_if<LookupAmbiguous>(&r)) {
        ref.result =
            ambiguous(crate, target, name, site.ns, std::move(a->candidates));
        return;
    }
    ref.result = ResolveError{
        .kind = ErrorKind::UnknownDeclaration,
        .name = name,
        .in = target,
        .message = "cannot find " + std::string(ns_noun(site.ns)) + " `" +
                   name + "` in module `" + crate.module_path(target) + "`",
    };
}

ResolvedReference resolve(const ResolvedCrate& crate, UseSite site,
                          const ResolveOptions& options) {
    ResolvedReference ref{};
    ref.site = std::move(site);

    if (crate.empty() || ref.site.module >= crate.modules.size()) {
        ref.result = ResolveError{.kind = ErrorKind::UnknownModule,
                                  .in = ref.site.module,
                                  .message = "use-site module does not exist"};
        return ref;
    }
    if (ref.site.path.empty()) {
        ref.result = ResolveError{.kind = ErrorKind::UnresolvedName,
                                  .in = ref.site.module,
                                  .message = "empty path"};
        return ref;
    }

    if (ref.site.path.is_bare()) {
        resolve_bare(crate, options, ref);
    } else {
        resolve_qualified(crate, ref);
    }
    return ref;
}

Diagnostic to_diagnostic(const ResolvedCrate& crate, const ResolvedReference& ref) {
    Diagnostic d{};
    d.span = ref.site.span;
    d.module = ref.site.module;
    d.path = ref.site.path.str();
    if (const ResolveError* err = ref.error()) {
        d.kind = err->kind;
        d.message = err->message;
        d.candidates = describe_candidates(crate, err->candidates);
    }
    return d;
}

}  // namespace modpath
