#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "options.hpp"
#include "path.hpp"
#include "resolve.hpp"

namespace modpath {

struct LookupUnique {
    DeclId decl = 0;
};

struct LookupAmbiguous {
    DeclSet candidates{};
};

struct LookupNotFound {};

using LookupResult = std::variant<LookupUnique, LookupAmbiguous, LookupNotFound>;

// Declarations `module` owns directly.
LookupResult lookup_local(const ResolvedCrate& crate, ModuleId module,
                          std::string_view name, Namespace ns);

// `module`'s import scope. With `reexports_only`, private `use` bindings are
// invisible (the lookup comes from outside the module).
LookupResult lookup_import(const ResolvedCrate& crate, ModuleId module,
                           std::string_view name, Namespace ns,
                           bool reexports_only);

// Terminal lookup of a qualified path: `target`'s declarations, then the
// imports of `target` visible from `from`.
LookupResult lookup_in_module(const ResolvedCrate& crate, ModuleId target,
                              ModuleId from, std::string_view name,
                              Namespace ns);

enum class Primitive : std::uint8_t { U8, U16, U32, U64, U256, Bool, B256, Str };

std::optional<Primitive> primitive_from_name(std::string_view name);
std::string_view primitive_name(Primitive p);

struct UseSite {
    ModuleId module = 0;
    QualifiedPath path{};
    Namespace ns = Namespace::Type;
    Span span{};
    const Path* node = nullptr;  // null for synthetic queries
};

struct ResolveError {
    ErrorKind kind{};
    std::string name{};        // the segment or name that failed
    ModuleId in = kNoModule;   // module searched when it failed
    DeclSet candidates{};
    std::string message{};
};

struct ResolvedReference {
    UseSite site{};
    std::variant<DeclId, Primitive, ResolveError> result{};

    bool ok() const { return !std::holds_alternative<ResolveError>(result); }
    const DeclId* decl() const { return std::get_if<DeclId>(&result); }
    const Primitive* primitive() const { return std::get_if<Primitive>(&result); }
    const ResolveError* error() const { return std::get_if<ResolveError>(&result); }
};

// Equal targets mean the same declaration identity (or the same primitive),
// regardless of how either path was spelled.
bool same_target(const ResolvedReference& a, const ResolvedReference& b);

// Walks every segment but the last and returns the module in which the last
// segment must be looked up.
std::variant<ModuleId, ResolveError> walk_module_prefix(const ResolvedCrate& crate,
                                                        ModuleId from,
                                                        const QualifiedPath& path);

// Pure: reads only the frozen crate, safe to call from many threads.
ResolvedReference resolve(const ResolvedCrate& crate, UseSite site,
                          const ResolveOptions& options = {});

Diagnostic to_diagnostic(const ResolvedCrate& crate, const ResolvedReference& ref);

}  // namespace modpath
