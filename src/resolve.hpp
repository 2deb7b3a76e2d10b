#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringMap.h>

#include "ast.hpp"
#include "session.hpp"

namespace modpath {

using ModuleId = std::uint32_t;
using DeclId = std::uint32_t;

inline constexpr ModuleId kNoModule = std::numeric_limits<ModuleId>::max();

enum class DeclKind : std::uint8_t { Struct, Enum, Trait, TypeAlias, Fn, Const };

// Which names a use-site may refer to. Types and values live side by side:
// `struct S` and `fn S` in one module are two distinct declarations.
enum class Namespace : std::uint8_t { Type, Value, Any };

std::string_view decl_kind_name(DeclKind kind);
Namespace decl_namespace(DeclKind kind);
bool in_namespace(DeclKind kind, Namespace ns);

// Identity is (module, name, kind); `id` is unique per identity.
struct Decl {
    DeclId id = 0;
    ModuleId module = 0;
    std::string name{};
    DeclKind kind{};
    const Item* item = nullptr;
    Span span{};
};

using DeclSet = llvm::SmallVector<DeclId, 2>;

// A name brought into a module's import scope by `use`. `decls` holds every
// declaration the imported path named, across namespaces.
struct ImportBinding {
    std::string name{};
    DeclSet decls{};
    const ItemUse* origin = nullptr;
    Span span{};
    bool is_pub = false;
};

struct Module {
    ModuleId id = 0;
    ModuleId parent = kNoModule;
    std::string name{};
    FileId file = 0;
    UnitId unit = 0;
    Span span{};

    std::vector<const Item*> items{};

    llvm::StringMap<ModuleId> submodules{};
    llvm::StringMap<DeclSet> decls{};
    llvm::StringMap<ImportBinding> imports{};

    std::vector<const ItemUse*> uses{};
    std::vector<const ItemImpl*> impls{};
};

// One parsed source file.
struct SourceUnit {
    FileId file = 0;
    std::vector<Item*> items{};
};

struct CrateInput {
    std::vector<SourceUnit> units{};
    UnitId root = 0;
};

// Output of the construction passes. Immutable once `resolve_crate` returns;
// every query takes it by const reference.
struct ResolvedCrate {
    ModuleId root = 0;
    std::vector<Module> modules{};
    std::vector<Decl> decls{};

    bool empty() const { return modules.empty(); }
    const Module& module(ModuleId id) const { return modules.at(id); }
    const Decl& decl(DeclId id) const { return decls.at(id); }

    // `crate`, `crate::a`, `crate::a::b`.
    std::string module_path(ModuleId id) const;
    std::uint32_t depth(ModuleId id) const;
    std::optional<ModuleId> child(ModuleId parent, std::string_view name) const;
    std::optional<ModuleId> find_module(std::string_view path) const;

    llvm::ArrayRef<DeclId> local_decls(ModuleId id, std::string_view name) const;
    const ImportBinding* import_binding(ModuleId id, std::string_view name) const;
};

// Runs module tree construction, declaration collection and import
// resolution. Errors go to `session.diags`; the crate is always returned,
// possibly partial.
ResolvedCrate resolve_crate(Session& session, const CrateInput& input);

void dump_crate(llvm::raw_ostream& os, const ResolvedCrate& crate);

}  // namespace modpath
