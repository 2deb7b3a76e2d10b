#include "passes.hpp"

#include <llvm/ADT/StringMap.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#define DEBUG_TYPE "modpath-collect"

namespace modpath {
namespace {

struct PendingDecl {
    std::string name{};
    DeclKind kind{};
    const Item* item = nullptr;
    Span span{};
};

struct Duplicate {
    std::size_t first = 0;  // index into ModuleCollection::decls
    Diagnostic diag{};
};

// Everything one module contributes; filled without touching shared state.
struct ModuleCollection {
    std::vector<PendingDecl> decls{};
    std::vector<const ItemUse*> uses{};
    std::vector<const ItemImpl*> impls{};
    std::vector<Duplicate> duplicates{};
};

std::optional<DeclKind> decl_kind_of(const Item* item) {
    switch (item->kind) {
        case AstNodeKind::ItemStruct:
            return DeclKind::Struct;
        case AstNodeKind::ItemEnum:
            return DeclKind::Enum;
        case AstNodeKind::ItemTrait:
            return DeclKind::Trait;
        case AstNodeKind::ItemTypeAlias:
            return DeclKind::TypeAlias;
        case AstNodeKind::ItemFn:
            return DeclKind::Fn;
        case AstNodeKind::ItemConst:
            return DeclKind::Const;
        default:
            return std::nullopt;
    }
}

std::string item_name(const Item* item) {
    switch (item->kind) {
        case AstNodeKind::ItemStruct:
            return static_cast<const ItemStruct*>(item)->name;
        case AstNodeKind::ItemEnum:
            return static_cast<const ItemEnum*>(item)->name;
        case AstNodeKind::ItemTrait:
            return static_cast<const ItemTrait*>(item)->name;
        case AstNodeKind::ItemTypeAlias:
            return static_cast<const ItemTypeAlias*>(item)->name;
        case AstNodeKind::ItemConst:
            return static_cast<const ItemConst*>(item)->name;
        case AstNodeKind::ItemFn: {
            const auto* fn = static_cast<const ItemFn*>(item);
            return fn->decl ? fn->decl->name : std::string{};
        }
        default:
            return {};
    }
}

ModuleCollection collect_module(const ResolvedCrate& crate, ModuleId module_id) {
    const Module& m = crate.modules[module_id];
    ModuleCollection out{};

    // name -> index of the first decl in each namespace. A name holds at
    // most one type and one value.
    struct Seen {
        std::optional<std::size_t> first[2] = {};
    };
    llvm::StringMap<Seen> seen{};

    for (const Item* item : m.items) {
        if (!item) continue;
        if (item->kind == AstNodeKind::ItemUse) {
            out.uses.push_back(static_cast<const ItemUse*>(item));
            continue;
        }
        if (item->kind == AstNodeKind::ItemImpl) {
            out.impls.push_back(static_cast<const ItemImpl*>(item));
            continue;
        }

        std::optional<DeclKind> kind = decl_kind_of(item);
        if (!kind) continue;
        std::string name = item_name(item);
        if (name.empty()) continue;

        auto& slot = seen[name].first[static_cast<std::size_t>(decl_namespace(*kind))];
        if (slot) {
            DeclKind prior = out.decls[*slot].kind;
            std::string what = std::string(decl_kind_name(*kind)) + " `" + name + "`";
            std::string in = " in module `" + crate.module_path(module_id) + "`";
            out.duplicates.push_back(Duplicate{
                .first = *slot,
                .diag =
                    Diagnostic{
                        .kind = ErrorKind::DuplicateDeclaration,
                        .span = item->span,
                        .module = module_id,
                        .path = name,
                        .message = prior == *kind
                                       ? "duplicate " + what + in
                                       : what + " clashes with " +
                                             std::string(decl_kind_name(prior)) +
                                             " `" + name + "`" + in,
                    },
            });
            continue;
        }
        slot = out.decls.size();
        out.decls.push_back(PendingDecl{
            .name = std::move(name),
            .kind = *kind,
            .item = item,
            .span = item->span,
        });
    }
    return out;
}

}  // namespace

void collect_declarations(Session& session, ResolvedCrate& crate) {
    std::vector<ModuleCollection> results(crate.modules.size());

    unsigned jobs = session.effective_jobs();
    if (jobs <= 1 || crate.modules.size() < 2) {
        for (ModuleId id = 0; id < crate.modules.size(); id++)
            results[id] = collect_module(crate, id);
    } else {
        const ResolvedCrate& frozen = crate;
        llvm::ThreadPool pool(llvm::hardware_concurrency(jobs));
        for (ModuleId id = 0; id < frozen.modules.size(); id++) {
            pool.async([&frozen, &results, id] {
                results[id] = collect_module(frozen, id);
            });
        }
        pool.wait();
    }

    // Ids and diagnostics are assigned in module order so the parallel run
    // is indistinguishable from the serial one.
    for (ModuleId id = 0; id < crate.modules.size(); id++) {
        ModuleCollection& r = results[id];
        Module& m = crate.modules[id];
        DeclId base = static_cast<DeclId>(crate.decls.size());

        for (PendingDecl& p : r.decls) {
            DeclId did = static_cast<DeclId>(crate.decls.size());
            m.decls[p.name].push_back(did);
            crate.decls.push_back(Decl{
                .id = did,
                .module = id,
                .name = std::move(p.name),
                .kind = p.kind,
                .item = p.item,
                .span = p.span,
            });
        }
        m.uses = std::move(r.uses);
        m.impls = std::move(r.impls);

        for (Duplicate& dup : r.duplicates) {
            const Decl& first = crate.decls[base + dup.first];
            dup.diag.candidates.push_back(Candidate{
                .decl = first.id,
                .path = crate.module_path(id) + "::" + first.name,
                .span = first.span,
            });
            session.report(std::move(dup.diag));
        }

        LLVM_DEBUG(llvm::dbgs() << "collected " << r.decls.size()
                                << " declarations, " << m.uses.size()
                                << " uses in " << crate.module_path(id)
                                << "\n");
    }
}

}  // namespace modpath
