#include "passes.hpp"

#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lookup.hpp"
#include "path.hpp"

#define DEBUG_TYPE "modpath-imports"

namespace modpath {
namespace {

enum class EntryState : std::uint8_t { Pending, Resolved, Failed };

// One leaf of a use tree: `use a::{b::C as D}` yields path `a::b::C`, bound
// as `D`.
struct ImportEntry {
    ModuleId module = 0;
    const ItemUse* origin = nullptr;
    QualifiedPath path{};
    std::string bind_name{};
    bool is_pub = false;
    Span span{};

    EntryState state = EntryState::Pending;
    DeclSet targets{};
};

bool same_set(llvm::ArrayRef<DeclId> a, llvm::ArrayRef<DeclId> b) {
    if (a.size() != b.size()) return false;
    DeclSet x(a.begin(), a.end());
    DeclSet y(b.begin(), b.end());
    std::sort(x.begin(), x.end());
    std::sort(y.begin(), y.end());
    return x == y;
}

// Imports are resolved as a fixed point over the whole crate. A `use` whose
// target name in some module is still subject to an unfinished import waits
// for it; every round resolves against committed bindings only, so the
// outcome does not depend on the order entries are visited in.
class ImportResolver {
   public:
    ImportResolver(Session& session, ResolvedCrate& crate)
        : session_(session), crate_(crate) {}

    void run() {
        open_all_.resize(crate_.modules.size());
        open_pub_.resize(crate_.modules.size());
        committed_.resize(crate_.modules.size());

        gather();
        LLVM_DEBUG(llvm::dbgs() << "resolving " << entries_.size()
                                << " import entries\n");

        unsigned round = 0;
        bool progress = true;
        while (progress) {
            progress = false;
            round++;
            std::vector<std::size_t> finished{};
            for (std::size_t i = 0; i < entries_.size(); i++) {
                if (entries_[i].state != EntryState::Pending) continue;
                if (attempt(entries_[i])) finished.push_back(i);
            }
            // State changes are published after the round so that every
            // attempt in a round sees the same committed bindings.
            for (std::size_t i : finished) finish(entries_[i]);
            progress = !finished.empty();
            commit_ready();
            LLVM_DEBUG(llvm::dbgs() << "import round " << round << ": "
                                    << finished.size() << " settled\n");
        }

        for (ImportEntry& e : entries_) {
            if (e.state != EntryState::Pending) continue;
            report(e, ErrorKind::CyclicImport,
                   "import `" + e.path.str() + "` in module `" +
                       crate_.module_path(e.module) +
                       "` never resolves: it depends on an import cycle",
                   {});
        }
    }

   private:
    Session& session_;
    ResolvedCrate& crate_;
    std::vector<ImportEntry> entries_{};

    // Per module: name -> entries binding it that are not committed yet.
    std::vector<llvm::StringMap<unsigned>> open_all_{};
    std::vector<llvm::StringMap<unsigned>> open_pub_{};
    // Per module: names whose entries have all been applied.
    std::vector<llvm::StringSet<>> committed_{};
    // Result of an attempt, published by `finish`.
    std::vector<std::pair<EntryState, DeclSet>> staged_{};

    void report(const ImportEntry& e, ErrorKind kind, std::string message,
                llvm::ArrayRef<DeclId> candidates,
                Severity severity = Severity::Error) {
        session_.report(Diagnostic{
            .severity = severity,
            .kind = kind,
            .span = e.span,
            .module = e.module,
            .path = e.path.str(),
            .message = std::move(message),
            .candidates = describe_candidates(crate_, candidates),
        });
    }

    void report_path(ModuleId module, Span span, std::string path,
                     std::string message) {
        session_.report(Diagnostic{.kind = ErrorKind::UnresolvedImport,
                                   .span = span,
                                   .module = module,
                                   .path = std::move(path),
                                   .message = std::move(message)});
    }

    void flatten(ModuleId module, const ItemUse* use, const UseTree* tree,
                 const QualifiedPath* prefix) {
        if (!tree) return;
        QualifiedPath here = path_from_ast(tree->path);
        if (prefix) {
            std::optional<QualifiedPath> joined = join_paths(*prefix, here);
            if (!joined) {
                report_path(module, tree->span, here.str(),
                            "`" + here.str() +
                                "`: `crate`, `self` and `super` may only "
                                "start a use path");
                return;
            }
            here = std::move(*joined);
        }

        if (!tree->group.empty()) {
            for (const UseTree* child : tree->group)
                flatten(module, use, child, &here);
            return;
        }

        if (here.empty()) {
            report_path(module, tree->span, here.str(),
                        "empty use path in module `" +
                            crate_.module_path(module) + "`");
            return;
        }

        ImportEntry e{};
        e.module = module;
        e.origin = use;
        e.bind_name = tree->alias.empty() ? here.last().name : tree->alias;
        e.path = std::move(here);
        e.is_pub = use->vis == Visibility::Pub;
        e.span = tree->span;

        open_all_[module][e.bind_name]++;
        if (e.is_pub) open_pub_[module][e.bind_name]++;
        entries_.push_back(std::move(e));
    }

    void gather() {
        for (ModuleId mid = 0; mid < crate_.modules.size(); mid++) {
            for (const ItemUse* u : crate_.modules[mid].uses) {
                if (!u || !u->tree) continue;
                flatten(mid, u, u->tree, nullptr);
            }
        }
        staged_.resize(entries_.size());
    }

    // Names `target` exposes under `name` to the module of `asking`, per
    // namespace: local declarations win, otherwise visible imports. Nullopt
    // means an import that could still contribute has not been committed.
    std::optional<DeclSet> visible(ModuleId target, const ImportEntry& asking,
                                   const std::string& name) const {
        bool outside = target != asking.module;
        llvm::ArrayRef<DeclId> locals = crate_.local_decls(target, name);
        const ImportBinding* binding = crate_.import_binding(target, name);
        unsigned open = outside ? open_pub_[target].lookup(name)
                                : open_all_[target].lookup(name);
        // `use self::X;` does not wait for itself.
        if (!outside && asking.bind_name == name && open != 0) open--;

        DeclSet out{};
        for (Namespace ns : {Namespace::Type, Namespace::Value}) {
            bool have_local = false;
            for (DeclId id : locals) {
                if (!in_namespace(crate_.decl(id).kind, ns)) continue;
                out.push_back(id);
                have_local = true;
            }
            if (have_local) continue;
            if (open != 0) return std::nullopt;
            if (!binding || (outside && !binding->is_pub)) continue;
            for (DeclId id : binding->decls) {
                if (in_namespace(crate_.decl(id).kind, ns)) out.push_back(id);
            }
        }
        return out;
    }

    // Returns true when the entry settled (resolved or failed) this round.
    bool attempt(ImportEntry& e) {
        std::size_t index = static_cast<std::size_t>(&e - entries_.data());
        auto walked = walk_module_prefix(crate_, e.module, e.path);
        if (auto* err = std::get_if<ResolveError>(&walked)) {
            report(e, ErrorKind::UnresolvedImport,
                   "unresolved import `" + e.path.str() + "`: " + err->message,
                   {});
            staged_[index] = {EntryState::Failed, {}};
            return true;
        }

        ModuleId target = std::get<ModuleId>(walked);
        const std::string& name = e.path.last().name;
        std::optional<DeclSet> found = visible(target, e, name);
        if (!found) return false;

        if (found->empty()) {
            std::string why = crate_.child(target, name)
                                  ? "`" + name + "` is a module, not an item"
                                  : "no item `" + name + "` in module `" +
                                        crate_.module_path(target) + "`";
            report(e, ErrorKind::UnresolvedImport,
                   "unresolved import `" + e.path.str() + "`: " + why, {});
            staged_[index] = {EntryState::Failed, {}};
            return true;
        }

        staged_[index] = {EntryState::Resolved, std::move(*found)};
        return true;
    }

    void finish(ImportEntry& e) {
        std::size_t index = static_cast<std::size_t>(&e - entries_.data());
        e.state = staged_[index].first;
        e.targets = std::move(staged_[index].second);
        LLVM_DEBUG(llvm::dbgs()
                   << "  " << crate_.module_path(e.module) << ": use "
                   << e.path.str() << " -> "
                   << (e.state == EntryState::Resolved ? "resolved" : "failed")
                   << "\n");
    }

    bool name_ready(ModuleId module, const std::string& name) const {
        for (const ImportEntry& e : entries_) {
            if (e.module == module && e.bind_name == name &&
                e.state == EntryState::Pending)
                return false;
        }
        return true;
    }

    // Commits names whose entries have all settled. Walking `entries_` in
    // order applies each module's uses in source order.
    void commit_ready() {
        for (const ImportEntry& e : entries_) {
            if (committed_[e.module].count(e.bind_name)) continue;
            if (!name_ready(e.module, e.bind_name)) continue;
            commit(e.module, e.bind_name);
        }
    }

    void commit(ModuleId module, const std::string& name) {
        committed_[module].insert(name);
        for (ImportEntry& e : entries_) {
            if (e.module != module || e.bind_name != name) continue;
            if (e.state == EntryState::Resolved) bind(e);
        }
        open_all_[module].erase(name);
        open_pub_[module].erase(name);
    }

    // Drops targets that collide with a local declaration of the same
    // namespace, reporting according to the shadowing policy.
    DeclSet without_local_collisions(const ImportEntry& e) {
        llvm::ArrayRef<DeclId> locals = crate_.local_decls(e.module, e.bind_name);
        if (locals.empty()) return e.targets;

        DeclSet kept{};
        DeclSet clashing{};
        for (DeclId t : e.targets) {
            Namespace ns = decl_namespace(crate_.decl(t).kind);
            bool clash = false;
            for (DeclId l : locals) {
                if (decl_namespace(crate_.decl(l).kind) != ns) continue;
                clash = true;
                if (std::find(clashing.begin(), clashing.end(), l) == clashing.end())
                    clashing.push_back(l);
            }
            if (clash) {
                if (std::find(clashing.begin(), clashing.end(), t) == clashing.end())
                    clashing.push_back(t);
            } else {
                kept.push_back(t);
            }
        }
        if (clashing.empty()) return kept;

        std::string where = "` in module `" + crate_.module_path(e.module) + "`";
        if (session_.options.import_shadowing == ImportShadowing::Reject) {
            report(e, ErrorKind::DuplicateImport,
                   "import `" + e.path.str() + "` collides with local `" +
                       e.bind_name + where,
                   clashing);
        } else {
            report(e, ErrorKind::ImportShadowed,
                   "import `" + e.path.str() + "` is shadowed by local `" +
                       e.bind_name + where,
                   clashing, Severity::Warning);
        }
        return kept;
    }

    void bind(ImportEntry& e) {
        DeclSet targets = without_local_collisions(e);
        if (targets.empty()) return;

        Module& m = crate_.modules[e.module];
        auto it = m.imports.find(e.bind_name);
        if (it == m.imports.end()) {
            m.imports.try_emplace(e.bind_name,
                                  ImportBinding{
                                      .name = e.bind_name,
                                      .decls = std::move(targets),
                                      .origin = e.origin,
                                      .span = e.span,
                                      .is_pub = e.is_pub,
                                  });
            return;
        }

        ImportBinding& existing = it->second;
        if (same_set(existing.decls, targets)) {
            existing.is_pub = existing.is_pub || e.is_pub;
            return;
        }

        DeclSet both = existing.decls;
        for (DeclId id : targets) {
            if (std::find(both.begin(), both.end(), id) == both.end())
                both.push_back(id);
        }
        report(e, ErrorKind::DuplicateImport,
               "`" + e.bind_name + "` is imported more than once in module `" +
                   crate_.module_path(e.module) +
                   "` with different targets",
               both);
    }
};

}  // namespace

void resolve_imports(Session& session, ResolvedCrate& crate) {
    ImportResolver(session, crate).run();
}

}  // namespace modpath
