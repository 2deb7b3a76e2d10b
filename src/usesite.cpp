#include "usesite.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>
#include <llvm/Support/raw_ostream.h>

#include <utility>

#include "path.hpp"

#define DEBUG_TYPE "modpath-usesite"

namespace modpath {
namespace {

class SiteCollector {
   public:
    SiteCollector(ModuleId module, std::vector<UseSite>& out)
        : module_(module), out_(out) {}

    void item(const Item* item) {
        switch (item->kind) {
            case AstNodeKind::ItemStruct:
                for (const FieldDecl* f : static_cast<const ItemStruct*>(item)->fields) {
                    if (f) type(f->type);
                }
                break;
            case AstNodeKind::ItemEnum:
                for (const VariantDecl* v : static_cast<const ItemEnum*>(item)->variants) {
                    if (!v) continue;
                    for (const Type* t : v->payload) type(t);
                }
                break;
            case AstNodeKind::ItemTrait:
                for (const FnDecl* fn : static_cast<const ItemTrait*>(item)->methods)
                    fn_decl(fn);
                break;
            case AstNodeKind::ItemFn:
                fn_decl(static_cast<const ItemFn*>(item)->decl);
                break;
            case AstNodeKind::ItemTypeAlias:
                type(static_cast<const ItemTypeAlias*>(item)->aliased);
                break;
            case AstNodeKind::ItemConst:
                type(static_cast<const ItemConst*>(item)->type);
                break;
            case AstNodeKind::ItemImpl: {
                const auto* impl = static_cast<const ItemImpl*>(item);
                path(impl->trait_path);
                type(impl->self_type);
                for (const ItemFn* m : impl->methods) {
                    if (m) fn_decl(m->decl);
                }
                break;
            }
            default:
                break;
        }
    }

   private:
    ModuleId module_;
    std::vector<UseSite>& out_;

    void path(const Path* p) {
        if (!p) return;
        out_.push_back(UseSite{
            .module = module_,
            .path = path_from_ast(p),
            .ns = Namespace::Type,
            .span = p->span,
            .node = p,
        });
    }

    void type(const Type* t) {
        if (!t) return;
        switch (t->kind) {
            case AstNodeKind::TypePath:
                path(static_cast<const TypePath*>(t)->path);
                break;
            case AstNodeKind::TypeTuple:
                for (const Type* e : static_cast<const TypeTuple*>(t)->elems)
                    type(e);
                break;
            case AstNodeKind::TypeArray:
                type(static_cast<const TypeArray*>(t)->elem);
                break;
            default:
                break;
        }
    }

    void fn_decl(const FnDecl* fn) {
        if (!fn || !fn->sig) return;
        for (const Param* p : fn->sig->params) {
            if (p) type(p->type);
        }
        type(fn->sig->ret);
    }
};

std::vector<ResolvedReference> resolve_module(const ResolvedCrate& crate,
                                              const ResolveOptions& options,
                                              ModuleId module) {
    std::vector<ResolvedReference> out{};
    for (UseSite& site : collect_use_sites(crate, module))
        out.push_back(resolve(crate, std::move(site), options));
    return out;
}

}  // namespace

std::vector<UseSite> collect_use_sites(const ResolvedCrate& crate, ModuleId module) {
    std::vector<UseSite> out{};
    SiteCollector collector(module, out);
    for (const Item* item : crate.module(module).items) {
        if (item) collector.item(item);
    }
    return out;
}

const ResolvedReference* ResolutionMap::find(ModuleId module, const Path* node) const {
    auto it = by_node.find({module, node});
    if (it == by_node.end()) return nullptr;
    return &refs[it->second];
}

std::size_t ResolutionMap::failures() const {
    std::size_t n = 0;
    for (const ResolvedReference& r : refs) {
        if (!r.ok()) n++;
    }
    return n;
}

ResolutionMap resolve_use_sites(Session& session, const ResolvedCrate& crate) {
    std::vector<std::vector<ResolvedReference>> per_module(crate.modules.size());
    const ResolveOptions& options = session.options;

    unsigned jobs = session.effective_jobs();
    if (jobs <= 1 || crate.modules.size() < 2) {
        for (ModuleId id = 0; id < crate.modules.size(); id++)
            per_module[id] = resolve_module(crate, options, id);
    } else {
        llvm::ThreadPool pool(llvm::hardware_concurrency(jobs));
        for (ModuleId id = 0; id < crate.modules.size(); id++) {
            pool.async([&crate, &options, &per_module, id] {
                per_module[id] = resolve_module(crate, options, id);
            });
        }
        pool.wait();
    }

    ResolutionMap map{};
    for (std::vector<ResolvedReference>& refs : per_module) {
        for (ResolvedReference& ref : refs) {
            if (!ref.ok()) session.report(to_diagnostic(crate, ref));
            if (ref.site.node)
                map.by_node[{ref.site.module, ref.site.node}] = map.refs.size();
            map.refs.push_back(std::move(ref));
        }
    }

    LLVM_DEBUG(llvm::dbgs() << "resolved " << map.size() << " use sites, "
                            << map.failures() << " failed\n");
    return map;
}

void dump_resolutions(llvm::raw_ostream& os, const ResolvedCrate& crate,
                      const ResolutionMap& map) {
    for (const ResolvedReference& ref : map.refs) {
        os << crate.module_path(ref.site.module) << ": " << ref.site.path.str()
           << " -> ";
        if (const DeclId* d = ref.decl()) {
            os << canonical_path(crate, *d);
        } else if (const Primitive* p = ref.primitive()) {
            os << "primitive " << primitive_name(*p);
        } else if (const ResolveError* err = ref.error()) {
            os << "error[" << error_kind_name(err->kind) << "]";
        }
        os << "\n";
    }
}

}  // namespace modpath
