#include "passes.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <utility>
#include <vector>

#define DEBUG_TYPE "modpath-tree"

namespace modpath {
namespace {

class TreeBuilder {
   public:
    TreeBuilder(Session& session, const CrateInput& input, ResolvedCrate& crate)
        : session_(session), input_(input), crate_(crate) {}

    bool run() {
        if (input_.root >= input_.units.size()) {
            session_.report(Diagnostic{
                .kind = ErrorKind::UnknownModule,
                .path = "crate",
                .message = "crate root unit " + std::to_string(input_.root) +
                           " does not exist (" +
                           std::to_string(input_.units.size()) + " units)",
            });
            return false;
        }

        const SourceUnit& root = input_.units[input_.root];
        Span root_span{};
        root_span.file = root.file;
        crate_.root = add_module("crate", kNoModule, root.file, input_.root,
                                 root_span, root.items);
        unit_stack_.push_back(input_.root);
        load_submodules(crate_.root);
        unit_stack_.pop_back();

        LLVM_DEBUG(llvm::dbgs() << "built module tree: "
                                << crate_.modules.size() << " modules from "
                                << input_.units.size() << " units\n");
        return true;
    }

   private:
    Session& session_;
    const CrateInput& input_;
    ResolvedCrate& crate_;

    // Units currently being expanded, outermost first.
    std::vector<UnitId> unit_stack_{};

    void error(ErrorKind kind, Span span, ModuleId module, std::string path,
               std::string message) {
        session_.report(Diagnostic{.kind = kind,
                                   .span = span,
                                   .module = module,
                                   .path = std::move(path),
                                   .message = std::move(message)});
    }

    ModuleId add_module(std::string name, ModuleId parent, FileId file,
                        UnitId unit, Span span, const std::vector<Item*>& items) {
        ModuleId id = static_cast<ModuleId>(crate_.modules.size());
        Module m{};
        m.id = id;
        m.parent = parent;
        m.name = std::move(name);
        m.file = file;
        m.unit = unit;
        m.span = span;
        m.items.assign(items.begin(), items.end());
        crate_.modules.push_back(std::move(m));
        return id;
    }

    bool check_unique_child(ModuleId parent_id, const std::string& name,
                            Span span) {
        const Module& parent = crate_.modules[parent_id];
        if (!parent.submodules.count(name)) return true;
        error(ErrorKind::DuplicateModuleName, span, parent_id, name,
              "duplicate module `" + name + "` in module `" +
                  crate_.module_path(parent_id) + "`");
        return false;
    }

    std::string describe_unit_stack(UnitId closing) const {
        std::string out{};
        bool in_cycle = false;
        for (UnitId u : unit_stack_) {
            if (u == closing) in_cycle = true;
            if (!in_cycle) continue;
            out += session_.sources.path(input_.units[u].file);
            out += " -> ";
        }
        out += session_.sources.path(input_.units[closing].file);
        return out;
    }

    void mount(ModuleId parent_id, std::string name, FileId file, UnitId unit,
               Span span, const std::vector<Item*>& items) {
        ModuleId child_id =
            add_module(name, parent_id, file, unit, span, items);
        crate_.modules[parent_id].submodules.insert({name, child_id});
        LLVM_DEBUG(llvm::dbgs() << "mounted " << crate_.module_path(child_id)
                                << " as module " << child_id << "\n");
        load_submodules(child_id);
    }

    void load_submodules(ModuleId parent_id) {
        // Copied: `crate_.modules` grows while children are mounted.
        std::vector<const Item*> parent_items = crate_.modules[parent_id].items;

        for (const Item* item : parent_items) {
            if (!item) continue;
            switch (item->kind) {
                case AstNodeKind::ItemModInline: {
                    const auto* mod = static_cast<const ItemModInline*>(item);
                    if (!check_unique_child(parent_id, mod->name, mod->span))
                        break;
                    const Module& parent = crate_.modules[parent_id];
                    mount(parent_id, mod->name, parent.file, parent.unit,
                          mod->span, mod->items);
                    break;
                }
                case AstNodeKind::ItemModDecl: {
                    const auto* mod = static_cast<const ItemModDecl*>(item);
                    if (!check_unique_child(parent_id, mod->name, mod->span))
                        break;

                    if (mod->unit >= input_.units.size()) {
                        error(ErrorKind::UnknownModule, mod->span, parent_id,
                              mod->name,
                              "could not find source for `mod " + mod->name +
                                  ";` (unit " + std::to_string(mod->unit) +
                                  " does not exist)");
                        break;
                    }

                    bool on_stack = false;
                    for (UnitId u : unit_stack_) {
                        if (u == mod->unit) on_stack = true;
                    }
                    if (on_stack) {
                        error(ErrorKind::CyclicModuleGraph, mod->span,
                              parent_id, mod->name,
                              "`mod " + mod->name + ";` in module `" +
                                  crate_.module_path(parent_id) +
                                  "` forms a cycle: " +
                                  describe_unit_stack(mod->unit));
                        break;
                    }

                    const SourceUnit& unit = input_.units[mod->unit];
                    unit_stack_.push_back(mod->unit);
                    mount(parent_id, mod->name, unit.file, mod->unit,
                          mod->span, unit.items);
                    unit_stack_.pop_back();
                    break;
                }
                default:
                    break;
            }
        }
    }
};

}  // namespace

bool build_module_tree(Session& session, const CrateInput& input,
                       ResolvedCrate& crate) {
    return TreeBuilder(session, input, crate).run();
}

}  // namespace modpath
