#include "resolve.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "passes.hpp"

#define DEBUG_TYPE "modpath-resolve"

namespace modpath {

std::string_view decl_kind_name(DeclKind kind) {
    switch (kind) {
        case DeclKind::Struct:
            return "struct";
        case DeclKind::Enum:
            return "enum";
        case DeclKind::Trait:
            return "trait";
        case DeclKind::TypeAlias:
            return "type alias";
        case DeclKind::Fn:
            return "fn";
        case DeclKind::Const:
            return "const";
    }
    return "item";
}

Namespace decl_namespace(DeclKind kind) {
    switch (kind) {
        case DeclKind::Fn:
        case DeclKind::Const:
            return Namespace::Value;
        default:
            return Namespace::Type;
    }
}

bool in_namespace(DeclKind kind, Namespace ns) {
    return ns == Namespace::Any || decl_namespace(kind) == ns;
}

std::string ResolvedCrate::module_path(ModuleId id) const {
    if (id >= modules.size()) return "<unknown>";
    std::vector<std::string_view> parts{};
    for (ModuleId cur = id; cur != kNoModule; cur = modules[cur].parent)
        parts.push_back(modules[cur].name);

    std::string out{};
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!out.empty()) out += "::";
        out += *it;
    }
    return out;
}

std::uint32_t ResolvedCrate::depth(ModuleId id) const {
    std::uint32_t d = 0;
    for (ModuleId cur = module(id).parent; cur != kNoModule;
         cur = modules[cur].parent)
        d++;
    return d;
}

std::optional<ModuleId> ResolvedCrate::child(ModuleId parent,
                                             std::string_view name) const {
    if (parent >= modules.size()) return std::nullopt;
    const auto& subs = modules[parent].submodules;
    auto it = subs.find(name);
    if (it == subs.end()) return std::nullopt;
    return it->second;
}

std::optional<ModuleId> ResolvedCrate::find_module(std::string_view path) const {
    if (modules.empty()) return std::nullopt;
    if (path.substr(0, 5) != "crate") return std::nullopt;
    path.remove_prefix(5);

    ModuleId cur = root;
    while (!path.empty()) {
        if (path.substr(0, 2) != "::") return std::nullopt;
        path.remove_prefix(2);
        std::string_view seg = path.substr(0, path.find("::"));
        std::optional<ModuleId> next = child(cur, seg);
        if (!next) return std::nullopt;
        cur = *next;
        path.remove_prefix(seg.size());
    }
    return cur;
}

llvm::ArrayRef<DeclId> ResolvedCrate::local_decls(ModuleId id,
                                                  std::string_view name) const {
    if (id >= modules.size()) return {};
    const auto& decls_by_name = modules[id].decls;
    auto it = decls_by_name.find(name);
    if (it == decls_by_name.end()) return {};
    return it->second;
}

const ImportBinding* ResolvedCrate::import_binding(ModuleId id,
                                                   std::string_view name) const {
    if (id >= modules.size()) return nullptr;
    const auto& imports = modules[id].imports;
    auto it = imports.find(name);
    if (it == imports.end()) return nullptr;
    return &it->second;
}

namespace {

// Turns on `LLVM_DEBUG` output for one run and puts the process-wide flag
// back afterwards.
class TraceScope {
   public:
    explicit TraceScope(bool enable) : saved_(llvm::DebugFlag) {
        if (enable) llvm::DebugFlag = true;
    }
    ~TraceScope() { llvm::DebugFlag = saved_; }

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

   private:
    bool saved_;
};

}  // namespace

ResolvedCrate resolve_crate(Session& session, const CrateInput& input) {
    TraceScope trace(session.options.trace);

    ResolvedCrate crate{};
    if (!build_module_tree(session, input, crate)) return crate;
    collect_declarations(session, crate);
    resolve_imports(session, crate);

    LLVM_DEBUG(llvm::dbgs() << "resolved crate: " << crate.modules.size()
                            << " modules, " << crate.decls.size()
                            << " declarations, " << session.diags.size()
                            << " diagnostics\n");
    return crate;
}

template <typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys{};
    keys.reserve(map.size());
    for (const auto& entry : map) keys.push_back(entry.getKey().str());
    std::sort(keys.begin(), keys.end());
    return keys;
}

void dump_crate(llvm::raw_ostream& os, const ResolvedCrate& crate) {
    for (const Module& m : crate.modules) {
        os << "mod " << crate.module_path(m.id) << "\n";
        for (const std::string& name : sorted_keys(m.decls)) {
            for (DeclId id : m.decls.find(name)->second) {
                const Decl& d = crate.decl(id);
                os << "  " << decl_kind_name(d.kind) << " " << d.name << " #"
                   << d.id << "\n";
            }
        }
        for (const std::string& name : sorted_keys(m.imports)) {
            const ImportBinding& b = m.imports.find(name)->second;
            os << "  " << (b.is_pub ? "pub use " : "use ") << name << " ->";
            for (DeclId id : b.decls) {
                const Decl& d = crate.decl(id);
                os << " " << crate.module_path(d.module) << "::" << d.name
                   << " #" << d.id;
            }
            os << "\n";
        }
    }
}

}  // namespace modpath
