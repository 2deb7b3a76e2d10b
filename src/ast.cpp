#include "ast.hpp"

#include <llvm/Support/raw_ostream.h>

namespace modpath {

std::string_view ast_kind_name(AstNodeKind kind) {
  switch (kind) {
    case AstNodeKind::Ident:
      return "Ident";
    case AstNodeKind::Path:
      return "Path";
    case AstNodeKind::TypePath:
      return "TypePath";
    case AstNodeKind::TypeTuple:
      return "TypeTuple";
    case AstNodeKind::TypeArray:
      return "TypeArray";
    case AstNodeKind::TypeUnit:
      return "TypeUnit";
    case AstNodeKind::UseTree:
      return "UseTree";
    case AstNodeKind::ItemUse:
      return "ItemUse";
    case AstNodeKind::ItemModInline:
      return "ItemModInline";
    case AstNodeKind::ItemModDecl:
      return "ItemModDecl";
    case AstNodeKind::ItemStruct:
      return "ItemStruct";
    case AstNodeKind::ItemEnum:
      return "ItemEnum";
    case AstNodeKind::ItemTrait:
      return "ItemTrait";
    case AstNodeKind::ItemImpl:
      return "ItemImpl";
    case AstNodeKind::ItemFn:
      return "ItemFn";
    case AstNodeKind::ItemConst:
      return "ItemConst";
    case AstNodeKind::ItemTypeAlias:
      return "ItemTypeAlias";
    case AstNodeKind::FieldDecl:
      return "FieldDecl";
    case AstNodeKind::VariantDecl:
      return "VariantDecl";
    case AstNodeKind::Param:
      return "Param";
    case AstNodeKind::FnSig:
      return "FnSig";
    case AstNodeKind::FnDecl:
      return "FnDecl";
  }
  return "Unknown";
}

std::string path_text(const Path* path) {
  if (!path) return {};
  std::string out{};
  switch (path->root) {
    case PathRoot::Plain:
      break;
    case PathRoot::Crate:
      out += "crate::";
      break;
    case PathRoot::Self:
      out += "self::";
      break;
    case PathRoot::Super:
      for (std::uint32_t i = 0; i < path->super_count; i++) out += "super::";
      break;
  }
  for (size_t i = 0; i < path->segments.size(); i++) {
    if (i != 0) out += "::";
    out += path->segments[i] ? path->segments[i]->text : "<null>";
  }
  return out;
}

static void indent_to(llvm::raw_ostream& os, int indent) {
  for (int i = 0; i < indent; i++) os << "  ";
}

static void dump_children(llvm::raw_ostream& os, const std::vector<const AstNode*>& children, int indent) {
  for (const AstNode* child : children) dump_ast(os, child, indent);
}

void dump_ast(llvm::raw_ostream& os, const AstNode* node, int indent) {
  indent_to(os, indent);
  if (!node) {
    os << "<null>\n";
    return;
  }

  os << ast_kind_name(node->kind);
  std::vector<const AstNode*> children{};
  switch (node->kind) {
    case AstNodeKind::Ident:
      os << " \"" << static_cast<const Ident*>(node)->text << '"';
      break;
    case AstNodeKind::Path:
      os << " `" << path_text(static_cast<const Path*>(node)) << '`';
      break;
    case AstNodeKind::TypePath:
      os << " `" << path_text(static_cast<const TypePath*>(node)->path) << '`';
      break;
    case AstNodeKind::TypeTuple:
      for (const Type* t : static_cast<const TypeTuple*>(node)->elems) children.push_back(t);
      break;
    case AstNodeKind::TypeArray: {
      const auto* arr = static_cast<const TypeArray*>(node);
      os << " len=" << arr->len;
      children.push_back(arr->elem);
      break;
    }
    case AstNodeKind::TypeUnit:
      break;
    case AstNodeKind::UseTree: {
      const auto* tree = static_cast<const UseTree*>(node);
      os << " `" << path_text(tree->path) << '`';
      if (!tree->alias.empty()) os << " as " << tree->alias;
      for (const UseTree* child : tree->group) children.push_back(child);
      break;
    }
    case AstNodeKind::ItemUse: {
      const auto* use = static_cast<const ItemUse*>(node);
      if (use->vis == Visibility::Pub) os << " pub";
      children.push_back(use->tree);
      break;
    }
    case AstNodeKind::ItemModInline: {
      const auto* mod = static_cast<const ItemModInline*>(node);
      os << " " << mod->name;
      for (const Item* item : mod->items) children.push_back(item);
      break;
    }
    case AstNodeKind::ItemModDecl: {
      const auto* mod = static_cast<const ItemModDecl*>(node);
      os << " " << mod->name << " -> unit " << mod->unit;
      break;
    }
    case AstNodeKind::ItemStruct: {
      const auto* s = static_cast<const ItemStruct*>(node);
      os << " " << s->name;
      for (const FieldDecl* f : s->fields) children.push_back(f);
      break;
    }
    case AstNodeKind::ItemEnum: {
      const auto* e = static_cast<const ItemEnum*>(node);
      os << " " << e->name;
      for (const VariantDecl* v : e->variants) children.push_back(v);
      break;
    }
    case AstNodeKind::ItemTrait: {
      const auto* t = static_cast<const ItemTrait*>(node);
      os << " " << t->name;
      for (const FnDecl* m : t->methods) children.push_back(m);
      break;
    }
    case AstNodeKind::ItemImpl: {
      const auto* impl = static_cast<const ItemImpl*>(node);
      if (impl->trait_path) children.push_back(impl->trait_path);
      children.push_back(impl->self_type);
      for (const ItemFn* m : impl->methods) children.push_back(m);
      break;
    }
    case AstNodeKind::ItemFn:
      children.push_back(static_cast<const ItemFn*>(node)->decl);
      break;
    case AstNodeKind::ItemConst: {
      const auto* c = static_cast<const ItemConst*>(node);
      os << " " << c->name;
      children.push_back(c->type);
      break;
    }
    case AstNodeKind::ItemTypeAlias: {
      const auto* a = static_cast<const ItemTypeAlias*>(node);
      os << " " << a->name;
      children.push_back(a->aliased);
      break;
    }
    case AstNodeKind::FieldDecl: {
      const auto* f = static_cast<const FieldDecl*>(node);
      os << " " << f->name;
      children.push_back(f->type);
      break;
    }
    case AstNodeKind::VariantDecl: {
      const auto* v = static_cast<const VariantDecl*>(node);
      os << " " << v->name;
      for (const Type* t : v->payload) children.push_back(t);
      break;
    }
    case AstNodeKind::Param: {
      const auto* p = static_cast<const Param*>(node);
      os << " " << p->name;
      children.push_back(p->type);
      break;
    }
    case AstNodeKind::FnSig: {
      const auto* sig = static_cast<const FnSig*>(node);
      for (const Param* p : sig->params) children.push_back(p);
      if (sig->ret) children.push_back(sig->ret);
      break;
    }
    case AstNodeKind::FnDecl: {
      const auto* decl = static_cast<const FnDecl*>(node);
      os << " " << decl->name;
      children.push_back(decl->sig);
      break;
    }
  }
  os << '\n';
  dump_children(os, children, indent + 1);
}

}  // namespace modpath
