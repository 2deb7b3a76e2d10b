#pragma once

#include "source.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace llvm {
class raw_ostream;
}

namespace modpath {

// Index of a parsed source file in `CrateInput::units`.
using UnitId = std::uint32_t;

enum class Visibility : std::uint8_t { Private, Pub };

// How the first segment of a path is anchored.
enum class PathRoot : std::uint8_t {
  Plain,  // `a::b::C`, `C`
  Crate,  // `crate::a::C`, `::a::C`
  Self,   // `self::C`
  Super,  // `super::C`, `super::super::C`
};

enum class AstNodeKind : std::uint16_t {
  Ident,
  Path,

  // Types
  TypePath,
  TypeTuple,
  TypeArray,
  TypeUnit,

  // Items
  UseTree,
  ItemUse,
  ItemModInline,
  ItemModDecl,
  ItemStruct,
  ItemEnum,
  ItemTrait,
  ItemImpl,
  ItemFn,
  ItemConst,
  ItemTypeAlias,

  // Decls
  FieldDecl,
  VariantDecl,
  Param,
  FnSig,
  FnDecl,
};

struct AstNode {
  AstNodeKind kind{};
  Span span{};

  AstNode(AstNodeKind kind, Span span) : kind(kind), span(span) {}
  virtual ~AstNode() = default;
};

class AstArena {
 public:
  template <typename T, typename... Args>
  T* make(Args&&... args) {
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    T* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
  }

 private:
  std::vector<std::unique_ptr<AstNode>> nodes_{};
};

struct Ident final : AstNode {
  std::string text{};
  explicit Ident(Span span, std::string text)
      : AstNode(AstNodeKind::Ident, span), text(std::move(text)) {}
};

struct Path final : AstNode {
  PathRoot root = PathRoot::Plain;
  std::uint32_t super_count = 0;  // number of leading `super::`
  std::vector<Ident*> segments{};
  explicit Path(Span span, std::vector<Ident*> segments, PathRoot root = PathRoot::Plain,
                std::uint32_t super_count = 0)
      : AstNode(AstNodeKind::Path, span), root(root), super_count(super_count), segments(std::move(segments)) {}
};

// ---- Types ----

struct Type : AstNode {
  explicit Type(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct TypePath final : Type {
  Path* path = nullptr;
  explicit TypePath(Span span, Path* path) : Type(AstNodeKind::TypePath, span), path(path) {}
};

struct TypeTuple final : Type {
  std::vector<Type*> elems{};
  explicit TypeTuple(Span span, std::vector<Type*> elems)
      : Type(AstNodeKind::TypeTuple, span), elems(std::move(elems)) {}
};

struct TypeArray final : Type {
  Type* elem = nullptr;
  std::uint64_t len = 0;
  explicit TypeArray(Span span, Type* elem, std::uint64_t len)
      : Type(AstNodeKind::TypeArray, span), elem(elem), len(len) {}
};

struct TypeUnit final : Type {
  explicit TypeUnit(Span span) : Type(AstNodeKind::TypeUnit, span) {}
};

// ---- Items and decls ----

struct Param final : AstNode {
  std::string name{};
  Type* type = nullptr;
  explicit Param(Span span, std::string name, Type* type)
      : AstNode(AstNodeKind::Param, span), name(std::move(name)), type(type) {}
};

struct FnSig final : AstNode {
  std::vector<Param*> params{};
  Type* ret = nullptr;  // optional; null means ()
  explicit FnSig(Span span, std::vector<Param*> params, Type* ret)
      : AstNode(AstNodeKind::FnSig, span), params(std::move(params)), ret(ret) {}
};

struct FnDecl final : AstNode {
  std::string name{};
  FnSig* sig = nullptr;
  explicit FnDecl(Span span, std::string name, FnSig* sig)
      : AstNode(AstNodeKind::FnDecl, span), name(std::move(name)), sig(sig) {}
};

struct FieldDecl final : AstNode {
  Visibility vis = Visibility::Private;
  std::string name{};
  Type* type = nullptr;
  explicit FieldDecl(Span span, Visibility vis, std::string name, Type* type)
      : AstNode(AstNodeKind::FieldDecl, span), vis(vis), name(std::move(name)), type(type) {}
};

struct VariantDecl final : AstNode {
  std::string name{};
  std::vector<Type*> payload{};
  explicit VariantDecl(Span span, std::string name, std::vector<Type*> payload)
      : AstNode(AstNodeKind::VariantDecl, span), name(std::move(name)), payload(std::move(payload)) {}
};

struct UseTree final : AstNode {
  Path* path = nullptr;  // for a group, the shared prefix; may have no segments
  std::string alias{};  // empty means none
  std::vector<UseTree*> group{};  // non-empty means `path::{...}`
  explicit UseTree(Span span, Path* path, std::string alias, std::vector<UseTree*> group)
      : AstNode(AstNodeKind::UseTree, span),
        path(path),
        alias(std::move(alias)),
        group(std::move(group)) {}
};

struct Item : AstNode {
  Visibility vis = Visibility::Private;
  explicit Item(AstNodeKind kind, Span span, Visibility vis) : AstNode(kind, span), vis(vis) {}
};

struct ItemUse final : Item {
  UseTree* tree = nullptr;
  explicit ItemUse(Span span, Visibility vis, UseTree* tree)
      : Item(AstNodeKind::ItemUse, span, vis), tree(tree) {}
};

struct ItemModInline final : Item {
  std::string name{};
  std::vector<Item*> items{};
  explicit ItemModInline(Span span, Visibility vis, std::string name, std::vector<Item*> items)
      : Item(AstNodeKind::ItemModInline, span, vis), name(std::move(name)), items(std::move(items)) {}
};

// `mod name;` - the driver has already located the file and parsed it as
// `unit`.
struct ItemModDecl final : Item {
  std::string name{};
  UnitId unit = 0;
  explicit ItemModDecl(Span span, Visibility vis, std::string name, UnitId unit)
      : Item(AstNodeKind::ItemModDecl, span, vis), name(std::move(name)), unit(unit) {}
};

struct ItemStruct final : Item {
  std::string name{};
  std::vector<FieldDecl*> fields{};
  explicit ItemStruct(Span span, Visibility vis, std::string name, std::vector<FieldDecl*> fields)
      : Item(AstNodeKind::ItemStruct, span, vis), name(std::move(name)), fields(std::move(fields)) {}
};

struct ItemEnum final : Item {
  std::string name{};
  std::vector<VariantDecl*> variants{};
  explicit ItemEnum(Span span, Visibility vis, std::string name, std::vector<VariantDecl*> variants)
      : Item(AstNodeKind::ItemEnum, span, vis), name(std::move(name)), variants(std::move(variants)) {}
};

// Interface-like item: `trait Name { fn f(...); }` (also contract `abi` blocks).
struct ItemTrait final : Item {
  std::string name{};
  std::vector<FnDecl*> methods{};
  explicit ItemTrait(Span span, Visibility vis, std::string name, std::vector<FnDecl*> methods)
      : Item(AstNodeKind::ItemTrait, span, vis), name(std::move(name)), methods(std::move(methods)) {}
};

struct ItemFn final : Item {
  FnDecl* decl = nullptr;
  explicit ItemFn(Span span, Visibility vis, FnDecl* decl)
      : Item(AstNodeKind::ItemFn, span, vis), decl(decl) {}
};

// `impl Trait for Type { ... }`, or `impl Type { ... }` when `trait_path` is null.
struct ItemImpl final : Item {
  Path* trait_path = nullptr;
  Type* self_type = nullptr;
  std::vector<ItemFn*> methods{};
  explicit ItemImpl(Span span, Path* trait_path, Type* self_type, std::vector<ItemFn*> methods)
      : Item(AstNodeKind::ItemImpl, span, Visibility::Private),
        trait_path(trait_path),
        self_type(self_type),
        methods(std::move(methods)) {}
};

struct ItemConst final : Item {
  std::string name{};
  Type* type = nullptr;
  explicit ItemConst(Span span, Visibility vis, std::string name, Type* type)
      : Item(AstNodeKind::ItemConst, span, vis), name(std::move(name)), type(type) {}
};

struct ItemTypeAlias final : Item {
  std::string name{};
  Type* aliased = nullptr;
  explicit ItemTypeAlias(Span span, Visibility vis, std::string name, Type* aliased)
      : Item(AstNodeKind::ItemTypeAlias, span, vis), name(std::move(name)), aliased(aliased) {}
};

std::string_view ast_kind_name(AstNodeKind kind);
std::string path_text(const Path* path);
void dump_ast(llvm::raw_ostream& os, const AstNode* node, int indent = 0);

}  // namespace modpath
