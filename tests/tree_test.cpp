// Module tree tests
//
// Tests for mounting inline and file modules, sibling name clashes and
// `mod` cycles.

#include "crate_builder.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

using namespace modpath;
using namespace modpath::test;

class TreeTest : public ::testing::Test {
protected:
    CrateBuilder b;
};

// ============================================================================
// Shape
// ============================================================================

TEST_F(TreeTest, RootOnly) {
    b.file("main.sw").structure("S");
    ResolvedCrate crate = b.build();

    ASSERT_EQ(crate.modules.size(), 1u);
    EXPECT_EQ(crate.module_path(crate.root), "crate");
    EXPECT_EQ(crate.module(crate.root).parent, kNoModule);
    EXPECT_EQ(crate.depth(crate.root), 0u);
    EXPECT_TRUE(b.session.diags.empty());
}

TEST_F(TreeTest, NestedInlineModules) {
    auto root = b.file("main.sw");
    auto a = root.mod("a");
    a.mod("b").structure("S");
    a.mod("c");
    ResolvedCrate crate = b.build();

    ASSERT_EQ(crate.modules.size(), 4u);
    auto ab = crate.find_module("crate::a::b");
    auto ac = crate.find_module("crate::a::c");
    ASSERT_TRUE(ab.has_value());
    ASSERT_TRUE(ac.has_value());
    EXPECT_EQ(crate.depth(*ab), 2u);
    EXPECT_EQ(crate.module_path(*ab), "crate::a::b");
    EXPECT_EQ(crate.module(*ab).parent, crate.find_module("crate::a"));
    EXPECT_EQ(crate.child(crate.root, "a"), crate.find_module("crate::a"));
    EXPECT_FALSE(crate.child(crate.root, "b").has_value());
}

TEST_F(TreeTest, FileModulesTakeTheirUnitsFile) {
    auto root = b.file("src/main.sw");
    auto lib = b.file("src/lib.sw");
    root.mod_decl("lib", lib.unit());
    lib.structure("S");
    ResolvedCrate crate = b.build();

    auto m = crate.find_module("crate::lib");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(b.session.sources.path(crate.module(*m).file), "src/lib.sw");
    EXPECT_EQ(crate.module(*m).unit, lib.unit());
    EXPECT_EQ(crate.local_decls(*m, "S").size(), 1u);
}

TEST_F(TreeTest, InlineModuleInsideFileModule) {
    auto root = b.file("main.sw");
    auto lib = b.file("lib.sw");
    root.mod_decl("lib", lib.unit());
    lib.mod("inner").structure("S");
    ResolvedCrate crate = b.build();

    auto m = crate.find_module("crate::lib::inner");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(b.session.sources.path(crate.module(*m).file), "lib.sw");
}

TEST_F(TreeTest, UnitMountedTwiceIsTwoModules) {
    auto root = b.file("main.sw");
    auto shared = b.file("shared.sw");
    root.mod_decl("a", shared.unit());
    root.mod_decl("b", shared.unit());
    shared.structure("S");
    ResolvedCrate crate = b.build();

    EXPECT_TRUE(b.session.diags.empty());
    DeclId in_a = decl_named(crate, "crate::a", "S", DeclKind::Struct);
    DeclId in_b = decl_named(crate, "crate::b", "S", DeclKind::Struct);
    EXPECT_NE(in_a, in_b);
}

TEST_F(TreeTest, FindModuleRejectsMalformedPaths) {
    b.file("main.sw").mod("a");
    ResolvedCrate crate = b.build();

    EXPECT_EQ(crate.find_module("crate"), crate.root);
    EXPECT_FALSE(crate.find_module("").has_value());
    EXPECT_FALSE(crate.find_module("a").has_value());
    EXPECT_FALSE(crate.find_module("crate::").has_value());
    EXPECT_FALSE(crate.find_module("crate::b").has_value());
    EXPECT_FALSE(crate.find_module("crates::a").has_value());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(TreeTest, DuplicateSiblingModules) {
    auto root = b.file("main.sw");
    root.mod("a").structure("First");
    root.mod("a").structure("Second");
    ResolvedCrate crate = b.build();

    EXPECT_EQ(b.session.count(ErrorKind::DuplicateModuleName), 1u);
    EXPECT_EQ(crate.modules.size(), 2u);
    auto a = crate.find_module("crate::a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(crate.local_decls(*a, "First").size(), 1u);
    EXPECT_TRUE(crate.local_decls(*a, "Second").empty());
}

TEST_F(TreeTest, DuplicateInlineAndFileModule) {
    auto root = b.file("main.sw");
    auto other = b.file("a.sw");
    root.mod("a");
    root.mod_decl("a", other.unit());
    b.build();

    ASSERT_EQ(b.session.count(ErrorKind::DuplicateModuleName), 1u);
    EXPECT_EQ(b.session.diags[0].path, "a");
}

TEST_F(TreeTest, SameNameUnderDifferentParentsIsFine) {
    auto root = b.file("main.sw");
    root.mod("x").mod("util");
    root.mod("y").mod("util");
    ResolvedCrate crate = b.build();

    EXPECT_TRUE(b.session.diags.empty());
    EXPECT_NE(crate.find_module("crate::x::util"), crate.find_module("crate::y::util"));
}

TEST_F(TreeTest, ModCycleThroughRoot) {
    auto root = b.file("main.sw");
    auto a = b.file("a.sw");
    root.mod_decl("a", a.unit());
    a.mod_decl("back", root.unit());
    ResolvedCrate crate = b.build();

    ASSERT_EQ(b.session.count(ErrorKind::CyclicModuleGraph), 1u);
    EXPECT_NE(b.session.diags[0].message.find("main.sw -> a.sw -> main.sw"),
              std::string::npos);
    EXPECT_EQ(crate.modules.size(), 2u);
}

TEST_F(TreeTest, SelfReferentialModDecl) {
    auto root = b.file("main.sw");
    auto a = b.file("a.sw");
    root.mod_decl("a", a.unit());
    a.mod_decl("again", a.unit());
    b.build();

    EXPECT_EQ(b.session.count(ErrorKind::CyclicModuleGraph), 1u);
}

TEST_F(TreeTest, MissingUnit) {
    b.file("main.sw").mod_decl("ghost", 42);
    ResolvedCrate crate = b.build();

    EXPECT_EQ(b.session.count(ErrorKind::UnknownModule), 1u);
    EXPECT_EQ(crate.modules.size(), 1u);
}

TEST_F(TreeTest, MissingRootUnit) {
    Session session;
    CrateInput input{};
    ResolvedCrate crate = resolve_crate(session, input);

    EXPECT_TRUE(crate.empty());
    EXPECT_EQ(session.count(ErrorKind::UnknownModule), 1u);
}

TEST_F(TreeTest, DumpListsModulesAndDecls) {
    auto root = b.file("main.sw");
    root.mod("a").structure("S");
    root.use("a::S");
    ResolvedCrate crate = b.build();

    std::string out;
    llvm::raw_string_ostream os(out);
    dump_crate(os, crate);
    os.flush();

    EXPECT_NE(out.find("mod crate\n"), std::string::npos);
    EXPECT_NE(out.find("mod crate::a\n"), std::string::npos);
    EXPECT_NE(out.find("struct S #0"), std::string::npos);
    EXPECT_NE(out.find("use S -> crate::a::S #0"), std::string::npos);
}

TEST_F(TreeTest, TraceDoesNotOutliveTheRun) {
    llvm::DebugFlag = false;
    b.session.options.trace = true;
    b.file("main.sw").mod("a").structure("S");
    ResolvedCrate crate = b.build();

    EXPECT_EQ(crate.modules.size(), 2u);
    EXPECT_FALSE(llvm::DebugFlag);
}
