// Use-site collection and bulk resolution tests

#include "crate_builder.hpp"
#include "usesite.hpp"

#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace modpath;
using namespace modpath::test;

namespace {

std::vector<std::string> site_texts(const std::vector<UseSite>& sites) {
    std::vector<std::string> out;
    for (const UseSite& s : sites) out.push_back(s.path.str());
    return out;
}

}  // namespace

// ============================================================================
// collect_use_sites
// ============================================================================

TEST(UseSiteTest, WalksEveryTypePosition) {
    CrateBuilder b;
    auto root = b.file("main.sw");
    root.structure("S", {{"x", "u64"}, {"y", "(A, [B; 4])"}});
    root.enumeration("E", {{"V", {"C"}}, {"W", {}}});
    root.alias("Alias", "D");
    root.constant("K", "F");
    root.fn("f", {"G", "()"}, "H");
    root.impl("I", "crate::J", {"L"});
    root.mod("nested").structure("N", {{"z", "Skipped"}});
    ResolvedCrate crate = b.build();

    std::vector<std::string> expected = {"u64", "A", "B", "C", "D", "F",
                                         "G", "H", "crate::J", "I", "L"};
    EXPECT_EQ(site_texts(collect_use_sites(crate, crate.root)), expected);

    auto nested = crate.find_module("crate::nested");
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(site_texts(collect_use_sites(crate, *nested)), std::vector<std::string>{"Skipped"});
}

TEST(UseSiteTest, TraitMethodSignatures) {
    CrateBuilder b;
    auto root = b.file("main.sw");
    root.trait("T", {"bare", {"typed", {"P", "(Q, u8)"}, "R"}});
    ResolvedCrate crate = b.build();

    EXPECT_EQ(site_texts(collect_use_sites(crate, crate.root)),
              (std::vector<std::string>{"P", "Q", "u8", "R"}));
}

TEST(UseSiteTest, SitesCarryTheirNodes) {
    CrateBuilder b;
    auto root = b.file("main.sw");
    ItemTypeAlias* alias = root.alias("A", "crate::S");
    root.structure("S");
    ResolvedCrate crate = b.build();

    auto sites = collect_use_sites(crate, crate.root);
    ASSERT_EQ(sites.size(), 1u);
    const auto* tp = static_cast<const TypePath*>(alias->aliased);
    EXPECT_EQ(sites[0].node, tp->path);
    EXPECT_EQ(sites[0].module, crate.root);
    EXPECT_EQ(sites[0].ns, Namespace::Type);
}

// ============================================================================
// resolve_use_sites
// ============================================================================

class ResolveSitesTest : public ::testing::Test {
protected:
    CrateBuilder b;
    ItemStruct* holder = nullptr;

    void populate() {
        auto root = b.file("main.sw");
        auto a = root.mod("a");
        a.structure("S");
        a.enumeration("E");
        auto c = root.mod("c");
        c.use("crate::a::S");
        holder = c.structure("Holder", {{"s", "S"}, {"e", "crate::a::E"}, {"n", "u64"}, {"bad", "Missing"}});
        c.fn("g", {"super::a::Nope"});
    }
};

TEST_F(ResolveSitesTest, ResolvesAndReports) {
    populate();
    ResolvedCrate crate = b.build();
    ASSERT_TRUE(b.session.diags.empty());

    ResolutionMap map = resolve_use_sites(b.session, crate);
    EXPECT_EQ(map.size(), 5u);
    EXPECT_EQ(map.failures(), 2u);
    EXPECT_EQ(b.session.count(ErrorKind::UnresolvedName), 1u);
    EXPECT_EQ(b.session.count(ErrorKind::UnknownDeclaration), 1u);

    const auto* field_type = static_cast<const TypePath*>(holder->fields[0]->type);
    const ResolvedReference* ref = map.find(*crate.find_module("crate::c"), field_type->path);
    ASSERT_NE(ref, nullptr);
    ASSERT_NE(ref->decl(), nullptr);
    EXPECT_EQ(*ref->decl(), decl_named(crate, "crate::a", "S", DeclKind::Struct));

    const Diagnostic& d = b.session.diags[0];
    EXPECT_EQ(d.path, "Missing");
    EXPECT_EQ(d.module, crate.find_module("crate::c"));
    EXPECT_EQ(d.span.begin.line, static_cast<const TypePath*>(holder->fields[3]->type)->path->span.begin.line);
}

TEST_F(ResolveSitesTest, UnknownNodeIsNotFound) {
    populate();
    ResolvedCrate crate = b.build();
    ResolutionMap map = resolve_use_sites(b.session, crate);

    Path* stray = b.path(0, "S");
    EXPECT_EQ(map.find(crate.root, stray), nullptr);
}

TEST_F(ResolveSitesTest, Dump) {
    populate();
    ResolvedCrate crate = b.build();
    ResolutionMap map = resolve_use_sites(b.session, crate);

    std::string out;
    llvm::raw_string_ostream os(out);
    dump_resolutions(os, crate, map);
    os.flush();

    EXPECT_NE(out.find("crate::c: S -> crate::a::S\n"), std::string::npos);
    EXPECT_NE(out.find("crate::c: u64 -> primitive u64\n"), std::string::npos);
    EXPECT_NE(out.find("crate::c: Missing -> error[UnresolvedName]\n"), std::string::npos);
}

TEST(ResolveSitesSharedUnitTest, EachMountKeepsItsOwnResolution) {
    CrateBuilder b;
    auto root = b.file("main.sw");
    auto shared = b.file("shared.sw");
    root.mod_decl("one", shared.unit());
    root.mod_decl("two", shared.unit());
    shared.structure("Local");
    ItemFn* f = shared.fn("f", {"Local"});
    ResolvedCrate crate = b.build();
    ResolutionMap map = resolve_use_sites(b.session, crate);

    ASSERT_TRUE(b.session.diags.empty());
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.by_node.size(), 2u);

    const Path* param = static_cast<const TypePath*>(f->decl->sig->params[0]->type)->path;
    for (std::string_view module : {"crate::one", "crate::two"}) {
        const ResolvedReference* ref = map.find(*crate.find_module(module), param);
        ASSERT_NE(ref, nullptr) << module;
        ASSERT_NE(ref->decl(), nullptr) << module;
        EXPECT_EQ(*ref->decl(), decl_named(crate, module, "Local", DeclKind::Struct));
    }
    EXPECT_EQ(map.find(crate.root, param), nullptr);
}

TEST(ResolveSitesParallelTest, MatchesSerialRun) {
    auto populate = [](CrateBuilder& b) {
        auto root = b.file("main.sw");
        root.mod("shared").structure("S");
        for (int i = 0; i < 16; i++) {
            auto m = root.mod("m" + std::to_string(i));
            m.use("crate::shared::S");
            m.structure("T", {{"a", "S"}, {"b", "crate::shared::S"}, {"c", "Nope"}, {"d", "bool"}});
        }
    };

    CrateBuilder serial;
    populate(serial);
    ResolvedCrate a = serial.build();
    ResolutionMap sm = resolve_use_sites(serial.session, a);

    CrateBuilder parallel;
    parallel.session.options.jobs = 4;
    populate(parallel);
    ResolvedCrate b = parallel.build();
    ResolutionMap pm = resolve_use_sites(parallel.session, b);

    ASSERT_EQ(sm.size(), pm.size());
    for (size_t i = 0; i < sm.size(); i++) {
        EXPECT_EQ(sm.refs[i].site.path.str(), pm.refs[i].site.path.str());
        EXPECT_EQ(sm.refs[i].site.module, pm.refs[i].site.module);
        EXPECT_EQ(sm.refs[i].ok(), pm.refs[i].ok());
        if (sm.refs[i].decl() && pm.refs[i].decl()) EXPECT_EQ(*sm.refs[i].decl(), *pm.refs[i].decl());
    }
    ASSERT_EQ(serial.session.diags.size(), parallel.session.diags.size());
    for (size_t i = 0; i < serial.session.diags.size(); i++)
        EXPECT_EQ(serial.session.diags[i].message, parallel.session.diags[i].message);
    EXPECT_EQ(serial.session.count(ErrorKind::UnresolvedName), 16u);
}
