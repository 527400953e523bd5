// File: tests/reload/test_frontend.cpp
// Purpose: Verify the assembler front end: conditional sections, multi-file
//          modules and the checks that keep a module coherent.
// Key invariants: Every compiled type records the file that declared it;
//                 module-level defines add to the global ones.
// Ownership/Lifetime: Sources are written into a scratch directory.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "reload/Frontend.hpp"
#include "tests/common/ReloadFixture.hpp"

using hotswap::reload::AssemblerFrontend;
using hotswap::reload::ModuleContext;
using hotswap::tests::TempDir;
using hotswap::tests::writeFile;

namespace
{
constexpr const char *kConditional = R"IL(module Game
class public Game.Config
  method public static int32 Level()
#if DEBUG
    ldc.i4 1
#else
#if FAST
    ldc.i4 3
#else
    ldc.i4 2
#endif
#endif
    ret
  end
end
)IL";

int32_t level(const hotswap::core::Module &m)
{
    const auto *t = m.findType("Game.Config");
    EXPECT_NE(t, nullptr);
    const auto *f = t ? t->findMethod("int32 Game.Config::Level()") : nullptr;
    EXPECT_NE(f, nullptr);
    return f ? static_cast<int32_t>(f->body.at(0).operand.i64) : -1;
}
} // namespace

TEST(Frontend, DefinesSelectSections)
{
    TempDir dir;
    writeFile(dir.file("config.hsil"), kConditional);
    ModuleContext ctx;
    ctx.name = "Game";
    ctx.sources = {dir.file("config.hsil")};

    AssemblerFrontend fe;
    auto plain = fe.compile(ctx, {});
    ASSERT_TRUE(plain.hasValue()) << plain.error().message;
    EXPECT_EQ(level(plain.value()), 2);

    auto debug = fe.compile(ctx, {"DEBUG"});
    ASSERT_TRUE(debug.hasValue()) << debug.error().message;
    EXPECT_EQ(level(debug.value()), 1);

    ctx.defines = {"FAST"};
    auto fast = fe.compile(ctx, {});
    ASSERT_TRUE(fast.hasValue()) << fast.error().message;
    EXPECT_EQ(level(fast.value()), 3);
}

TEST(Frontend, UnbalancedConditionalsAreErrors)
{
    EXPECT_FALSE(AssemblerFrontend::preprocess("#if A\nx\n", {}).hasValue());
    EXPECT_FALSE(AssemblerFrontend::preprocess("#endif\n", {}).hasValue());
    EXPECT_FALSE(AssemblerFrontend::preprocess("#if A\n#else\n#else\n#endif\n", {}).hasValue());

    // Line numbers survive preprocessing.
    auto text = AssemblerFrontend::preprocess("#if A\nhidden\n#endif\nshown\n", {});
    ASSERT_TRUE(text.hasValue());
    EXPECT_EQ(text.value(), "\n\n\nshown\n");
}

TEST(Frontend, MergesFilesAndStampsSources)
{
    TempDir dir;
    writeFile(dir.file("a.hsil"), "module Game\nreference core\nclass public Game.A\nend\n");
    writeFile(dir.file("b.hsil"), "module Game\nclass public Game.B\nend\n");
    ModuleContext ctx;
    ctx.name = "Game";
    ctx.sources = {dir.file("a.hsil"), dir.file("b.hsil")};
    ctx.references = {"Engine"};

    AssemblerFrontend fe;
    auto m = fe.compile(ctx, {});
    ASSERT_TRUE(m.hasValue()) << m.error().message;
    ASSERT_EQ(m.value().types.size(), 2u);
    EXPECT_EQ(m.value().findType("Game.A")->sourceFile,
              hotswap::reload::normalizeSourcePath(dir.file("a.hsil")));
    EXPECT_EQ(m.value().findType("Game.B")->sourceFile,
              hotswap::reload::normalizeSourcePath(dir.file("b.hsil")));
    ASSERT_EQ(m.value().references.size(), 2u);
    EXPECT_EQ(m.value().references[0], "Engine");
    EXPECT_EQ(m.value().references[1], "core");
}

TEST(Frontend, RejectsIncoherentModules)
{
    TempDir dir;
    writeFile(dir.file("a.hsil"), "module Game\nclass public Game.A\nend\n");
    writeFile(dir.file("dup.hsil"), "module Game\nclass public Game.A\nend\n");
    writeFile(dir.file("other.hsil"), "module Other\nclass public Other.X\nend\n");
    writeFile(dir.file("broken.hsil"), "module Game\nclass public Game.C\n  bogus\nend\n");

    AssemblerFrontend fe;
    ModuleContext ctx;
    ctx.name = "Game";

    ctx.sources = {dir.file("a.hsil"), dir.file("dup.hsil")};
    auto dup = fe.compile(ctx, {});
    ASSERT_FALSE(dup.hasValue());
    EXPECT_NE(dup.error().message.find("already declared"), std::string::npos);

    ctx.sources = {dir.file("other.hsil")};
    auto other = fe.compile(ctx, {});
    ASSERT_FALSE(other.hasValue());
    EXPECT_NE(other.error().message.find("Other"), std::string::npos);

    ctx.sources = {dir.file("broken.hsil")};
    auto broken = fe.compile(ctx, {});
    ASSERT_FALSE(broken.hasValue());
    EXPECT_NE(broken.error().message.find("broken.hsil:3"), std::string::npos)
        << broken.error().message;

    ctx.sources = {dir.file("absent.hsil")};
    EXPECT_FALSE(fe.compile(ctx, {}).hasValue());
}
