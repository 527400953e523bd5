// File: tests/il/test_body_comparer.cpp
// Purpose: Pin down when two method bodies count as the same code.
// Key invariants: Floats compare exactly at their own precision; branch
//                 targets are ignored; compiler-generated callees matter.
// Ownership/Lifetime: Modules are parsed per test.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "il/analysis/BodyComparer.hpp"
#include "il/core/Module.hpp"
#include "il/io/Parser.hpp"

#include <string>

using hotswap::analysis::BodyComparer;
using hotswap::core::Module;

namespace
{
Module parse(const std::string &body, const std::string &extra = {})
{
    const std::string text = "module M\nclass public M.A\n  method public static float32 F()\n" +
                             body + "  end\nend\n" + extra;
    auto m = hotswap::io::Parser::parseText(text);
    EXPECT_TRUE(m.hasValue()) << (m ? std::string() : m.error().message);
    return m ? m.value() : Module{};
}

bool sameF(const Module &a, const Module &b)
{
    const auto *ma = a.findType("M.A")->findMethod("float32 M.A::F()");
    const auto *mb = b.findType("M.A")->findMethod("float32 M.A::F()");
    BodyComparer cmp(a, b);
    return cmp.equal(*ma, *mb);
}
} // namespace

TEST(BodyComparison, IdenticalBodiesAreEqual)
{
    const Module a = parse("    ldc.r4 1.5\n    ret\n");
    const Module b = parse("    ldc.r4 1.5\n    ret\n");
    EXPECT_TRUE(sameF(a, b));
}

TEST(BodyComparison, Float32ComparesAtSinglePrecision)
{
    const Module a = parse("    ldc.r4 1.0\n    ret\n");
    const Module b = parse("    ldc.r4 1.0000001\n    ret\n");
    EXPECT_FALSE(sameF(a, b));

    // Both literals round to the same float.
    const Module c = parse("    ldc.r4 0.1\n    ret\n");
    const Module d = parse("    ldc.r4 0.10000000000000001\n    ret\n");
    EXPECT_TRUE(sameF(c, d));
}

TEST(BodyComparison, ConstantChangeIsDetected)
{
    const Module a = parse("    ldc.i4 1\n    pop\n    ldc.r4 0\n    ret\n");
    const Module b = parse("    ldc.i4 2\n    pop\n    ldc.r4 0\n    ret\n");
    EXPECT_FALSE(sameF(a, b));
}

TEST(BodyComparison, BranchTargetsAreIgnored)
{
    const Module a = parse("    ldc.i4 1\n    brtrue one\n    ldc.r4 0\n  one: ldc.r4 1\n    ret\n");
    const Module b = parse("    ldc.i4 1\n    brtrue one\n  one: ldc.r4 0\n    ldc.r4 1\n    ret\n");
    EXPECT_TRUE(sameF(a, b));

    // The branch opcode itself still counts.
    const Module c = parse("    ldc.i4 1\n    brfalse one\n    ldc.r4 0\n  one: ldc.r4 1\n    ret\n");
    EXPECT_FALSE(sameF(a, c));
}

TEST(BodyComparison, CatchTypeMatters)
{
    const auto guarded = [](const std::string &type)
    {
        return "    try s e catch " + type + " h d\n"
               "  s: ldc.r4 1\n    ret\n"
               "  e: ldc.r4 2\n    ret\n"
               "  h: pop\n    ldc.r4 3\n    ret\n"
               "  d: ldc.r4 4\n    ret\n";
    };
    EXPECT_TRUE(sameF(parse(guarded("core.Exception")), parse(guarded("core.Exception"))));
    EXPECT_FALSE(sameF(parse(guarded("core.Exception")), parse(guarded("M.Error"))));
}

TEST(BodyComparison, GeneratedCalleeBodiesAreCompared)
{
    const std::string callsHelper = "    call float32 M.Gen::Helper()\n    ret\n";
    const Module a = parse(callsHelper, "class private compilergenerated M.Gen\n"
                                        "  method public static float32 Helper()\n"
                                        "    ldc.r4 1\n    ret\n  end\nend\n");
    const Module b = parse(callsHelper, "class private compilergenerated M.Gen\n"
                                        "  method public static float32 Helper()\n"
                                        "    ldc.r4 2\n    ret\n  end\nend\n");
    EXPECT_FALSE(sameF(a, b));

    const Module c = parse(callsHelper, "class private compilergenerated M.Gen\n"
                                        "  method public static float32 Helper()\n"
                                        "    ldc.r4 1\n    ret\n  end\nend\n");
    EXPECT_TRUE(sameF(a, c));
}

TEST(BodyComparison, OrdinaryCalleeBodiesAreNotFollowed)
{
    const std::string callsHelper = "    call float32 M.Util::Helper()\n    ret\n";
    const Module a = parse(callsHelper, "class public M.Util\n"
                                        "  method public static float32 Helper()\n"
                                        "    ldc.r4 1\n    ret\n  end\nend\n");
    const Module b = parse(callsHelper, "class public M.Util\n"
                                        "  method public static float32 Helper()\n"
                                        "    ldc.r4 2\n    ret\n  end\nend\n");
    EXPECT_TRUE(sameF(a, b));
}
