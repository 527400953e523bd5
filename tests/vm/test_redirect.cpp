// File: tests/vm/test_redirect.cpp
// Purpose: Verify entry-point redirection: every call path follows it, and
//          invalid redirections are refused without side effects.
// Key invariants: Handles taken before a redirect observe the replacement;
//                 cycles, arity mismatches and natives are rejected.
// Ownership/Lifetime: Each test owns a fresh runtime.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "il/io/Parser.hpp"
#include "vm/Runtime.hpp"

using hotswap::vm::Runtime;
using hotswap::vm::RuntimeMethod;
using hotswap::vm::Value;

namespace
{
constexpr const char *kShapes = R"IL(
module Shapes
reference core

class public Shapes.Shape extends core.Object
  method public void .ctor()
    ldarg 0
    call instance void core.Object::.ctor()
    ret
  end
  method public virtual int32 Sides()
    ldc.i4 0
    ret
  end
  method public int32 Twice()
    ldarg 0
    callvirt instance int32 Shapes.Shape::Sides()
    ldc.i4 2
    mul
    ret
  end
end

class public Shapes.Square extends Shapes.Shape
  method public void .ctor()
    ldarg 0
    call instance void Shapes.Shape::.ctor()
    ret
  end
  method public virtual int32 Sides()
    ldc.i4 4
    ret
  end
end

class public Shapes.Patch
  method public static int32 Sides(Shapes.Shape self)
    ldc.i4 5
    ret
  end
  method public static int32 Other(Shapes.Shape self)
    ldc.i4 6
    ret
  end
  method public static int32 Pair(int32 a, int32 b)
    ldc.i4 0
    ret
  end
end
)IL";

struct ShapesRuntime
{
    Runtime rt;

    ShapesRuntime()
    {
        auto m = hotswap::io::Parser::parseText(kShapes);
        EXPECT_TRUE(m.hasValue()) << (m ? std::string() : m.error().message);
        if (m)
        {
            auto lm = rt.load(std::move(m.value()));
            EXPECT_TRUE(lm.hasValue()) << (lm ? std::string() : lm.error().message);
        }
    }

    RuntimeMethod *method(const std::string &sig)
    {
        RuntimeMethod *m = rt.findMethod("Shapes", sig);
        EXPECT_NE(m, nullptr) << sig;
        return m;
    }
};
} // namespace

TEST(Redirect, VirtualCallAndOldHandleFollowReplacement)
{
    ShapesRuntime s;
    RuntimeMethod *sides = s.method("int32 Shapes.Square::Sides()");
    RuntimeMethod *patch = s.method("int32 Shapes.Patch::Sides(Shapes.Shape)");
    const Value handle = Value::handle(sides);

    auto square = s.rt.newObject("Shapes", "Shapes.Square");
    ASSERT_TRUE(square.hasValue()) << square.error().message;

    auto before = s.rt.invoke("Shapes", "int32 Shapes.Shape::Twice()", {square.value()});
    ASSERT_TRUE(before.hasValue()) << before.error().message;
    EXPECT_EQ(before.value().asInt(), 8);

    ASSERT_TRUE(s.rt.redirect(sides, patch).hasValue());

    auto after = s.rt.invoke("Shapes", "int32 Shapes.Shape::Twice()", {square.value()});
    ASSERT_TRUE(after.hasValue()) << after.error().message;
    EXPECT_EQ(after.value().asInt(), 10);

    auto viaHandle = s.rt.invokeHandle(handle, {square.value()});
    ASSERT_TRUE(viaHandle.hasValue()) << viaHandle.error().message;
    EXPECT_EQ(viaHandle.value().asInt(), 5);
    EXPECT_EQ(s.rt.resolveEntry(sides), patch);
}

TEST(Redirect, LaterRedirectReplacesEarlier)
{
    ShapesRuntime s;
    RuntimeMethod *sides = s.method("int32 Shapes.Square::Sides()");
    ASSERT_TRUE(s.rt.redirect(sides, s.method("int32 Shapes.Patch::Sides(Shapes.Shape)")).hasValue());
    ASSERT_TRUE(s.rt.redirect(sides, s.method("int32 Shapes.Patch::Other(Shapes.Shape)")).hasValue());

    auto square = s.rt.newObject("Shapes", "Shapes.Square");
    ASSERT_TRUE(square.hasValue());
    auto v = s.rt.invoke(sides, {square.value()});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().asInt(), 6);
}

TEST(Redirect, RejectsInvalidTargets)
{
    ShapesRuntime s;
    RuntimeMethod *sides = s.method("int32 Shapes.Square::Sides()");
    RuntimeMethod *patch = s.method("int32 Shapes.Patch::Sides(Shapes.Shape)");

    EXPECT_FALSE(s.rt.redirect(nullptr, patch).hasValue());
    EXPECT_FALSE(s.rt.redirect(sides, sides).hasValue());
    EXPECT_FALSE(s.rt.redirect(sides, s.method("int32 Shapes.Patch::Pair(int32,int32)")).hasValue());

    RuntimeMethod *ctor = s.rt.findMethod("core", "void core.Object::.ctor()");
    ASSERT_NE(ctor, nullptr);
    EXPECT_FALSE(s.rt.redirect(ctor, s.method("void Shapes.Shape::.ctor()")).hasValue());

    ASSERT_TRUE(s.rt.redirect(sides, patch).hasValue());
    auto cycle = s.rt.redirect(patch, sides);
    ASSERT_FALSE(cycle.hasValue());
    EXPECT_NE(cycle.error().message.find("cycle"), std::string::npos);
    EXPECT_EQ(s.rt.resolveEntry(patch), patch);
}
