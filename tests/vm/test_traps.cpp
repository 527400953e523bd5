// File: tests/vm/test_traps.cpp
// Purpose: Verify runtime faults surface as diagnostics naming the trap kind
//          and that private members are guarded unless checks are disabled.
// Key invariants: A trap aborts only the invocation that raised it; the
//                 runtime stays usable afterwards.
// Ownership/Lifetime: Each test owns a fresh runtime.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "il/io/Parser.hpp"
#include "vm/Runtime.hpp"

#include <string>

using hotswap::vm::Runtime;
using hotswap::vm::Value;

namespace
{
constexpr const char *kFaults = R"IL(
module Faults
reference core

class public Faults.Vault
  field private int32 secret
  method private static int32 Hidden()
    ldc.i4 7
    ret
  end
  method public static int32 Open()
    call int32 Faults.Vault::Hidden()
    ret
  end
end

class public Faults.Thief
  method public static int32 Steal()
    call int32 Faults.Vault::Hidden()
    ret
  end
  method public static int32 Peek(object v)
    ldarg 0
    ldfld int32 Faults.Vault::secret
    ret
  end
  method public static int32 Divide(int32 a, int32 b)
    ldarg 0
    ldarg 1
    div
    ret
  end
  method public static int32 Forever(int32 n)
    ldarg 0
    call int32 Faults.Thief::Forever(int32)
    ret
  end
  method public static int32 Missing()
    call int32 Faults.Thief::Nowhere()
    ret
  end
  method public static void Raise()
    ldstr "kaboom"
    newobj instance void core.Exception::.ctor(string)
    throw
  end
end
)IL";

void load(Runtime &rt)
{
    auto m = hotswap::io::Parser::parseText(kFaults);
    ASSERT_TRUE(m.hasValue()) << m.error().message;
    auto lm = rt.load(std::move(m.value()));
    ASSERT_TRUE(lm.hasValue()) << lm.error().message;
}

std::string failure(Runtime &rt, const std::string &sig, std::vector<Value> args = {})
{
    auto v = rt.invoke("Faults", sig, std::move(args));
    EXPECT_FALSE(v.hasValue()) << sig << " unexpectedly succeeded";
    return v ? std::string() : v.error().message;
}
} // namespace

TEST(Traps, DivideByZero)
{
    Runtime rt;
    load(rt);
    const std::string msg =
        failure(rt, "int32 Faults.Thief::Divide(int32,int32)", {Value::i32(1), Value::i32(0)});
    EXPECT_NE(msg.find("DivideByZero"), std::string::npos) << msg;

    auto ok = rt.invoke("Faults", "int32 Faults.Thief::Divide(int32,int32)",
                        {Value::i32(9), Value::i32(3)});
    ASSERT_TRUE(ok.hasValue()) << ok.error().message;
    EXPECT_EQ(ok.value().asInt(), 3);
}

TEST(Traps, PrivateMethodIsGuarded)
{
    Runtime rt;
    load(rt);
    const std::string msg = failure(rt, "int32 Faults.Thief::Steal()");
    EXPECT_NE(msg.find("Visibility"), std::string::npos) << msg;

    auto inside = rt.invoke("Faults", "int32 Faults.Vault::Open()", {});
    ASSERT_TRUE(inside.hasValue()) << inside.error().message;
    EXPECT_EQ(inside.value().asInt(), 7);
}

TEST(Traps, DisabledChecksAllowPrivateAccess)
{
    Runtime rt;
    load(rt);
    rt.disableVisibilityChecks(rt.findMethod("Faults", "int32 Faults.Thief::Steal()"));
    auto v = rt.invoke("Faults", "int32 Faults.Thief::Steal()", {});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().asInt(), 7);
}

TEST(Traps, PrivateFieldIsGuarded)
{
    Runtime rt;
    load(rt);
    auto vault = rt.newObject("Faults", "Faults.Vault");
    ASSERT_TRUE(vault.hasValue()) << vault.error().message;
    const std::string msg = failure(rt, "int32 Faults.Thief::Peek(object)", {vault.value()});
    EXPECT_NE(msg.find("Visibility"), std::string::npos) << msg;
}

TEST(Traps, UnboundedRecursionOverflows)
{
    Runtime rt;
    load(rt);
    const std::string msg = failure(rt, "int32 Faults.Thief::Forever(int32)", {Value::i32(0)});
    EXPECT_NE(msg.find("StackOverflow"), std::string::npos) << msg;
}

TEST(Traps, MissingMethodIsReported)
{
    Runtime rt;
    load(rt);
    const std::string msg = failure(rt, "int32 Faults.Thief::Missing()");
    EXPECT_NE(msg.find("MissingMember"), std::string::npos) << msg;
    EXPECT_NE(msg.find("Nowhere"), std::string::npos) << msg;
}

TEST(Traps, UnhandledManagedException)
{
    Runtime rt;
    load(rt);
    const std::string msg = failure(rt, "void Faults.Thief::Raise()");
    EXPECT_NE(msg.find("kaboom"), std::string::npos) << msg;
}
