// File: tests/vm/test_interpreter.cpp
// Purpose: Exercise the interpreter on the instruction forms the reload
//          pipeline relies on: objects and fields, virtual dispatch, handles,
//          delegates, exceptions and console output.
// Key invariants: invoke() never throws; every failure surfaces as a Diag.
// Ownership/Lifetime: Each test owns a fresh runtime.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "il/io/Parser.hpp"
#include "vm/Runtime.hpp"

#include <sstream>
#include <string>

using hotswap::vm::Runtime;
using hotswap::vm::Value;
using hotswap::vm::ValueKind;

namespace
{
constexpr const char *kZoo = R"IL(
module Zoo
reference core

class public Zoo.Animal extends core.Object
  field protected string name
  method public void .ctor(string name)
    ldarg 0
    call instance void core.Object::.ctor()
    ldarg 0
    ldarg 1
    stfld string Zoo.Animal::name
    ret
  end
  method public virtual string Speak()
    ldstr "..."
    ret
  end
  method public string Describe()
    ldarg 0
    ldfld string Zoo.Animal::name
    ldstr " says "
    add
    ldarg 0
    callvirt instance string Zoo.Animal::Speak()
    add
    ret
  end
end

class public Zoo.Dog extends Zoo.Animal
  method public void .ctor(string name)
    ldarg 0
    ldarg 1
    call instance void Zoo.Animal::.ctor(string)
    ret
  end
  method public virtual string Speak()
    ldstr "woof"
    ret
  end
end

class public Zoo.Program
  field public static int32 counter
  method public static string Run()
    ldstr "rex"
    newobj instance void Zoo.Dog::.ctor(string)
    call instance string Zoo.Animal::Describe()
    ret
  end
  method public static int32 Sum(int32 n)
    locals int32, int32
    ldc.i4 0
    stloc 0
    ldc.i4 1
    stloc 1
  loop: ldloc 1
    ldarg 0
    cgt
    brtrue done
    ldloc 0
    ldloc 1
    add
    stloc 0
    ldloc 1
    ldc.i4 1
    add
    stloc 1
    br loop
  done: ldloc 0
    ret
  end
  method public static int32 Bump()
    ldsflda int32 Zoo.Program::counter
    ldsfld int32 Zoo.Program::counter
    ldc.i4 1
    add
    stind
    ldsfld int32 Zoo.Program::counter
    ret
  end
  method public static int32 Twice(int32 x)
    ldarg 0
    ldc.i4 2
    mul
    ret
  end
  method public static object ViaDelegate()
    ldnull
    ldftn int32 Zoo.Program::Twice(int32)
    newobj instance void core.Delegate::.ctor(object, method)
    ldc.i4 21
    callvirt instance object core.Delegate::Invoke(int32)
    ret
  end
  method public static string Catch()
    try start stop catch core.Exception handler done
  start: ldstr "bad"
    newobj instance void core.Exception::.ctor(string)
    throw
  stop: ldstr "unreachable"
    ret
  handler: castclass core.Exception
    callvirt instance string core.Exception::get_Message()
    ret
  done: ret
  end
  method public static void Hello()
    ldstr "hello"
    call void core.Console::WriteLine(object)
    ret
  end
end
)IL";

void load(Runtime &rt, const std::string &text)
{
    auto m = hotswap::io::Parser::parseText(text);
    ASSERT_TRUE(m.hasValue()) << m.error().message;
    auto lm = rt.load(std::move(m.value()));
    ASSERT_TRUE(lm.hasValue()) << lm.error().message;
}
} // namespace

TEST(Interpreter, VirtualDispatchAndFields)
{
    Runtime rt;
    load(rt, kZoo);
    auto v = rt.invoke("Zoo", "string Zoo.Program::Run()", {});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().toString(), "rex says woof");
}

TEST(Interpreter, LoopsAndLocals)
{
    Runtime rt;
    load(rt, kZoo);
    auto v = rt.invoke("Zoo", "int32 Zoo.Program::Sum(int32)", {Value::i32(10)});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().asInt(), 55);
}

TEST(Interpreter, StaticFieldAddress)
{
    Runtime rt;
    load(rt, kZoo);
    ASSERT_TRUE(rt.invoke("Zoo", "int32 Zoo.Program::Bump()", {}).hasValue());
    auto v = rt.invoke("Zoo", "int32 Zoo.Program::Bump()", {});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().asInt(), 2);
}

TEST(Interpreter, DelegateInvokesStaticTarget)
{
    Runtime rt;
    load(rt, kZoo);
    auto v = rt.invoke("Zoo", "object Zoo.Program::ViaDelegate()", {});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().asInt(), 42);
}

TEST(Interpreter, CatchHandlerReceivesException)
{
    Runtime rt;
    load(rt, kZoo);
    auto v = rt.invoke("Zoo", "string Zoo.Program::Catch()", {});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().toString(), "bad");
}

TEST(Interpreter, ConsoleGoesToConfiguredStream)
{
    std::ostringstream out;
    Runtime rt(&out);
    load(rt, kZoo);
    ASSERT_TRUE(rt.invoke("Zoo", "void Zoo.Program::Hello()", {}).hasValue());
    EXPECT_EQ(out.str(), "hello\n");
}

TEST(Interpreter, NewObjectRunsConstructor)
{
    Runtime rt;
    load(rt, kZoo);
    auto dog = rt.newObject("Zoo", "Zoo.Dog", {Value::string("fido")});
    ASSERT_TRUE(dog.hasValue()) << dog.error().message;
    ASSERT_EQ(dog.value().kind, ValueKind::Obj);
    auto v = rt.invoke("Zoo", "string Zoo.Animal::Describe()", {dog.value()});
    ASSERT_TRUE(v.hasValue()) << v.error().message;
    EXPECT_EQ(v.value().toString(), "fido says woof");
}

TEST(Interpreter, UnloadedReferenceIsRejected)
{
    Runtime rt;
    auto m = hotswap::io::Parser::parseText("module A\nreference B\n");
    ASSERT_TRUE(m.hasValue());
    auto lm = rt.load(std::move(m.value()));
    ASSERT_FALSE(lm.hasValue());
    EXPECT_NE(lm.error().message.find("B"), std::string::npos);
}
