// File: tests/vm/test_field_resolver.cpp
// Purpose: Verify side storage for fields added after load: initial values,
//          addresses, statics and concurrent first access.
// Key invariants: One slot per (instance, owner, field); the first access
//                 creates it from the registered initializer.
// Ownership/Lifetime: Objects are allocated directly; the resolver is local.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "vm/FieldResolver.hpp"
#include "vm/Object.hpp"
#include "vm/Value.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using hotswap::vm::FieldResolver;
using hotswap::vm::Object;
using hotswap::vm::Value;
using hotswap::vm::ValueKind;

TEST(FieldSlots, InitializerThenStoreThenAddress)
{
    FieldResolver fields;
    fields.registerInitializer("Game.Player", "score", Value::i32(5));
    Object player(nullptr);

    EXPECT_FALSE(FieldResolver::hasDynamicFields(player));
    EXPECT_EQ(fields.get("Game.Player", player, "score").asInt(), 5);
    EXPECT_TRUE(FieldResolver::hasDynamicFields(player));

    fields.store("Game.Player", player, "score", Value::i32(7));
    EXPECT_EQ(fields.get("Game.Player", player, "score").asInt(), 7);

    Value ref = fields.ref("Game.Player", player, "score");
    ASSERT_EQ(ref.kind, ValueKind::Ref);
    ASSERT_NE(ref.ref, nullptr);
    *ref.ref = Value::i32(9);
    EXPECT_EQ(fields.get("Game.Player", player, "score").asInt(), 9);
}

TEST(FieldSlots, SlotsAreKeyedByOwnerAndInstance)
{
    FieldResolver fields;
    Object a(nullptr);
    Object b(nullptr);
    fields.store("Game.Player", a, "score", Value::i32(1));
    fields.store("Game.Enemy", a, "score", Value::i32(2));
    fields.store("Game.Player", b, "score", Value::i32(3));

    EXPECT_EQ(fields.get("Game.Player", a, "score").asInt(), 1);
    EXPECT_EQ(fields.get("Game.Enemy", a, "score").asInt(), 2);
    EXPECT_EQ(fields.get("Game.Player", b, "score").asInt(), 3);
    EXPECT_EQ(FieldResolver::dynamicFieldNames(a).size(), 2u);

    FieldResolver::clearDynamicFields(a);
    EXPECT_FALSE(FieldResolver::hasDynamicFields(a));
    EXPECT_TRUE(fields.get("Game.Player", a, "score").isNull());
}

TEST(FieldSlots, StaticSlots)
{
    FieldResolver fields;
    fields.registerInitializer("Game.World", "level", Value::string("intro"));
    EXPECT_EQ(fields.getStatic("Game.World", "level").toString(), "intro");
    fields.storeStatic("Game.World", "level", Value::string("boss"));
    EXPECT_EQ(fields.getStatic("Game.World", "level").toString(), "boss");

    Value ref = fields.staticRef("Game.World", "level");
    ASSERT_EQ(ref.kind, ValueKind::Ref);
    *ref.ref = Value::string("outro");
    EXPECT_EQ(fields.getStatic("Game.World", "level").toString(), "outro");

    fields.clear();
    EXPECT_TRUE(fields.getStatic("Game.World", "level").isNull());
}

TEST(FieldSlots, ConcurrentFirstAccessSharesOneSlot)
{
    FieldResolver fields;
    fields.registerInitializer("Game.Player", "score", Value::i32(5));
    auto player = std::make_shared<Object>(nullptr);

    constexpr int kThreads = 16;
    std::vector<Value *> seen(kThreads, nullptr);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back(
            [&, i]()
            {
                while (!go.load())
                    std::this_thread::yield();
                seen[i] = fields.ref("Game.Player", *player, "score").ref;
            });
    }
    go.store(true);
    for (auto &t : threads)
        t.join();

    for (int i = 1; i < kThreads; ++i)
        EXPECT_EQ(seen[i], seen[0]);
    EXPECT_EQ(FieldResolver::dynamicFieldNames(*player).size(), 1u);
    EXPECT_EQ(fields.get("Game.Player", *player, "score").asInt(), 5);
}

TEST(FieldSlots, ConcurrentStoresAreNotLost)
{
    FieldResolver fields;
    Object player(nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back(
            [&, i]()
            { fields.store("Game.Player", player, "f" + std::to_string(i), Value::i32(i)); });
    }
    for (auto &t : threads)
        t.join();
    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(fields.get("Game.Player", player, "f" + std::to_string(i)).asInt(), i);
}
