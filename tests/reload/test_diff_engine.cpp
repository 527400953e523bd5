// File: tests/reload/test_diff_engine.cpp
// Purpose: Verify change detection between the loaded module, the latest
//          compile and a candidate, including the generic-caller cascade.
// Key invariants: Identical recompiles produce no diff; every reported member
//                 really changed; callers of changed generic methods follow.
// Ownership/Lifetime: Modules are parsed per test and shared with the store.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "il/analysis/CallGraphIndex.hpp"
#include "reload/DiffEngine.hpp"
#include "reload/SnapshotStore.hpp"
#include "tests/common/ReloadFixture.hpp"

#include <memory>
#include <sstream>

using hotswap::analysis::CallGraphIndex;
using hotswap::core::Module;
using hotswap::reload::DiffEngine;
using hotswap::reload::DiffResult;
using hotswap::reload::SnapshotStore;
using hotswap::tests::parseOrDie;

namespace
{
const std::string kPlayerFile = "/virtual/game/player.hsil";
const std::string kUtilFile = "/virtual/game/util.hsil";

std::string player(const std::string &members)
{
    return "class public Game.Player source \"" + kPlayerFile + "\"\n"
           "  field private int32 hp\n"
           "  method public int32 F()\n"
           "    ldc.i4 1\n"
           "    ret\n"
           "  end\n" +
           members + "end\n";
}

std::string util(int idBias)
{
    std::string body = "    ldarg 0\n    ret\n";
    if (idBias)
        body = "    nop\n" + body;
    return "class public Game.Util source \"" + kUtilFile + "\"\n"
           "  method public static T Id<T>(T value)\n" +
           body +
           "  end\n"
           "end\n"
           "class public Game.Caller source \"" +
           kPlayerFile +
           "\"\n"
           "  method public static int32 Use()\n"
           "    ldc.i4 3\n"
           "    call T Game.Util::Id<T:int32>(T)\n"
           "    ret\n"
           "  end\n"
           "end\n";
}

Module module(const std::string &types)
{
    return parseOrDie("module Game\nreference core\n" + types);
}

class DiffEngineTest : public ::testing::Test
{
  protected:
    void init(const Module &loaded)
    {
        store.initialize("Game", loaded, loaded);
        graph.index(loaded);
    }

    std::optional<DiffResult> diff(const Module &candidate, const std::vector<std::string> &files)
    {
        auto c = std::make_shared<const Module>(candidate);
        auto r = engine.diff("Game", c, files, store, graph);
        store.commit("Game", c);
        return r;
    }

    std::ostringstream out;
    hotswap::support::LogSink log{hotswap::support::LogConfig{
        hotswap::support::LogConfig::Debug, &out}};
    SnapshotStore store;
    CallGraphIndex graph;
    DiffEngine engine{log};
};
} // namespace

TEST_F(DiffEngineTest, IdenticalRecompileHasNoDiff)
{
    const Module v1 = module(player("") + util(0));
    init(v1);
    EXPECT_FALSE(diff(module(player("") + util(0)), {kPlayerFile, kUtilFile}).has_value());
}

TEST_F(DiffEngineTest, AddedMethodIsTheOnlyChange)
{
    init(module(player("")));
    auto d = diff(module(player("  method public int32 G()\n    ldc.i4 2\n    ret\n  end\n")),
                  {kPlayerFile});
    ASSERT_TRUE(d.has_value());
    ASSERT_EQ(d->types.size(), 1u);
    const auto &m = d->types.at("Game.Player");
    EXPECT_FALSE(m.introduced);
    EXPECT_TRUE(m.modifiedMethods.empty());
    EXPECT_TRUE(m.addedFields.empty());
    ASSERT_EQ(m.addedMethods.size(), 1u);
    EXPECT_EQ(m.addedMethods.begin()->first, "int32 Game.Player::G()");
    EXPECT_EQ(d->memberCount(), 1u);
}

TEST_F(DiffEngineTest, ModifiedBodyAndAddedField)
{
    init(module(player("")));
    std::string next = player("  field public int32 score\n");
    next.replace(next.find("ldc.i4 1"), 8, "ldc.i4 2");
    auto d = diff(module(next), {kPlayerFile});
    ASSERT_TRUE(d.has_value());
    const auto &m = d->types.at("Game.Player");
    ASSERT_EQ(m.modifiedMethods.size(), 1u);
    EXPECT_EQ(m.modifiedMethods.begin()->first, "int32 Game.Player::F()");
    ASSERT_EQ(m.addedFields.size(), 1u);
    EXPECT_EQ(m.addedFields.begin()->first, "int32 Game.Player::score");
}

TEST_F(DiffEngineTest, MethodAddedThenEditedStaysAdded)
{
    init(module(player("")));
    ASSERT_TRUE(diff(module(player("  method public int32 G()\n    ldc.i4 2\n    ret\n  end\n")),
                     {kPlayerFile})
                    .has_value());
    auto d = diff(module(player("  method public int32 G()\n    ldc.i4 3\n    ret\n  end\n")),
                  {kPlayerFile});
    ASSERT_TRUE(d.has_value());
    const auto &m = d->types.at("Game.Player");
    EXPECT_TRUE(m.modifiedMethods.empty());
    EXPECT_EQ(m.addedMethods.count("int32 Game.Player::G()"), 1u);
}

TEST_F(DiffEngineTest, UnchangedFilesAreNotExamined)
{
    init(module(player("")));
    std::string next = player("");
    next.replace(next.find("ldc.i4 1"), 8, "ldc.i4 2");
    EXPECT_FALSE(diff(module(next), {"/virtual/game/other.hsil"}).has_value());
}

TEST_F(DiffEngineTest, GenericCalleeCascadesToCallers)
{
    init(module(player("") + util(0)));
    auto d = diff(module(player("") + util(1)), {kUtilFile});
    ASSERT_TRUE(d.has_value());
    ASSERT_EQ(d->types.count("Game.Util"), 1u);
    EXPECT_EQ(d->types.at("Game.Util").modifiedMethods.count("T Game.Util::Id<T>(T)"), 1u);
    ASSERT_EQ(d->types.count("Game.Caller"), 1u);
    EXPECT_EQ(d->types.at("Game.Caller").modifiedMethods.count("int32 Game.Caller::Use()"), 1u);
    EXPECT_EQ(d->types.count("Game.Player"), 0u);
}

TEST_F(DiffEngineTest, IntroducedTypeListsItsMembers)
{
    init(module(player("")));
    auto d = diff(module(player("") + "class public Game.Buff source \"" + kPlayerFile +
                         "\"\n"
                         "  field public int32 power\n"
                         "  method public void .ctor()\n    ret\n  end\n"
                         "  method public int32 Power()\n    ldc.i4 9\n    ret\n  end\n"
                         "end\n"),
                  {kPlayerFile});
    ASSERT_TRUE(d.has_value());
    const auto &buff = d->types.at("Game.Buff");
    EXPECT_TRUE(buff.introduced);
    EXPECT_EQ(buff.addedFields.size(), 1u);
    EXPECT_EQ(buff.addedMethods.count("int32 Game.Buff::Power()"), 1u);
    EXPECT_EQ(buff.addedMethods.count("void Game.Buff::.ctor()"), 0u);
}

TEST_F(DiffEngineTest, RemovedMembersAreIgnored)
{
    init(module(player("  method public int32 G()\n    ldc.i4 2\n    ret\n  end\n")));
    EXPECT_FALSE(diff(module(player("")), {kPlayerFile}).has_value());
}

TEST_F(DiffEngineTest, TypeInitializerIsNotPatched)
{
    init(module(player("  method public static void .cctor()\n    ret\n  end\n")));
    EXPECT_FALSE(
        diff(module(player("  method public static void .cctor()\n    nop\n    ret\n  end\n")),
             {kPlayerFile})
            .has_value());
}
