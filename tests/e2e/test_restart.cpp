// File: tests/e2e/test_restart.cpp
// Purpose: Verify that hooks survive a host restart through the persisted
//          state file, and that later cycles build on the restored hooks.
// Key invariants: initialize() returns persisted records without applying
//                 them; a corrupt or disabled state file restores nothing.
// Ownership/Lifetime: ReloadFixture owns the runtime, engine and sources.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "tests/common/ReloadFixture.hpp"

#include <filesystem>
#include <string>

using hotswap::vm::Value;

namespace
{
constexpr const char *kF = "int32 Game.Counter::F()";

std::string counter(int f)
{
    return "module Game\n"
           "reference core\n"
           "\n"
           "class public Game.Counter\n"
           "  method public static int32 F()\n"
           "    ldc.i4 " +
           std::to_string(f) +
           "\n"
           "    ret\n"
           "  end\n"
           "end\n";
}

class RestartTest : public hotswap::tests::ReloadFixture
{
  protected:
    void start()
    {
        source("counter.hsil", counter(1));
        addModule("Game", {"counter.hsil"});
        boot();
    }

    int64_t f()
    {
        return call("Game", kF).asInt();
    }
};
} // namespace

TEST_F(RestartTest, PersistedHooksRestoreAfterRestart)
{
    start();
    edit("counter.hsil", counter(2));
    EXPECT_EQ(f(), 2);
    ASSERT_TRUE(std::filesystem::exists(config.stateFile()));

    const auto init = restart();
    EXPECT_EQ(init.records.memberCount(), 1u);
    EXPECT_EQ(f(), 1);

    const auto report = engine->applyHooks(init.records);
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.applied.size(), 1u);
    EXPECT_EQ(report.applied[0], kF);
    EXPECT_EQ(f(), 2);

    // The restored hook is the base for the next edit.
    const auto r = edit("counter.hsil", counter(3));
    EXPECT_EQ(std::filesystem::path(r.patchPath).filename().string(), "Game.patch.0002.hsil");
    EXPECT_EQ(f(), 3);
    const auto *rec = engine->hookRecords().findMember("Game.Counter", kF);
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->history.size(), 2u);
}

TEST_F(RestartTest, RestartWithoutEditsRestoresNothing)
{
    start();
    const auto init = restart();
    EXPECT_TRUE(init.records.empty());
    EXPECT_EQ(f(), 1);
}

TEST_F(RestartTest, DisabledPersistenceWritesNoState)
{
    config.persistHooks = false;
    start();
    edit("counter.hsil", counter(2));
    EXPECT_FALSE(std::filesystem::exists(config.stateFile()));
    EXPECT_TRUE(restart().records.empty());
}

TEST_F(RestartTest, CorruptStateIsIgnored)
{
    start();
    edit("counter.hsil", counter(2));
    hotswap::tests::writeFile(config.stateFile(), "not a hook file\n");

    const auto init = restart();
    EXPECT_TRUE(init.records.empty());
    EXPECT_NE(log.str().find("ignoring hook state"), std::string::npos) << log.str();
    EXPECT_EQ(f(), 1);
}

TEST_F(RestartTest, EditsMadeWhileStoppedAreDiffedAgainstTheLoadedBuild)
{
    start();
    const std::string path = source("counter.hsil", counter(2));
    const auto init = restart();
    EXPECT_TRUE(init.records.empty());
    EXPECT_EQ(f(), 1);

    const auto results = engine->reload({path});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].success) << results[0].error;
    EXPECT_TRUE(results[0].changed);
    ASSERT_EQ(results[0].applied.size(), 1u);
    EXPECT_EQ(results[0].applied[0], kF);
    EXPECT_EQ(f(), 2);
}
