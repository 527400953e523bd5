// File: tests/reload/test_hook_applier.cpp
// Purpose: Verify hook application against a live runtime: redirection of
//          originals and earlier wrappers, field registration, per-member
//          failures and restoring persisted records.
// Key invariants: A member whose wrapper cannot be resolved fails alone; a
//                 hooked member and its earlier wrappers reach the newest one.
// Ownership/Lifetime: Each test owns its runtime and scratch directory.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "reload/HookApplier.hpp"
#include "tests/common/ReloadFixture.hpp"
#include "vm/Runtime.hpp"

#include <filesystem>
#include <memory>
#include <sstream>

using hotswap::reload::HookApplier;
using hotswap::reload::HookRecordSet;
using hotswap::reload::MemberState;
using hotswap::reload::PatchedField;
using hotswap::reload::PatchedMember;
using hotswap::reload::PatchResult;
using hotswap::reload::WrapperRef;
using hotswap::vm::Runtime;
using hotswap::vm::Value;

namespace
{
constexpr const char *kGame = R"IL(
module Game
reference core

class public Game.Player extends core.Object
  method public void .ctor()
    ldarg 0
    call instance void core.Object::.ctor()
    ret
  end
  method public int32 F()
    ldc.i4 1
    ret
  end
  method public static int32 S()
    ldc.i4 10
    ret
  end
end
)IL";

const std::string kF = "int32 Game.Player::F()";
const std::string kS = "int32 Game.Player::S()";

std::string patchText(const std::string &name, int f, int s)
{
    return "module " + name + "\nreference Game\nreference core\n\n"
           "class public Game.Player$Patch\n"
           "  method public static noinline int32 F([Game]Game.Player self)\n"
           "    ldc.i4 " + std::to_string(f) + "\n    ret\n  end\n"
           "  method public static noinline int32 S()\n"
           "    ldc.i4 " + std::to_string(s) + "\n    ret\n  end\n"
           "  method public static noinline int32 $init_score()\n"
           "    ldc.i4 5\n    ret\n  end\n"
           "end\n";
}

PatchedMember member(const PatchResult &p,
                     const std::string &sig,
                     const std::string &wrapperSig,
                     bool self)
{
    return PatchedMember{"Game.Player", sig, MemberState::Modified,
                         WrapperRef{p.moduleName, p.path, "Game.Player$Patch", wrapperSig, self}};
}

class HookApplierTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        rt = std::make_unique<Runtime>();
        boot(*rt);
    }

    void boot(Runtime &r)
    {
        auto lm = r.load(hotswap::tests::parseOrDie(kGame));
        ASSERT_TRUE(lm.hasValue()) << lm.error().message;
    }

    PatchResult writePatch(const std::string &name, int f, int s)
    {
        PatchResult p;
        p.sourceModule = "Game";
        p.moduleName = name;
        p.path = dir.file(name + ".hsil");
        hotswap::tests::writeFile(p.path, patchText(name, f, s));
        p.members.push_back(member(p, kF, "int32 Game.Player$Patch::F(Game.Player)", true));
        p.members.push_back(member(p, kS, "int32 Game.Player$Patch::S()", false));
        return p;
    }

    int64_t callF(Runtime &r)
    {
        auto obj = r.newObject("Game", "Game.Player");
        EXPECT_TRUE(obj.hasValue());
        if (!obj)
            return -1;
        auto v = r.invoke("Game", kF, {obj.value()});
        EXPECT_TRUE(v.hasValue()) << (v ? std::string() : v.error().message);
        return v ? v.value().asInt() : -1;
    }

    int64_t callS(Runtime &r)
    {
        auto v = r.invoke("Game", kS, {});
        EXPECT_TRUE(v.hasValue()) << (v ? std::string() : v.error().message);
        return v ? v.value().asInt() : -1;
    }

    hotswap::tests::TempDir dir;
    std::ostringstream out;
    hotswap::support::LogSink log{hotswap::support::LogConfig{
        hotswap::support::LogConfig::Debug, &out}};
    std::unique_ptr<Runtime> rt;
};
} // namespace

TEST_F(HookApplierTest, HooksModifiedMembers)
{
    HookApplier applier(*rt, log);
    EXPECT_EQ(callF(*rt), 1);
    EXPECT_EQ(callS(*rt), 10);

    const auto report = applier.apply(writePatch("Game.patch.0001", 2, 20));
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.applied.size(), 2u);
    EXPECT_EQ(callF(*rt), 2);
    EXPECT_EQ(callS(*rt), 20);

    const auto records = applier.records();
    const auto *rec = records.findMember("Game.Player", kF);
    ASSERT_NE(rec, nullptr);
    ASSERT_EQ(rec->history.size(), 1u);
    EXPECT_EQ(rec->current()->module, "Game.patch.0001");
    EXPECT_EQ(records.types.at("Game.Player").module, "Game");
}

TEST_F(HookApplierTest, MissingWrapperFailsOnlyThatMember)
{
    HookApplier applier(*rt, log);
    PatchResult p = writePatch("Game.patch.0001", 2, 20);
    p.members[1].wrapper.signature = "int32 Game.Player$Patch::S(int32)";

    const auto report = applier.apply(p);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].member, kS);
    EXPECT_NE(report.failures[0].reason.find("not found in Game.patch.0001"), std::string::npos)
        << report.failures[0].reason;
    ASSERT_EQ(report.applied.size(), 1u);
    EXPECT_EQ(report.applied[0], kF);

    EXPECT_EQ(callF(*rt), 2);
    EXPECT_EQ(callS(*rt), 10);
    EXPECT_EQ(applier.records().findMember("Game.Player", kS), nullptr);
    EXPECT_NE(out.str().find("[hook] error:"), std::string::npos);
}

TEST_F(HookApplierTest, UnwrittenPatchFailsEveryMember)
{
    HookApplier applier(*rt, log);
    PatchResult p = writePatch("Game.patch.0001", 2, 20);
    p.path.clear();

    const auto report = applier.apply(p);
    EXPECT_TRUE(report.applied.empty());
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_NE(report.failures[0].reason.find("has not been written"), std::string::npos);
    EXPECT_EQ(callF(*rt), 1);
}

TEST_F(HookApplierTest, LaterPatchRedirectsEarlierWrappers)
{
    HookApplier applier(*rt, log);
    ASSERT_TRUE(applier.apply(writePatch("Game.patch.0001", 2, 20)).ok());
    ASSERT_TRUE(applier.apply(writePatch("Game.patch.0002", 3, 30)).ok());

    EXPECT_EQ(callF(*rt), 3);
    EXPECT_EQ(callS(*rt), 30);

    // Code still bound to the first wrapper reaches the newest body.
    auto first = rt->invoke("Game.patch.0001", "int32 Game.Player$Patch::S()", {});
    ASSERT_TRUE(first.hasValue()) << first.error().message;
    EXPECT_EQ(first.value().asInt(), 30);

    const auto *rec = applier.records().findMember("Game.Player", kS);
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->history.size(), 2u);
}

TEST_F(HookApplierTest, AddedFieldStartsWithInitializerValue)
{
    HookApplier applier(*rt, log);
    PatchResult p = writePatch("Game.patch.0001", 2, 20);
    PatchedField f;
    f.type = "Game.Player";
    f.record.field = "int32 Game.Player::score";
    f.record.name = "score";
    f.record.typeName = "int32";
    f.record.initModule = p.moduleName;
    f.record.initSignature = "int32 Game.Player$Patch::$init_score()";
    p.fields.push_back(f);

    ASSERT_TRUE(applier.apply(p).ok());
    auto obj = rt->newObject("Game", "Game.Player");
    ASSERT_TRUE(obj.hasValue());
    EXPECT_EQ(rt->fields().get("Game.Player", *obj.value().obj, "score").asInt(), 5);
    EXPECT_TRUE(applier.records().hasField("Game.Player", "score"));
}

TEST_F(HookApplierTest, FailedInitializerFallsBackToDefault)
{
    HookApplier applier(*rt, log);
    PatchResult p = writePatch("Game.patch.0001", 2, 20);
    PatchedField f;
    f.type = "Game.Player";
    f.record.field = "int32 Game.Player::level";
    f.record.name = "level";
    f.record.typeName = "int32";
    f.record.initModule = p.moduleName;
    f.record.initSignature = "int32 Game.Player$Patch::$init_level()";
    p.fields.push_back(f);

    ASSERT_TRUE(applier.apply(p).ok());
    auto obj = rt->newObject("Game", "Game.Player");
    ASSERT_TRUE(obj.hasValue());
    EXPECT_EQ(rt->fields().get("Game.Player", *obj.value().obj, "level").asInt(), 0);
    EXPECT_NE(out.str().find("initializer failed"), std::string::npos);
}

TEST_F(HookApplierTest, RecordsRestoreIntoFreshRuntime)
{
    HookRecordSet saved;
    {
        HookApplier applier(*rt, log);
        ASSERT_TRUE(applier.apply(writePatch("Game.patch.0001", 2, 20)).ok());
        ASSERT_TRUE(applier.apply(writePatch("Game.patch.0002", 3, 30)).ok());
        saved = applier.records();
    }

    Runtime fresh;
    boot(fresh);
    HookApplier applier(fresh, log);
    const auto report = applier.applyRecords(saved);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.applied.size(), 2u);
    EXPECT_EQ(callF(fresh), 3);
    EXPECT_EQ(callS(fresh), 30);
    EXPECT_EQ(applier.records().memberCount(), 2u);
}

TEST_F(HookApplierTest, RestoreReportsMissingPatchFiles)
{
    HookRecordSet saved;
    {
        HookApplier applier(*rt, log);
        ASSERT_TRUE(applier.apply(writePatch("Game.patch.0001", 2, 20)).ok());
        saved = applier.records();
    }
    std::filesystem::remove(dir.file("Game.patch.0001.hsil"));

    Runtime fresh;
    boot(fresh);
    HookApplier applier(fresh, log);
    const auto report = applier.applyRecords(saved);
    EXPECT_TRUE(report.applied.empty());
    EXPECT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(callF(fresh), 1);
}

TEST_F(HookApplierTest, BrokenHistoryLeavesOriginalInPlace)
{
    const PatchResult p = writePatch("Game.patch.0001", 2, 20);
    HookRecordSet saved;
    auto &rec = saved.member("Game", "Game.Player", kS, MemberState::Modified);
    rec.history.push_back(WrapperRef{p.moduleName, p.path, "Game.Player$Patch",
                                     "int32 Game.Player$Patch::Gone()", false});
    rec.history.push_back(p.members[1].wrapper);

    HookApplier applier(*rt, log);
    const auto report = applier.applyRecords(saved);
    EXPECT_TRUE(report.applied.empty());
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_NE(report.failures[0].reason.find("is missing from Game.patch.0001"), std::string::npos)
        << report.failures[0].reason;

    // Dispatch still runs the body the loaded build shipped.
    EXPECT_EQ(callS(*rt), 10);
}
