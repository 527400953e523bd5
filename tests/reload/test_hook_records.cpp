// File: tests/reload/test_hook_records.cpp
// Purpose: Verify the persisted hook record format and its error reporting.
// Key invariants: save/load preserves every record; malformed input names the
//                 file and line.
// Ownership/Lifetime: Records are test-local; files live in a scratch dir.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "reload/HookRecords.hpp"
#include "tests/common/ReloadFixture.hpp"

#include <sstream>

using hotswap::reload::FieldRecord;
using hotswap::reload::HookRecordSet;
using hotswap::reload::IntroducedType;
using hotswap::reload::MemberState;
using hotswap::reload::WrapperRef;
using hotswap::tests::TempDir;

namespace
{
HookRecordSet sample()
{
    HookRecordSet set;
    auto &f = set.member("Game", "Game.Player", "int32 Game.Player::F()", MemberState::Modified);
    f.history.push_back(WrapperRef{"Game.patch.0001", "/tmp/p1.hsil", "Game.Player$Patch",
                                   "int32 Game.Player$Patch::F(Game.Player)", true});
    f.history.push_back(WrapperRef{"Game.patch.0002", "/tmp/p2.hsil", "Game.Player$Patch",
                                   "int32 Game.Player$Patch::F(Game.Player)", true});
    auto &g = set.member("Game", "Game.Player", "int32 Game.Player::G()", MemberState::Added);
    g.history.push_back(WrapperRef{"Game.patch.0002", "/tmp/p2.hsil", "Game.Player$Patch",
                                   "int32 Game.Player$Patch::G(Game.Player)", true});

    FieldRecord score;
    score.field = "int32 Game.Player::score";
    score.name = "score";
    score.typeName = "int32";
    score.initModule = "Game.patch.0001";
    score.initSignature = "int32 Game.Player$Patch::$init_score()";
    set.types["Game.Player"].fields[score.field] = score;

    FieldRecord plain;
    plain.field = "string Game.Player::tag";
    plain.name = "tag";
    plain.typeName = "string";
    plain.isStatic = true;
    set.types["Game.Player"].fields[plain.field] = plain;

    set.introduced["Game.Buff"] =
        IntroducedType{"Game.Buff", "Game.patch.0002", "/tmp/p2.hsil", {"power", "ticks"}};
    set.introduced["Game.Empty"] = IntroducedType{"Game.Empty", "Game.patch.0002", "/tmp/p2.hsil", {}};
    return set;
}
} // namespace

TEST(HookRecords, SaveAndLoadPreserveRecords)
{
    TempDir dir;
    const HookRecordSet set = sample();
    const std::string path = dir.file("nested/hooks.state");
    ASSERT_TRUE(set.save(path).hasValue());

    auto loaded = HookRecordSet::load(path);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message;
    const HookRecordSet &r = loaded.value();

    EXPECT_EQ(r.memberCount(), 2u);
    const auto *f = r.findMember("Game.Player", "int32 Game.Player::F()");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->state, MemberState::Modified);
    ASSERT_EQ(f->history.size(), 2u);
    EXPECT_EQ(f->current()->module, "Game.patch.0002");
    EXPECT_TRUE(f->current()->selfParam);

    const auto *g = r.findMember("Game.Player", "int32 Game.Player::G()");
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(g->state, MemberState::Added);

    EXPECT_EQ(r.types.at("Game.Player").module, "Game");
    const auto &fields = r.types.at("Game.Player").fields;
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_TRUE(fields.at("int32 Game.Player::score").hasInitializer());
    EXPECT_FALSE(fields.at("string Game.Player::tag").hasInitializer());
    EXPECT_TRUE(fields.at("string Game.Player::tag").isStatic);
    EXPECT_TRUE(r.hasField("Game.Player", "score"));
    EXPECT_FALSE(r.hasField("Game.Player", "hp"));

    ASSERT_NE(r.findIntroduced("Game.Buff"), nullptr);
    EXPECT_EQ(r.findIntroduced("Game.Buff")->fields.size(), 2u);
    ASSERT_NE(r.findIntroduced("Game.Empty"), nullptr);
    EXPECT_TRUE(r.findIntroduced("Game.Empty")->fields.empty());

    std::ostringstream a;
    std::ostringstream b;
    set.write(a);
    r.write(b);
    EXPECT_EQ(a.str(), b.str());
}

TEST(HookRecords, PatchModulesListsEveryModuleOnce)
{
    const auto modules = sample().patchModules();
    ASSERT_EQ(modules.size(), 2u);
    EXPECT_EQ(modules.at("Game.patch.0001"), "/tmp/p1.hsil");
    EXPECT_EQ(modules.at("Game.patch.0002"), "/tmp/p2.hsil");
}

TEST(HookRecords, MemberKeepsFirstState)
{
    HookRecordSet set;
    set.member("Game", "Game.Player", "void Game.Player::H()", MemberState::Added);
    auto &again = set.member("Game", "Game.Player", "void Game.Player::H()", MemberState::Modified);
    EXPECT_EQ(again.state, MemberState::Added);
    EXPECT_EQ(set.memberCount(), 1u);
}

TEST(HookRecords, MissingHeaderIsRejected)
{
    std::istringstream is("type\tGame\tGame.Player\n");
    auto r = HookRecordSet::read(is, "hooks.state");
    ASSERT_FALSE(r.hasValue());
    EXPECT_NE(r.error().message.find("hooks.state:1"), std::string::npos) << r.error().message;
}

TEST(HookRecords, OrphanWrapperNamesItsLine)
{
    std::istringstream is("hotswap-hooks 1\ntype\tGame\tGame.Player\n"
                          "wrapper\tM\tp\tT\tsig\t0\n");
    auto r = HookRecordSet::read(is, "hooks.state");
    ASSERT_FALSE(r.hasValue());
    EXPECT_NE(r.error().message.find("hooks.state:3"), std::string::npos) << r.error().message;
}

TEST(HookRecords, UnknownStateIsRejected)
{
    std::istringstream is("hotswap-hooks 1\ntype\tGame\tGame.Player\n"
                          "member\tvoid Game.Player::F()\tRemoved\n");
    auto r = HookRecordSet::read(is, "hooks.state");
    ASSERT_FALSE(r.hasValue());
    EXPECT_NE(r.error().message.find("Removed"), std::string::npos);
}
