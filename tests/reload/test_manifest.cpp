// File: tests/reload/test_manifest.cpp
// Purpose: Verify project manifest parsing into an initialize request.
// Key invariants: Relative paths resolve against the manifest's directory;
//                 every malformed line is reported with its line number.
// Ownership/Lifetime: Manifests are written into a scratch directory.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "reload/ReloadConfig.hpp"
#include "tests/common/ReloadFixture.hpp"

#include <filesystem>

using hotswap::reload::parseManifest;
using hotswap::support::LogConfig;
using hotswap::tests::TempDir;
using hotswap::tests::writeFile;

TEST(Manifest, ParsesProjectAndModules)
{
    TempDir dir;
    const std::string path = dir.file("game.manifest");
    writeFile(path, "# sample project\n"
                    "project Arena\n"
                    "define DEBUG\n"
                    "temp state\n"
                    "log debug\n"
                    "persist off\n"
                    "module Game\n"
                    "  source src/player.hsil\n"
                    "  source src/world.hsil\n"
                    "  reference Engine\n"
                    "  output bin/Game.hsil\n"
                    "  define FAST\n"
                    "  unsafe on\n"
                    "end\n"
                    "module Engine\n"
                    "  source engine.hsil\n"
                    "end\n");

    auto req = parseManifest(path);
    ASSERT_TRUE(req.hasValue()) << req.error().message;
    const auto &r = req.value();
    EXPECT_EQ(r.config.projectName, "Arena");
    EXPECT_EQ(r.config.log.level, LogConfig::Debug);
    EXPECT_FALSE(r.config.persistHooks);
    ASSERT_EQ(r.defines.size(), 1u);
    EXPECT_EQ(r.defines[0], "DEBUG");

    const auto root = std::filesystem::absolute(dir.path()).lexically_normal();
    EXPECT_EQ(r.config.tempRoot, (root / "state").string());
    EXPECT_EQ(r.config.outputDir(), (root / "state" / "Output").string());

    ASSERT_EQ(r.modules.size(), 2u);
    const auto &game = r.modules[0];
    EXPECT_EQ(game.name, "Game");
    ASSERT_EQ(game.sources.size(), 2u);
    EXPECT_EQ(game.sources[0], (root / "src" / "player.hsil").string());
    ASSERT_EQ(game.references.size(), 1u);
    EXPECT_EQ(game.references[0], "Engine");
    EXPECT_EQ(game.outputPath, (root / "bin" / "Game.hsil").string());
    ASSERT_EQ(game.defines.size(), 1u);
    EXPECT_TRUE(game.allowUnsafe);
    EXPECT_EQ(r.modules[1].name, "Engine");
}

TEST(Manifest, DefaultsFollowDirectoryName)
{
    TempDir dir;
    const std::string path = dir.file("arena/project.manifest");
    writeFile(path, "module Game\n  source a.hsil\nend\n");
    auto req = parseManifest(path);
    ASSERT_TRUE(req.hasValue()) << req.error().message;
    EXPECT_EQ(req.value().config.projectName, "arena");
    EXPECT_TRUE(req.value().config.persistHooks);
    EXPECT_EQ(req.value().config.log.level, LogConfig::Info);
}

TEST(Manifest, ErrorsNameTheLine)
{
    TempDir dir;
    const std::string path = dir.file("bad.manifest");

    writeFile(path, "module Game\n  source a.hsil\n  colour blue\nend\n");
    auto unknown = parseManifest(path);
    ASSERT_FALSE(unknown.hasValue());
    EXPECT_NE(unknown.error().message.find(":3:"), std::string::npos) << unknown.error().message;

    writeFile(path, "module Game\n  source a.hsil\n");
    auto open = parseManifest(path);
    ASSERT_FALSE(open.hasValue());
    EXPECT_NE(open.error().message.find("missing 'end'"), std::string::npos);

    writeFile(path, "log loud\nmodule Game\nend\n");
    auto level = parseManifest(path);
    ASSERT_FALSE(level.hasValue());
    EXPECT_NE(level.error().message.find("loud"), std::string::npos);

    writeFile(path, "module Game\nend\nmodule Game\nend\n");
    auto twice = parseManifest(path);
    ASSERT_FALSE(twice.hasValue());
    EXPECT_NE(twice.error().message.find("duplicate module"), std::string::npos);

    writeFile(path, "project Empty\n");
    auto empty = parseManifest(path);
    ASSERT_FALSE(empty.hasValue());
    EXPECT_NE(empty.error().message.find("no modules"), std::string::npos);

    auto missing = parseManifest(dir.file("absent.manifest"));
    ASSERT_FALSE(missing.hasValue());
}
