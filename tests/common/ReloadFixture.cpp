// File: tests/common/ReloadFixture.cpp
// Purpose: Implement the shared reload test scaffolding.
// Key invariants: Failures inside helpers are reported through gtest so the
//                 calling test stops at the first broken step.

#include "tests/common/ReloadFixture.hpp"

#include "il/io/Parser.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace hotswap::tests
{

namespace
{
std::atomic<unsigned> dirCounter{0};
} // namespace

TempDir::TempDir(const std::string &tag)
{
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            (tag + "-" + std::to_string(stamp) + "-" + std::to_string(dirCounter++));
    fs::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const std::string &path, const std::string &text)
{
    const fs::path p(path);
    if (p.has_parent_path())
        fs::create_directories(p.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

std::string readFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
        return {};
    std::stringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

hotswap::core::Module parseOrDie(const std::string &text)
{
    auto m = hotswap::io::Parser::parseText(text);
    EXPECT_TRUE(m.hasValue()) << (m ? std::string() : m.error().message);
    return m ? m.value() : hotswap::core::Module{};
}

void ReloadFixture::SetUp()
{
    dir = std::make_unique<TempDir>("hotswap-test");
    config.projectName = "test";
    config.tempRoot = dir->file("state");
    config.log.level = hotswap::support::LogConfig::Debug;
    config.log.stream = &log;
    frontend = std::make_shared<hotswap::reload::AssemblerFrontend>();
    rt = std::make_unique<hotswap::vm::Runtime>(&console);
}

void ReloadFixture::TearDown()
{
    engine.reset();
    rt.reset();
    dir.reset();
}

void ReloadFixture::addModule(const std::string &name, const std::vector<std::string> &files)
{
    hotswap::reload::ModuleContext ctx;
    ctx.name = name;
    for (const auto &f : files)
        ctx.sources.push_back(dir->file(f));
    modules.push_back(std::move(ctx));
}

void ReloadFixture::boot()
{
    outputs.clear();
    for (const auto &ctx : modules)
    {
        auto compiled = frontend->compile(ctx, {});
        ASSERT_TRUE(compiled.hasValue()) << compiled.error().message;
        outputs.push_back(compiled.value());
        auto lm = rt->load(compiled.value());
        ASSERT_TRUE(lm.hasValue()) << lm.error().message;
    }
    engine = std::make_unique<hotswap::reload::ReloadEngine>(config, *rt, frontend);
    auto init = engine->initialize(modules, {});
    ASSERT_TRUE(init.hasValue()) << init.error().message;
}

hotswap::reload::InitializeResult ReloadFixture::restart()
{
    engine.reset();
    rt = std::make_unique<hotswap::vm::Runtime>(&console);
    for (const auto &m : outputs)
    {
        auto lm = rt->load(m);
        EXPECT_TRUE(lm.hasValue()) << (lm ? std::string() : lm.error().message);
    }
    engine = std::make_unique<hotswap::reload::ReloadEngine>(config, *rt, frontend);
    auto init = engine->initialize(modules, {});
    EXPECT_TRUE(init.hasValue()) << (init ? std::string() : init.error().message);
    return init ? init.value() : hotswap::reload::InitializeResult{};
}

std::string ReloadFixture::source(const std::string &name, const std::string &text)
{
    const std::string path = dir->file(name);
    writeFile(path, text);
    return path;
}

hotswap::reload::CycleResult ReloadFixture::edit(const std::string &name, const std::string &text)
{
    const std::string path = source(name, text);
    auto results = engine->reload({path});
    EXPECT_EQ(results.size(), 1u);
    if (results.empty())
        return {};
    EXPECT_TRUE(results.front().success) << results.front().error;
    return results.front();
}

hotswap::vm::Value ReloadFixture::call(const std::string &module,
                                       const std::string &signature,
                                       std::vector<hotswap::vm::Value> args)
{
    auto v = rt->invoke(module, signature, std::move(args));
    EXPECT_TRUE(v.hasValue()) << (v ? std::string() : v.error().message);
    return v ? v.value() : hotswap::vm::Value::null();
}

hotswap::vm::Value ReloadFixture::make(const std::string &module, const std::string &type)
{
    auto v = rt->newObject(module, type);
    EXPECT_TRUE(v.hasValue()) << (v ? std::string() : v.error().message);
    return v ? v.value() : hotswap::vm::Value::null();
}

hotswap::vm::Value ReloadFixture::callAdded(const std::string &type,
                                            const std::string &member,
                                            std::vector<hotswap::vm::Value> args)
{
    const auto records = engine->hookRecords();
    const auto *rec = records.findMember(type, member);
    EXPECT_NE(rec, nullptr) << "no hook record for " << member;
    if (!rec || !rec->current())
        return hotswap::vm::Value::null();
    const auto *w = rec->current();
    return call(w->module, w->signature, std::move(args));
}

} // namespace hotswap::tests
