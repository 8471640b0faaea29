#include "cmacros/CompilerResolver.h"
#include "cmacros/ProbeRenderer.h"
#include "TestSupport.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using namespace cmacros;
using cmacros::testing::FakeToolRunner;
using cmacros::testing::RecordingToolRunner;
using cmacros::testing::ScratchDir;

static bool contains(const std::string &hay, const std::string &needle) {
    return hay.find(needle) != std::string::npos;
}

static std::string parentOf(const std::string &path) {
    return llvm::sys::path::parent_path(path).str();
}

// The compiled unit is the fifth argument from the end:
// ... <source> -shared -fPIC -o <module>
static std::string sourceArg(const std::vector<std::string> &argv) {
    return argv[argv.size() - 5];
}

// ── rendering ────────────────────────────────────────────────────────────────

TEST(ProbeRenderer, CTypeProbe) {
    ProbeRenderer r({ "stdio.h", "errno.h" }, Language::C);
    std::string src = r.typeProbe("EINVAL");
    EXPECT_EQ(src.rfind("#include <stdio.h>\n#include <errno.h>\n", 0), 0u);
    EXPECT_TRUE(contains(src, "compute_expression_type(void)"));
    EXPECT_TRUE(contains(src, "_Generic("));
    EXPECT_TRUE(contains(src, "(EINVAL)"));
    for (const char *assoc : { "float    : \"float\"", "double   : \"double\"",
                               "char *   : \"string\"", "void *   : \"pointer\"",
                               "int      : \"int\"", "long     : \"long\"" })
        EXPECT_TRUE(contains(src, assoc)) << assoc;
    EXPECT_FALSE(contains(src, "extern \"C\""));
}

TEST(ProbeRenderer, CxxTypeProbe) {
    ProbeRenderer r({ "cstddef" }, Language::CXX);
    std::string src = r.typeProbe("1+2");
    EXPECT_TRUE(contains(src, "#include <cstddef>\n"));
    EXPECT_TRUE(contains(src, "extern \"C\" const char *"));
    EXPECT_TRUE(contains(src, "decltype((1+2))"));
    EXPECT_TRUE(contains(src, "cmacros_type_tag<const char *>"));
    EXPECT_FALSE(contains(src, "_Generic"));
}

TEST(ProbeRenderer, ValueProbeReturnTypes) {
    ProbeRenderer r({}, Language::C);
    EXPECT_TRUE(contains(r.valueProbe(ConstantType::String, "NAME"),
                         "const char *\ncompute_expression_value(void)"));
    EXPECT_TRUE(contains(r.valueProbe(ConstantType::Pointer, "P"), "void *\n"));
    EXPECT_TRUE(contains(r.valueProbe(ConstantType::Long, "L"), "long\n"));
    EXPECT_TRUE(contains(r.valueProbe(ConstantType::Int, "3*4"), "return (3*4);"));
}

// ── orchestration with a fake toolchain ──────────────────────────────────────

TEST(CompilerResolver, BuildCommand) {
    DiscoveryConfig cfg;
    cfg.cc          = { "cc" };
    cfg.cflags      = { "-O0" };
    cfg.extraCflags = { "-I/x" };
    FakeToolRunner runner;
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.buildCommand("p.c", "p.so"),
              (std::vector<std::string>{ "cc", "-O0", "-I/x", "p.c", "-shared",
                                         "-fPIC", "-o", "p.so" }));
}

TEST(CompilerResolver, BuildFailureMeansOtherAndCleansUp) {
    DiscoveryConfig cfg;
    cfg.cc      = { "cc" };
    cfg.headers = { "foo.h" };
    FakeToolRunner runner;
    runner.result.exitStatus = 1;

    std::string source, sourcePath;
    runner.onRun = [&](const std::vector<std::string> &argv) {
        sourcePath = sourceArg(argv);
        if (auto buf = llvm::MemoryBuffer::getFile(sourcePath))
            source = (*buf)->getBuffer().str();
    };

    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("do { } while (0)"), ConstantType::Other);
    EXPECT_TRUE(contains(source, "#include <foo.h>"));
    EXPECT_TRUE(contains(source, "(do { } while (0))"));
    EXPECT_FALSE(llvm::sys::fs::exists(sourcePath));
    EXPECT_FALSE(llvm::sys::fs::exists(parentOf(sourcePath)));

    EXPECT_FALSE(r.resolveValue(ConstantType::Int, "x"));
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_FALSE(llvm::sys::fs::exists(parentOf(sourceArg(runner.calls[1]))));
}

TEST(CompilerResolver, ArtifactsLiveInAPrivateDirectory) {
    DiscoveryConfig cfg;
    cfg.cc = { "cc" };
    FakeToolRunner runner;
    runner.result.exitStatus = 1;

    std::string dir;
    bool sourceExisted = false;
    unsigned dirPerms  = 0;
    runner.onRun = [&](const std::vector<std::string> &argv) {
        dir           = parentOf(sourceArg(argv));
        sourceExisted = llvm::sys::fs::exists(sourceArg(argv));
        if (auto p = llvm::sys::fs::getPermissions(dir))
            dirPerms = *p;
    };

    CompilerResolver r(cfg, runner);
    r.resolveType("1");

    llvm::SmallString<128> tmp;
    llvm::sys::path::system_temp_directory(/*erasedOnReboot=*/true, tmp);
    EXPECT_TRUE(sourceExisted);
    EXPECT_NE(dir, tmp.str().str());
    EXPECT_EQ(llvm::sys::path::filename(dir).substr(0, 14).str(), "cmacros-probe-");
    EXPECT_EQ(parentOf(runner.calls[0].back()), dir);
    EXPECT_EQ(dirPerms & (llvm::sys::fs::group_all | llvm::sys::fs::others_all), 0u);
}

TEST(CompilerResolver, PlantedFileAtPredictablePathIsLeftAlone) {
    ScratchDir scratch;
    scratch.write("victim.txt", "precious data");
    llvm::SmallString<128> victim(scratch.path());
    llvm::sys::path::append(victim, "victim.txt");

    // Another user can guess "<tmp>/cet-<pid>-<n>.c"; plant links there.
    llvm::SmallString<128> tmp;
    llvm::sys::path::system_temp_directory(/*erasedOnReboot=*/true, tmp);
    std::string pid = std::to_string(llvm::sys::Process::getProcessId());
    std::vector<std::string> planted;
    for (int n = 1; n <= 64; ++n) {
        llvm::SmallString<128> link(tmp);
        llvm::sys::path::append(link, "cet-" + pid + "-" + std::to_string(n) + ".c");
        if (!llvm::sys::fs::create_link(victim, link))
            planted.push_back(link.str().str());
    }
    ASSERT_FALSE(planted.empty());

    DiscoveryConfig cfg;
    cfg.cc = { "cc" };
    FakeToolRunner runner;
    runner.result.exitStatus = 1;
    CompilerResolver r(cfg, runner);
    for (int i = 0; i < 4; ++i)
        EXPECT_EQ(r.resolveType("1+2"), ConstantType::Other);

    for (auto &link : planted)
        llvm::sys::fs::remove(link);

    auto buf = llvm::MemoryBuffer::getFile(victim);
    ASSERT_TRUE(bool(buf));
    EXPECT_EQ((*buf)->getBuffer().str(), "precious data");
    for (auto &argv : runner.calls)
        EXPECT_NE(parentOf(sourceArg(argv)), tmp.str().str());
}

TEST(CompilerResolver, MissingModuleMeansOther) {
    DiscoveryConfig cfg;
    cfg.cc = { "cc" };
    FakeToolRunner runner; // "succeeds" without producing a module
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("1"), ConstantType::Other);
    EXPECT_FALSE(r.resolveValue(ConstantType::Int, "1"));
}

TEST(CompilerResolver, DistinctArtifactsPerCall) {
    DiscoveryConfig cfg;
    cfg.cc = { "cc" };
    FakeToolRunner runner;
    runner.result.exitStatus = 1;
    CompilerResolver r(cfg, runner);
    r.resolveType("1");
    r.resolveType("1");
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_NE(runner.calls[0].back(), runner.calls[1].back());
    EXPECT_NE(parentOf(sourceArg(runner.calls[0])), parentOf(sourceArg(runner.calls[1])));
}

TEST(CompilerResolver, OtherIsNeverProbedForAValue) {
    DiscoveryConfig cfg;
    cfg.cc = { "cc" };
    FakeToolRunner runner;
    CompilerResolver r(cfg, runner);
    EXPECT_FALSE(r.resolveValue(ConstantType::Other, "1"));
    EXPECT_TRUE(runner.calls.empty());
}

// ── against the real compiler ────────────────────────────────────────────────

class RealCompiler : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.cc = findCompiler();
        if (cfg.cc.empty()) GTEST_SKIP() << "no C compiler found";
        cfg.headers = { "stddef.h" };
    }

    DiscoveryConfig   cfg;
    ProcessToolRunner runner;
};

TEST_F(RealCompiler, ArithmeticIsInt) {
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("1+2"), ConstantType::Int);
    auto v = r.resolveValue(ConstantType::Int, "3*4");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->intVal, 12);
}

TEST_F(RealCompiler, ScalarCategories) {
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("2L"), ConstantType::Long);
    EXPECT_EQ(r.resolveType("1.5f"), ConstantType::Float);
    EXPECT_EQ(r.resolveType("1.5"), ConstantType::Double);
    EXPECT_EQ(r.resolveType("\"abc\""), ConstantType::String);
    EXPECT_EQ(r.resolveType("'a'"), ConstantType::Int);
    EXPECT_EQ(r.resolveType("sizeof(int)"), ConstantType::Other); // size_t
}

TEST_F(RealCompiler, Values) {
    CompilerResolver r(cfg, runner);
    auto l = r.resolveValue(ConstantType::Long, "1L << 40");
    ASSERT_TRUE(l);
    EXPECT_EQ(l->intVal, 1099511627776LL);

    auto f = r.resolveValue(ConstantType::Float, "1.5f");
    ASSERT_TRUE(f);
    EXPECT_FLOAT_EQ(static_cast<float>(f->floatVal), 1.5f);

    auto s = r.resolveValue(ConstantType::String, "\"ab\" \"cd\"");
    ASSERT_TRUE(s);
    EXPECT_EQ(s->strVal, "abcd");
}

TEST_F(RealCompiler, PointerCast) {
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("(void*)0"), ConstantType::Pointer);
    auto p = r.resolveValue(ConstantType::Pointer, "(void*)0");
    if (p) EXPECT_EQ(p->type, ConstantType::Pointer);
}

TEST_F(RealCompiler, StatementIsOther) {
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("do { } while (0)"), ConstantType::Other);
    EXPECT_EQ(r.resolveType("undeclared_identifier"), ConstantType::Other);
    EXPECT_FALSE(r.resolveValue(ConstantType::Int, "undeclared_identifier"));
}

TEST_F(RealCompiler, HeaderContextIsVisible) {
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("NULL"), ConstantType::Pointer);
}

TEST_F(RealCompiler, CxxProbes) {
    cfg.lang    = Language::CXX;
    cfg.headers = { "cstddef" };
    // The C driver compiles .cxx as C++ but does not link libstdc++; the
    // probes need nothing from it.
    CompilerResolver r(cfg, runner);
    EXPECT_EQ(r.resolveType("1+2"), ConstantType::Int);
    EXPECT_EQ(r.resolveType("\"abc\""), ConstantType::String);
    auto v = r.resolveValue(ConstantType::Int, "6*7");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->intVal, 42);
}

TEST_F(RealCompiler, NoArtifactsSurvive) {
    RecordingToolRunner recording;
    CompilerResolver r(cfg, recording);
    EXPECT_EQ(r.resolveType("1+2"), ConstantType::Int);
    EXPECT_EQ(r.resolveType("not valid C"), ConstantType::Other);
    EXPECT_TRUE(r.resolveValue(ConstantType::Int, "1"));

    auto calls = recording.calls();
    ASSERT_EQ(calls.size(), 3u);
    for (auto &argv : calls)
        EXPECT_FALSE(llvm::sys::fs::exists(parentOf(sourceArg(argv))))
            << parentOf(sourceArg(argv));
}

TEST_F(RealCompiler, ConcurrentResolutionsThroughOneResolver) {
    RecordingToolRunner recording;
    CompilerResolver r(cfg, recording);

    constexpr int kThreads = 8;
    std::vector<ConstantType> types(kThreads, ConstantType::Other);
    std::vector<std::optional<Value>> values(kThreads);
    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([&, i] {
            std::string expr = std::to_string(i) + "*10";
            types[i]  = r.resolveType(expr);
            values[i] = r.resolveValue(ConstantType::Int, expr);
        });
    }
    for (auto &t : workers) t.join();

    for (int i = 0; i < kThreads; ++i) {
        EXPECT_EQ(types[i], ConstantType::Int) << i;
        ASSERT_TRUE(values[i]) << i;
        EXPECT_EQ(values[i]->intVal, i * 10);
    }

    auto calls = recording.calls();
    ASSERT_EQ(calls.size(), 2u * kThreads);
    std::set<std::string> dirs;
    for (auto &argv : calls) {
        std::string dir = parentOf(sourceArg(argv));
        EXPECT_FALSE(llvm::sys::fs::exists(dir)) << dir;
        dirs.insert(dir);
    }
    EXPECT_EQ(dirs.size(), calls.size());
}
