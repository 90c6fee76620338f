// ==============================================================================
// test_discovery_gtest.cpp - Тесты обхода зависимостей (GoogleTest)
// ==============================================================================
//
// MOD-0011: discovery
// ADR-0008: GoogleTest
// ADR-0011: детерминизм (одинаковый результат при любом числе потоков)
//
// Тесты: TST-DISC-001..TST-DISC-017
//
// ==============================================================================

#include "luarestore/discovery.hpp"
#include "luarestore/linearizer.hpp"
#include "luarestore/output.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace luarestore::discovery::test {

namespace {

using Keys = std::vector<std::string>;

/// Обёртка над MemoryFileSource: чтение одного пути бросает исключение
class ThrowingFileSource final : public io::FileSource {
public:
    ThrowingFileSource(const io::MemoryFileSource& inner, std::string poisoned)
        : inner_(inner), poisoned_(std::move(poisoned)) {}

    bool is_regular_file(const std::filesystem::path& path) const override {
        return inner_.is_regular_file(path);
    }
    std::filesystem::path canonical(const std::filesystem::path& path) const override {
        return inner_.canonical(path);
    }
    io::ReadResult read(const std::filesystem::path& path) const override {
        if (path.generic_string() == poisoned_) {
            throw std::runtime_error("storage failure on " + poisoned_);
        }
        return inner_.read(path);
    }

private:
    const io::MemoryFileSource& inner_;
    std::string poisoned_;
};

}  // namespace

// ==============================================================================
// Test Fixture: набор Lua-файлов в памяти под корнем /p
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    io::MemoryFileSource files_;

    void add(const std::string& name, const std::string& content) {
        files_.add_file("/p/" + name, content);
    }

    DiscoveryResult discover(const std::string& root, DiscoveryOptions options = {},
                             const CancellationToken* cancel = nullptr) {
        resolve::PathResolver resolver(files_, {"/p"}, {".lua"});
        DiscoveryDriver driver(files_, resolver, options);
        return driver.run("/p/" + root, cancel);
    }
};

// ==============================================================================
// TST-DISC-001..004: сценарии графа
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_001_Diamond) {
    add("A.lua", "local b = require('B')\nlocal c = require('C')\n");
    add("B.lua", "return require('D')");
    add("C.lua", "return require('D')");
    add("D.lua", "return {}");

    auto result = discover("A.lua");
    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.root_key, "/p/A.lua");

    const auto& g = result.graph;
    EXPECT_EQ(g.node_count(), 4u);
    EXPECT_EQ(g.edge_count(), 4u);
    for (const auto& node : g.nodes()) {
        EXPECT_EQ(node.state, graph::NodeState::Resolved) << node.key;
        ASSERT_TRUE(node.content) << node.key;
    }
    EXPECT_EQ(g.at("/p/D.lua").depth, 2u);

    auto lin = graph::linearize(g.snapshot());
    EXPECT_EQ(lin.order, (Keys{"/p/D.lua", "/p/B.lua", "/p/C.lua", "/p/A.lua"}));

    // Каждый файл читается ровно один раз
    EXPECT_EQ(files_.read_count(), 4u);
}

TEST_F(DiscoveryTest, TST_DISC_002_TwoNodeCycle) {
    add("A.lua", "require 'B'");
    add("B.lua", "require 'A'");

    auto result = discover("A.lua");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.graph.node_count(), 2u);
    EXPECT_EQ(files_.read_count(), 2u);

    auto lin = graph::linearize(result.graph.snapshot());
    EXPECT_EQ(lin.order, (Keys{"/p/A.lua", "/p/B.lua"}));
    ASSERT_EQ(lin.cycles.size(), 1u);
    EXPECT_EQ(lin.cycles[0].example_path, (Keys{"/p/A.lua", "/p/B.lua", "/p/A.lua"}));
}

TEST_F(DiscoveryTest, TST_DISC_003_MissingModule_RecordedNotNode) {
    add("A.lua", "local m = require('missing.module')\n");

    auto result = discover("A.lua");
    ASSERT_TRUE(result.ok);
    const auto& g = result.graph;
    EXPECT_EQ(g.node_count(), 1u);

    const auto& a = g.at("/p/A.lua");
    EXPECT_EQ(a.state, graph::NodeState::Resolved);
    EXPECT_EQ(a.unresolved, (Keys{"missing.module"}));
    EXPECT_EQ(a.raw_references, (Keys{"missing.module"}));
    EXPECT_TRUE(a.dependencies.empty());
    EXPECT_EQ(g.statistics().unresolved_references, 1u);
}

TEST_F(DiscoveryTest, TST_DISC_004_NestedModulePath) {
    add("main.lua", "require('net.http.client')");
    add("net/http/client.lua", "return 1");

    auto result = discover("main.lua");
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.graph.contains("/p/net/http/client.lua"));
    EXPECT_EQ(result.graph.at("/p/main.lua").dependencies,
              (std::set<std::string>{"/p/net/http/client.lua"}));
}

// ==============================================================================
// TST-DISC-005..008: ошибки
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_005_ReadError_MarksNodeAndContinues) {
    add("A.lua", "require('B')\nrequire('C')");
    files_.add_unreadable("/p/B.lua");
    add("C.lua", "return 1");

    auto result = discover("A.lua");
    ASSERT_TRUE(result.ok);
    const auto& g = result.graph;
    EXPECT_EQ(g.at("/p/A.lua").state, graph::NodeState::Resolved);
    EXPECT_EQ(g.at("/p/B.lua").state, graph::NodeState::Error);
    EXPECT_FALSE(g.at("/p/B.lua").error.empty());
    EXPECT_TRUE(g.at("/p/B.lua").dependencies.empty());
    EXPECT_EQ(g.at("/p/C.lua").state, graph::NodeState::Resolved);
    EXPECT_EQ(g.statistics().error_nodes, 1u);
}

TEST_F(DiscoveryTest, TST_DISC_006_RootNotFound) {
    auto result = discover("absent.lua");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.error.kind, DiscoveryErrorKind::RootNotFound);
    EXPECT_EQ(result.graph.node_count(), 0u);
    EXPECT_EQ(files_.read_count(), 0u);
}

TEST_F(DiscoveryTest, TST_DISC_007_RootUnreadable_AbortsRun) {
    files_.add_unreadable("/p/A.lua", io::ReadErrorKind::Timeout);

    auto result = discover("A.lua");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, DiscoveryErrorKind::RootUnreadable);
    EXPECT_EQ(result.error.path, "/p/A.lua");
    EXPECT_EQ(result.graph.node_count(), 0u);
    EXPECT_STREQ(discovery_error_kind_to_string(result.error.kind), "RootUnreadable");
}

TEST_F(DiscoveryTest, TST_DISC_008_DynamicAndMalformed_Counted) {
    add("A.lua", "require(name)\nrequire('bad name')\nrequire('B')\nrequire('mods.' .. x)");
    add("B.lua", "");

    auto result = discover("A.lua");
    ASSERT_TRUE(result.ok);
    const auto& a = result.graph.at("/p/A.lua");
    EXPECT_EQ(a.dynamic_references, 2u);
    EXPECT_EQ(a.malformed_references, 1u);
    EXPECT_EQ(a.raw_references, (Keys{"B"}));
    EXPECT_EQ(result.graph.node_count(), 2u);
}

// ==============================================================================
// TST-DISC-009..011: дубликаты, петли, max_depth
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_009_DuplicateReferences_SingleEdge) {
    add("A.lua", "require('B')\nrequire 'B'\nrequire [[B]]");
    add("B.lua", "");

    auto result = discover("A.lua");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.graph.edge_count(), 1u);
    EXPECT_EQ(result.graph.at("/p/A.lua").raw_references, (Keys{"B", "B", "B"}));
    EXPECT_EQ(files_.read_count(), 2u);
}

TEST_F(DiscoveryTest, TST_DISC_010_SelfRequire) {
    add("A.lua", "require('A')");

    auto result = discover("A.lua");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.graph.node_count(), 1u);
    EXPECT_TRUE(result.graph.at("/p/A.lua").has_self_loop());
    EXPECT_EQ(files_.read_count(), 1u);
}

TEST_F(DiscoveryTest, TST_DISC_011_MaxDepth_StopsExpansion) {
    add("A.lua", "require('B')");
    add("B.lua", "require('C')");
    add("C.lua", "require('D')");
    add("D.lua", "");

    DiscoveryOptions options;
    options.max_depth = 1;
    auto result = discover("A.lua", options);
    ASSERT_TRUE(result.ok);

    const auto& g = result.graph;
    EXPECT_EQ(g.node_count(), 3u);
    EXPECT_EQ(g.at("/p/A.lua").state, graph::NodeState::Resolved);
    EXPECT_EQ(g.at("/p/B.lua").state, graph::NodeState::Resolved);
    EXPECT_EQ(g.at("/p/C.lua").state, graph::NodeState::Unresolved);
    EXPECT_FALSE(g.at("/p/C.lua").content);
    EXPECT_FALSE(g.contains("/p/D.lua"));
    EXPECT_EQ(files_.read_count(), 2u);
    EXPECT_EQ(g.statistics().unresolved_nodes, 1u);
}

TEST_F(DiscoveryTest, TST_DISC_012_MaxDepthZero_OnlyRoot) {
    add("A.lua", "require('B')");
    add("B.lua", "");

    DiscoveryOptions options;
    options.max_depth = 0;
    auto result = discover("A.lua", options);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.graph.at("/p/B.lua").state, graph::NodeState::Unresolved);
    EXPECT_EQ(files_.read_count(), 1u);
}

// ==============================================================================
// TST-DISC-013..014: потоки и отмена
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_013_WorkerCount_DoesNotChangeResult) {
    add("main.lua", "require 'ui'\nrequire 'net'\nrequire 'core'\nrequire 'missing'");
    add("ui.lua", "require 'core'\nrequire 'widgets.button'\nrequire 'widgets.list'");
    add("net.lua", "require 'core'\nrequire 'net.proto'");
    add("net/proto.lua", "require 'net'\nrequire(dyn)");
    add("core.lua", "require 'util'");
    add("util.lua", "");
    add("widgets/button.lua", "require 'util'\nrequire 'widgets.list'");
    add("widgets/list.lua", "require 'ui'");

    auto single = discover("main.lua");
    ASSERT_TRUE(single.ok);
    const auto single_reads = files_.read_count();
    EXPECT_EQ(single_reads, single.graph.node_count());

    DiscoveryOptions options;
    options.workers = 4;
    auto parallel = discover("main.lua", options);
    ASSERT_TRUE(parallel.ok);
    EXPECT_EQ(files_.read_count() - single_reads, parallel.graph.node_count());

    ASSERT_EQ(single.graph.node_count(), parallel.graph.node_count());
    for (std::size_t i = 0; i < single.graph.nodes().size(); ++i) {
        const auto& a = single.graph.nodes()[i];
        const auto& b = parallel.graph.nodes()[i];
        EXPECT_EQ(a.key, b.key);
        EXPECT_EQ(a.state, b.state);
        EXPECT_EQ(a.dependencies, b.dependencies);
        EXPECT_EQ(a.raw_references, b.raw_references);
        EXPECT_EQ(a.unresolved, b.unresolved);
        EXPECT_EQ(a.depth, b.depth);
    }

    auto l1 = graph::linearize(single.graph.snapshot());
    auto l2 = graph::linearize(parallel.graph.snapshot());
    EXPECT_EQ(l1.order, l2.order);
    EXPECT_EQ(l1.cycles.size(), 2u);
}

TEST_F(DiscoveryTest, TST_DISC_014_Cancelled_DiscardsGraph) {
    add("A.lua", "require('B')");
    add("B.lua", "");

    CancellationToken token;
    token.cancel();
    auto result = discover("A.lua", {}, &token);
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.graph.node_count(), 0u);
    EXPECT_EQ(files_.read_count(), 0u);

    token.reset();
    EXPECT_TRUE(discover("A.lua", {}, &token).ok);
}

// ==============================================================================
// TST-DISC-015: диагностика через Writer
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_015_UnresolvedReference_LoggedAsWarning) {
    add("A.lua", "require('missing.module')");

    const auto log_path = std::filesystem::temp_directory_path() /
                          ("luarestore_discovery_log_" + std::to_string(
#ifdef _WIN32
                                                             GetCurrentProcessId()
#else
                                                             getpid()
#endif
                                                                 ) +
                           ".log");
    std::error_code ec;
    std::filesystem::remove(log_path, ec);
    {
        output::OutputConfig config;
        config.log_path = log_path;
        output::Writer writer(config);

        resolve::PathResolver resolver(files_, {"/p"}, {".lua"});
        DiscoveryDriver driver(files_, resolver, {}, &writer);
        ASSERT_TRUE(driver.run("/p/A.lua").ok);
    }

    std::ifstream in(log_path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("[!] unresolved module 'missing.module' required by /p/A.lua (line 1)"),
              std::string::npos)
        << ss.str();
    std::filesystem::remove(log_path, ec);
}

// ==============================================================================
// TST-DISC-016..017: пакеты потоков
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_016_WorkerException_PropagatesAfterJoin) {
    add("A.lua", "require 'B'\nrequire 'C'\nrequire 'D'");
    add("B.lua", "");
    add("C.lua", "");
    add("D.lua", "");

    ThrowingFileSource files(files_, "/p/C.lua");
    resolve::PathResolver resolver(files, {"/p"}, {".lua"});
    DiscoveryOptions options;
    options.workers = 3;
    DiscoveryDriver driver(files, resolver, options);

    EXPECT_THROW(driver.run("/p/A.lua"), std::runtime_error);
}

TEST_F(DiscoveryTest, TST_DISC_017_WideFanOut_ManyWorkers) {
    std::string root;
    for (int i = 0; i < 200; ++i) {
        const std::string name = "m" + std::to_string(i);
        root += "require '" + name + "'\n";
        add(name + ".lua", "require 'shared'");
    }
    add("root.lua", root);
    add("shared.lua", "");

    DiscoveryOptions options;
    options.workers = 64;
    auto result = discover("root.lua", options);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.graph.node_count(), 202u);
    EXPECT_EQ(result.graph.edge_count(), 400u);

    const auto lin = graph::linearize(result.graph.snapshot());
    EXPECT_EQ(lin.order.front(), "/p/shared.lua");
    EXPECT_EQ(lin.order[1], "/p/m0.lua");
    EXPECT_EQ(lin.order.back(), "/p/root.lua");
    EXPECT_TRUE(lin.cycles.empty());
}

}  // namespace luarestore::discovery::test
