// ==============================================================================
// test_resolver_gtest.cpp - Тесты разрешения имён модулей (GoogleTest)
// ==============================================================================
//
// MOD-0007: resolve::resolver
// ADR-0008: GoogleTest
// ADR-0011: детерминизм (приоритет корней и расширений)
//
// Тесты: TST-RES-001..TST-RES-013
//
// ==============================================================================

#include "luarestore/file_source.hpp"
#include "luarestore/platform.hpp"
#include "luarestore/resolver.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace luarestore::resolve::test {

// ==============================================================================
// TST-RES-001..009: MemoryFileSource
// ==============================================================================

TEST(ResolverTest, TST_RES_001_CandidateRelativePath) {
    EXPECT_EQ(PathResolver::candidate_relative_path("a.b.c", ".lua"),
              std::filesystem::path("a") / "b" / "c.lua");
    EXPECT_EQ(PathResolver::candidate_relative_path("main", ".lua.unluac"),
              std::filesystem::path("main.lua.unluac"));
}

TEST(ResolverTest, TST_RES_002_Resolve_FindsFileUnderRoot) {
    io::MemoryFileSource files;
    files.add_file("/proj/net/http.lua", "");

    PathResolver resolver(files, {"/proj"}, {".lua"});
    auto result = resolver.resolve("net.http");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.status, ResolveStatus::Resolved);
    EXPECT_EQ(result.key, "/proj/net/http.lua");
    EXPECT_EQ(result.path, std::filesystem::path("/proj/net/http.lua"));
}

TEST(ResolverTest, TST_RES_003_RootPriority_FirstRootWins) {
    io::MemoryFileSource files;
    files.add_file("/z_first/util.lua", "");
    files.add_file("/a_second/util.lua", "");

    PathResolver resolver(files, {"/z_first", "/a_second"}, {".lua"});
    EXPECT_EQ(resolver.resolve("util").key, "/z_first/util.lua");
}

TEST(ResolverTest, TST_RES_004_ExtensionOrder_WithinRoot) {
    io::MemoryFileSource files;
    files.add_file("/proj/main.lua", "");
    files.add_file("/proj/main.lua.unluac", "");

    PathResolver resolver(files, {"/proj"}, {".lua.unluac", ".lua"});
    EXPECT_EQ(resolver.resolve("main").key, "/proj/main.lua.unluac");
}

TEST(ResolverTest, TST_RES_005_RootsBeforeExtensions) {
    // Корень важнее расширения: /a/m.lua находится раньше /b/m.lua.unluac
    io::MemoryFileSource files;
    files.add_file("/a/m.lua", "");
    files.add_file("/b/m.lua.unluac", "");

    PathResolver resolver(files, {"/a", "/b"}, {".lua.unluac", ".lua"});
    EXPECT_EQ(resolver.resolve("m").key, "/a/m.lua");
}

TEST(ResolverTest, TST_RES_006_NoMatch_Unresolved) {
    io::MemoryFileSource files;
    files.add_file("/proj/a.lua", "");

    PathResolver resolver(files, {"/proj"}, {".lua"});
    auto result = resolver.resolve("missing.module");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.status, ResolveStatus::Unresolved);
    EXPECT_TRUE(result.key.empty());
    EXPECT_STREQ(resolve_status_to_string(result.status), "unresolved");
}

TEST(ResolverTest, TST_RES_007_InvalidName_MalformedWithoutLookup) {
    io::MemoryFileSource files;
    files.add_file("/proj/a b.lua", "");

    PathResolver resolver(files, {"/proj"}, {".lua"});
    EXPECT_EQ(resolver.resolve("a b").status, ResolveStatus::Malformed);
    EXPECT_EQ(resolver.resolve("../etc").status, ResolveStatus::Malformed);
    EXPECT_EQ(resolver.resolve("").status, ResolveStatus::Malformed);
}

TEST(ResolverTest, TST_RES_008_Cache_HoldsResultsUntilCleared) {
    io::MemoryFileSource files;
    PathResolver resolver(files, {"/proj"}, {".lua"});

    EXPECT_EQ(resolver.resolve("late").status, ResolveStatus::Unresolved);
    EXPECT_EQ(resolver.cache_size(), 1u);

    // Файл появился, но кэш хранит прежний ответ до clear_cache()
    files.add_file("/proj/late.lua", "");
    EXPECT_EQ(resolver.resolve("late").status, ResolveStatus::Unresolved);

    resolver.clear_cache();
    EXPECT_EQ(resolver.cache_size(), 0u);
    EXPECT_EQ(resolver.resolve("late").status, ResolveStatus::Resolved);
}

TEST(ResolverTest, TST_RES_009_AddSearchRoot_IgnoresDuplicates) {
    io::MemoryFileSource files;
    files.add_file("/extra/x.lua", "");

    PathResolver resolver(files, {"/proj"}, {".lua"});
    EXPECT_FALSE(resolver.resolve("x"));

    resolver.add_search_root("/extra");
    resolver.add_search_root("/extra");
    resolver.add_search_root("/proj");
    EXPECT_EQ(resolver.search_roots().size(), 2u);
    EXPECT_TRUE(resolver.resolve("x"));
}

// ==============================================================================
// TST-RES-010..011: module_name_for
// ==============================================================================

TEST(ResolverTest, TST_RES_010_ModuleNameFor_UnderRoot) {
    io::MemoryFileSource files;
    PathResolver resolver(files, {"/proj/lua", "/proj"}, {".lua", ".lua.unluac"});

    EXPECT_EQ(resolver.module_name_for("/proj/lua/net/http.lua"), "net.http");
    EXPECT_EQ(resolver.module_name_for("/proj/main.lua.unluac"), "main");
}

TEST(ResolverTest, TST_RES_011_ModuleNameFor_OutsideRoots_UsesStem) {
    io::MemoryFileSource files;
    PathResolver resolver(files, {"/proj"}, {".lua.unluac"});
    EXPECT_EQ(resolver.module_name_for("/elsewhere/tool.lua.unluac"), "tool");
}

// ==============================================================================
// TST-RES-012..013: диск
// ==============================================================================

class ResolverDiskTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("luarestore_resolver_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path);
        file << "return {}\n";
    }
};

TEST_F(ResolverDiskTest, TST_RES_012_Disk_KeyIsCanonical) {
    create_file(test_dir_ / "lua" / "core" / "log.lua");
    io::DiskFileSource files(std::chrono::milliseconds(5000));

    // Корень с "..": ключ всё равно канонический
    PathResolver resolver(files, {test_dir_ / "lua" / ".." / "lua"}, {".lua"});
    auto result = resolver.resolve("core.log");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.key, platform::path_key(std::filesystem::canonical(
                              test_dir_ / "lua" / "core" / "log.lua")));
}

TEST_F(ResolverDiskTest, TST_RES_013_Disk_DirectoryIsNotModule) {
    std::filesystem::create_directories(test_dir_ / "pkg.lua");
    io::DiskFileSource files(std::chrono::milliseconds(5000));
    PathResolver resolver(files, {test_dir_}, {".lua"});
    EXPECT_EQ(resolver.resolve("pkg").status, ResolveStatus::Unresolved);
}

}  // namespace luarestore::resolve::test
