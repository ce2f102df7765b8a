#include "common/file_system.hpp"
#include "common/string_utils.hpp"
#include "test_helpers.hpp"

using namespace slnscan;

namespace fs = std::filesystem;

TEST(WildcardTest, HasWildcard) {
    EXPECT_TRUE(has_wildcard("*.sln"));
    EXPECT_TRUE(has_wildcard("App?.csproj"));
    EXPECT_FALSE(has_wildcard("App.csproj"));
    EXPECT_FALSE(has_wildcard(""));
}

TEST(WildcardTest, AddAsterisk) {
    EXPECT_EQ(add_asterisk(".cs"), "*.cs");
}

TEST(WildcardTest, MatchesWildcard) {
    EXPECT_TRUE(matches_wildcard("App.csproj", "*.csproj"));
    EXPECT_TRUE(matches_wildcard("App.CSPROJ", "*.csproj"));
    EXPECT_TRUE(matches_wildcard("App1.cs", "App?.cs"));
    EXPECT_FALSE(matches_wildcard("App12.cs", "App?.cs"));
    EXPECT_FALSE(matches_wildcard("Appxcs", "App.cs"));
    EXPECT_FALSE(matches_wildcard("App.csproj", "*.cs"));
    EXPECT_TRUE(matches_wildcard("a+b(1).cs", "a+b(*).cs"));
    EXPECT_TRUE(matches_wildcard("Site.Master.cs", "*.cs"));
}

TEST(PathTest, CombineConvertsWindowsSeparators) {
    EXPECT_EQ(combine_path("/sln", "App\\App.csproj"), (fs::path("/sln") / "App" / "App.csproj").string());
    EXPECT_EQ(combine_path("/sln/src", "..\\lib\\Lib.csproj"), "/sln/src/../lib/Lib.csproj");
}

TEST(PathTest, CombineKeepsRelativePartAsWritten) {
    EXPECT_EQ(combine_path("/work", "http://localhost/WebSite"), "/work/http://localhost/WebSite");
    EXPECT_EQ(combine_path("/work", "./App//App.csproj"), "/work/./App//App.csproj");
}

TEST(PathTest, CombineKeepsAbsolutePaths) {
    EXPECT_EQ(combine_path("/sln", "/other/App.csproj"), fs::path("/other/App.csproj").string());
}

TEST(StringUtilsTest, TrimAndCompare) {
    EXPECT_EQ(trim(" \tvalue\r\n"), "value");
    EXPECT_EQ(trim("   "), "");
    EXPECT_TRUE(is_blank(" \t"));
    EXPECT_TRUE(starts_with("ProjectSection", "Project"));
    EXPECT_FALSE(starts_with("Proj", "Project"));
    EXPECT_TRUE(equals_ignore_case("E24C65DC", "e24c65dc"));
    EXPECT_TRUE(ends_with_ignore_case("Class1.CS", ".cs"));
    EXPECT_FALSE(ends_with_ignore_case("cs", ".cs"));
}

class DiskFileSystemTest : public test::TempDirectoryTest {};

TEST_F(DiskFileSystemTest, ExistenceChecks) {
    std::string file = write_file("App/App.csproj", "<Project />");
    const auto& file_system = DiskFileSystem::instance();

    EXPECT_TRUE(file_system.file_exists(file));
    EXPECT_FALSE(file_system.file_exists(path_of("App")));
    EXPECT_TRUE(file_system.directory_exists(path_of("App")));
    EXPECT_FALSE(file_system.directory_exists(file));
    EXPECT_FALSE(file_system.file_exists(path_of("missing.sln")));
}

TEST_F(DiskFileSystemTest, ListFilesTopLevelAndRecursive) {
    write_file("b.cs", "");
    write_file("a.cs", "");
    write_file("c.vb", "");
    write_file("sub/d.cs", "");
    const auto& file_system = DiskFileSystem::instance();

    auto top = file_system.list_files(dir_.string(), "*.cs", false);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(fs::path(top[0]).filename(), "a.cs");
    EXPECT_EQ(fs::path(top[1]).filename(), "b.cs");

    auto all = file_system.list_files(dir_.string(), "*.cs", true);
    EXPECT_EQ(all.size(), 3u);

    EXPECT_TRUE(file_system.list_files(path_of("missing"), "*.cs", true).empty());
}

TEST_F(DiskFileSystemTest, UnreadableSubdirectoryDoesNotAbortListing) {
    write_file("a.cs", "");
    write_file("locked/b.cs", "");
    fs::path locked = dir_ / "locked";
    fs::permissions(locked, fs::perms::none);

    std::vector<std::string> files;
    EXPECT_NO_THROW(files = DiskFileSystem::instance().list_files(dir_.string(), "*.cs", true));

    fs::permissions(locked, fs::perms::owner_all);
    ASSERT_FALSE(files.empty());
    EXPECT_EQ(fs::path(files[0]).filename(), "a.cs");
}

TEST_F(DiskFileSystemTest, DanglingSymlinkIsNotListed) {
    write_file("a.cs", "");
    std::error_code ec;
    fs::create_symlink(dir_ / "missing.cs", dir_ / "broken.cs", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks not supported: " << ec.message();
    }

    auto files = DiskFileSystem::instance().list_files(dir_.string(), "*.cs", false);

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(fs::path(files[0]).filename(), "a.cs");
}
