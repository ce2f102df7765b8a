#include "parsers/web_site_scanner.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

using namespace slnscan;
using ::testing::NiceMock;
using ::testing::Return;

TEST(WebSiteDirectoryTest, RejectsBlankNameOrPath) {
    EXPECT_THROW(make_web_site_directory("", "."), InvalidArgumentError);
    EXPECT_THROW(make_web_site_directory(" ", "."), InvalidArgumentError);
    EXPECT_THROW(make_web_site_directory("WebSite", ""), InvalidArgumentError);
    EXPECT_THROW(make_web_site_directory("WebSite", "\t"), InvalidArgumentError);
}

TEST(WebSiteDirectoryTest, DropsOneTrailingSeparator) {
    EXPECT_EQ(make_web_site_directory("WebSite", "sites\\WebSite\\").path, "sites/WebSite");
    EXPECT_EQ(make_web_site_directory("WebSite", "sites/WebSite").path, "sites/WebSite");
    EXPECT_EQ(make_web_site_directory("Root", "/").path, "/");
    EXPECT_EQ(make_web_site_directory("WebSite", "sites\\WebSite\\"),
              make_web_site_directory("WebSite", "sites\\WebSite"));
}

TEST(WebSiteScannerTest, CollectsBasicAndCSharpSourcesRecursively) {
    NiceMock<test::MockFileSystem> file_system;
    ON_CALL(file_system, current_directory()).WillByDefault(Return("/work"));
    EXPECT_CALL(file_system, directory_exists("site")).WillOnce(Return(true));
    EXPECT_CALL(file_system, list_files("site", "*.vb", true))
        .WillOnce(Return(std::vector<std::string>{}));
    EXPECT_CALL(file_system, list_files("site", "*.cs", true))
        .WillOnce(Return(std::vector<std::string>{"site/Default.aspx.cs", "site/App_Code/Util.cs"}));

    WebSiteDirectory site = make_web_site_directory("WebSite", "site");
    load_web_site_directory(site, file_system);

    EXPECT_TRUE(site.basic_source_files.empty());
    ASSERT_EQ(site.csharp_source_files.size(), 2u);
    EXPECT_EQ(site.csharp_source_files[0].file.file_name, "Default.aspx.cs");
    EXPECT_EQ(site.csharp_source_files[1].file.directory, "site/App_Code");
    EXPECT_EQ(site.csharp_source_files[1].language, Language::CSharp);
}

TEST(WebSiteScannerTest, MissingDirectoryThrowsNotFound) {
    NiceMock<test::MockFileSystem> file_system;
    EXPECT_CALL(file_system, directory_exists("gone")).WillOnce(Return(false));
    EXPECT_CALL(file_system, list_files(::testing::_, ::testing::_, ::testing::_)).Times(0);

    WebSiteDirectory site = make_web_site_directory("Gone", "gone");
    EXPECT_THROW(load_web_site_directory(site, file_system), NotFoundError);
}

class WebSiteScannerIntegrationTest : public test::TempDirectoryTest {};

TEST_F(WebSiteScannerIntegrationTest, ScansDirectoryTree) {
    write_file("WebSite/Default.aspx", "<%@ Page %>");
    write_file("WebSite/Default.aspx.cs", "public partial class _Default {}");
    write_file("WebSite/App_Code/Helpers.vb", "Module Helpers\nEnd Module");
    write_file("WebSite/App_Code/Data/Repository.cs", "class Repository {}");

    WebSiteDirectory site = make_web_site_directory("WebSite", path_of("WebSite"));
    load_web_site_directory(site);

    ASSERT_EQ(site.basic_source_files.size(), 1u);
    EXPECT_EQ(site.basic_source_files[0].file.file_name, "Helpers.vb");
    ASSERT_EQ(site.csharp_source_files.size(), 2u);

    // Rescanning replaces the previous lists
    load_web_site_directory(site);
    EXPECT_EQ(site.basic_source_files.size(), 1u);
    EXPECT_EQ(site.csharp_source_files.size(), 2u);
}
