#include "visual_studio_files.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

using namespace slnscan;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class VisualStudioFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(file_system_, current_directory()).WillByDefault(Return("/work"));
        ON_CALL(file_system_, file_exists(_)).WillByDefault(Return(true));
    }

    NiceMock<test::MockFileSystem> file_system_;
};

TEST_F(VisualStudioFilesTest, SortsFilesByExtension) {
    VisualStudioFiles files({"a/App.csproj", "a/Lib.VBPROJ", "a/Tool.fsproj", "a/Program.cs",
                             "a/Module.vb", "a/Script.fs", "a/All.sln"},
                            false, file_system_);

    ASSERT_EQ(files.csharp_project_files().size(), 1u);
    EXPECT_EQ(files.csharp_project_files()[0].name, "App");
    ASSERT_EQ(files.basic_project_files().size(), 1u);
    EXPECT_EQ(files.basic_project_files()[0].language, Language::Basic);
    EXPECT_EQ(files.fsharp_project_files().size(), 1u);
    EXPECT_EQ(files.csharp_source_files().size(), 1u);
    EXPECT_EQ(files.basic_source_files().size(), 1u);
    EXPECT_EQ(files.fsharp_source_files().size(), 1u);
    ASSERT_EQ(files.solution_files().size(), 1u);
    EXPECT_EQ(files.solution_files()[0].file().file_name, "All.sln");
}

TEST_F(VisualStudioFilesTest, SkipsUnsupportedExtensions) {
    EXPECT_CALL(file_system_, file_exists(_)).Times(0);

    VisualStudioFiles files({"readme.txt", "Makefile", "setup.vdproj"}, false, file_system_);

    EXPECT_TRUE(files.csharp_source_files().empty());
    EXPECT_TRUE(files.solution_files().empty());
}

TEST_F(VisualStudioFilesTest, ExpandsWildcardsInFileName) {
    EXPECT_CALL(file_system_, list_files("src", "*.cs", false))
        .WillOnce(Return(std::vector<std::string>{"src/A.cs", "src/B.cs"}));

    VisualStudioFiles files({"src/*.cs"}, false, file_system_);

    ASSERT_EQ(files.csharp_source_files().size(), 2u);
    EXPECT_EQ(files.csharp_source_files()[1].file.file_name, "B.cs");
}

TEST_F(VisualStudioFilesTest, RecursiveSearchIsPassedToListing) {
    EXPECT_CALL(file_system_, list_files("/work", "*.sln", true))
        .WillOnce(Return(std::vector<std::string>{"/work/one/One.sln", "/work/two/Two.sln"}));

    VisualStudioFiles files({"*.sln"}, true, file_system_);

    EXPECT_EQ(files.solution_files().size(), 2u);
}

TEST_F(VisualStudioFilesTest, ExpansionResultsAreFilteredByExtension) {
    EXPECT_CALL(file_system_, list_files("src", "App.*", false))
        .WillOnce(Return(std::vector<std::string>{"src/App.config", "src/App.csproj"}));

    VisualStudioFiles files({"src/App.*"}, false, file_system_);

    EXPECT_EQ(files.csharp_project_files().size(), 1u);
}

TEST_F(VisualStudioFilesTest, WildcardInDirectoryIsSkipped) {
    EXPECT_CALL(file_system_, list_files(_, _, _)).Times(0);

    VisualStudioFiles files({"src/*/App.csproj"}, false, file_system_);

    EXPECT_TRUE(files.csharp_project_files().empty());
}

TEST_F(VisualStudioFilesTest, MissingFileThrowsNotFound) {
    EXPECT_CALL(file_system_, file_exists("missing/App.csproj")).WillOnce(Return(false));

    EXPECT_THROW(VisualStudioFiles({"missing/App.csproj"}, false, file_system_), NotFoundError);
}

TEST_F(VisualStudioFilesTest, BlankPathThrows) {
    EXPECT_THROW(VisualStudioFiles({""}, false, file_system_), InvalidArgumentError);
    EXPECT_THROW(VisualStudioFiles({"  "}, false, file_system_), InvalidArgumentError);
}

TEST_F(VisualStudioFilesTest, SupportedExtensions) {
    EXPECT_TRUE(VisualStudioFiles::is_supported_extension(".sln"));
    EXPECT_TRUE(VisualStudioFiles::is_supported_extension(".CsProj"));
    EXPECT_FALSE(VisualStudioFiles::is_supported_extension(".vcxproj"));
    EXPECT_FALSE(VisualStudioFiles::is_supported_extension(""));
}

class VisualStudioFilesIntegrationTest : public test::TempDirectoryTest {};

TEST_F(VisualStudioFilesIntegrationTest, LoadsSolutionFoundByWildcard) {
    write_file("Solutions/SolutionFile.sln", test::sample_solution());
    write_file("Solutions/notes.txt", "not a solution");

    VisualStudioFiles files({path_of("Solutions/*.sln")});

    ASSERT_EQ(files.solution_files().size(), 1u);
    auto& solution = files.solution_files()[0];
    solution.load();
    EXPECT_EQ(solution.csharp_project_files().size(), 1u);
    EXPECT_EQ(solution.web_site_directories().size(), 1u);
}
