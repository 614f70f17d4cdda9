// File: tests/tools/ConsoleServicesTests.cpp
// Purpose: Verify the console engine services behind the novella binary.
// Key invariants: Lint counts structural problems and report failures; an empty basedir
//                 resolves to the executable's directory; removing absent persistent
//                 data succeeds.
// Ownership/Lifetime: Each test works in its own temporary directory.

#include "console_services.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <optional>
#include <string>
#include <system_error>

using namespace novella;
namespace fs = std::filesystem;

namespace
{

class ConsoleServicesTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / (std::string("novella_") + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    static void touch(const fs::path &file)
    {
        fs::create_directories(file.parent_path());
        std::ofstream(file) << "label start:\n    return\n";
    }

    fs::path root_;
    std::ostringstream out_;
    std::ostringstream err_;
};

} // namespace

TEST_F(ConsoleServicesTest, LintReportsMissingProject)
{
    tools::ConsoleEngineServices services(out_, err_, root_);
    cli::LintRequest request;
    request.basedir = (root_ / "absent").string();

    EXPECT_EQ(services.runLint(request), 1u);
    EXPECT_NE(out_.str().find("error: project directory not found"), std::string::npos);
}

TEST_F(ConsoleServicesTest, LintReportsMissingScripts)
{
    fs::create_directories(root_ / "game");
    tools::ConsoleEngineServices services(out_, err_, root_);
    cli::LintRequest request;
    request.basedir = root_.string();

    EXPECT_EQ(services.runLint(request), 1u);
    EXPECT_NE(out_.str().find("error: no .rpy scripts under"), std::string::npos);
}

TEST_F(ConsoleServicesTest, LintSucceedsAndWritesReportFile)
{
    touch(root_ / "game" / "scripts" / "script.rpy");
    tools::ConsoleEngineServices services(out_, err_, root_);
    cli::LintRequest request;
    request.basedir = root_.string();
    request.reportPath = (root_ / "lint.txt").string();

    EXPECT_EQ(services.runLint(request), 0u);
    EXPECT_TRUE(out_.str().empty());

    std::ifstream report(root_ / "lint.txt");
    std::stringstream contents;
    contents << report.rdbuf();
    EXPECT_NE(contents.str().find("Novella lint report for"), std::string::npos);
    EXPECT_NE(contents.str().find("note: lint is successful"), std::string::npos);
}

TEST_F(ConsoleServicesTest, UnlinkPersistentUsesDefaultSaveDirectory)
{
    const fs::path persistent = root_ / "game" / "saves" / "persistent";
    touch(persistent);

    cli::ParsedArgs args;
    args.basedir = root_.string();
    EXPECT_EQ(tools::saveDirectory(args, root_ / "unused"), root_ / "game" / "saves");

    tools::ConsoleEngineServices services(out_, err_, root_);
    EXPECT_TRUE(services.unlinkPersistent(args));
    EXPECT_FALSE(fs::exists(persistent));

    EXPECT_TRUE(services.unlinkPersistent(args));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ConsoleServicesTest, UnlinkPersistentHonorsSavedir)
{
    const fs::path persistent = root_ / "elsewhere" / "persistent";
    touch(persistent);

    cli::ParsedArgs args;
    args.savedir = (root_ / "elsewhere").string();
    tools::ConsoleEngineServices services(out_, err_, root_);
    EXPECT_TRUE(services.unlinkPersistent(args));
    EXPECT_FALSE(fs::exists(persistent));
}

TEST_F(ConsoleServicesTest, RecordsStartupSettings)
{
    tools::ConsoleEngineServices services(out_, err_, root_);
    services.setWarpSpec("script.rpy:3");
    services.setProfileDisplay(true);
    services.setShouldSavePersistent(false);

    EXPECT_EQ(services.settings().warpSpec, std::optional<std::string>("script.rpy:3"));
    EXPECT_TRUE(services.settings().profileDisplay);
    EXPECT_FALSE(services.settings().debugImageCache);
    EXPECT_FALSE(services.settings().savePersistent);
}

TEST_F(ConsoleServicesTest, EmptyBasedirUsesProjectDefault)
{
    touch(root_ / "game" / "script.rpy");
    tools::ConsoleEngineServices services(out_, err_, root_);

    EXPECT_EQ(services.runLint(cli::LintRequest{}), 0u);
    EXPECT_NE(out_.str().find("Novella lint report for " + root_.string()), std::string::npos);

    const fs::path persistent = root_ / "game" / "saves" / "persistent";
    touch(persistent);
    EXPECT_EQ(tools::saveDirectory(cli::ParsedArgs{}, root_), root_ / "game" / "saves");
    EXPECT_TRUE(services.unlinkPersistent(cli::ParsedArgs{}));
    EXPECT_FALSE(fs::exists(persistent));
}

TEST_F(ConsoleServicesTest, ExecutableDirectoryFromProgramName)
{
    const fs::path program = root_ / "bin" / "novella";
    EXPECT_EQ(tools::executableDirectory(program.string()), root_ / "bin");
    EXPECT_EQ(tools::executableDirectory((root_ / "bin" / ".." / "novella").string()), root_);
    EXPECT_EQ(tools::executableDirectory("novella"), fs::absolute("novella").parent_path());
    EXPECT_EQ(tools::projectDirectory("", root_), root_);
    EXPECT_EQ(tools::projectDirectory("proj", root_), fs::path("proj"));
}

TEST_F(ConsoleServicesTest, UnwritableReportCountsAsProblem)
{
    touch(root_ / "game" / "script.rpy");
    tools::ConsoleEngineServices services(out_, err_, root_);
    cli::LintRequest request;
    request.reportPath = (root_ / "missing-dir" / "lint.txt").string();

    EXPECT_EQ(services.runLint(request), 1u);
    EXPECT_NE(err_.str().find("lint: error: cannot write lint report"), std::string::npos);
    EXPECT_NE(out_.str().find("Novella lint report for"), std::string::npos);
    EXPECT_EQ(out_.str().find("lint is successful"), std::string::npos);
}
