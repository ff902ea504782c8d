// File: tests/unit/test_tools_cli.cpp
// Purpose: Verify command-line parsing, output creation and the end-to-end
//          pipeline of the fmtlint tool.
// Key invariants: Output files are never overwritten; a file with errors
//                 produces no output and exit status 1.
// Ownership/Lifetime: Creates and removes files under the system temp dir.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "cli.hpp"
#include "driver.hpp"
#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace fmtlint::tools;
namespace fs = std::filesystem;

namespace
{

CliParseResult parse(std::vector<std::string> words, CliOptions &opts)
{
    std::vector<char *> argv;
    for (auto &w : words)
        argv.push_back(w.data());
    return parseCli(ArgvView{static_cast<int>(argv.size()), argv.data()}, opts);
}

/// @brief Unique path in the temp directory, removed on destruction.
class TempPath
{
  public:
    explicit TempPath(const std::string &stem)
    {
        static int counter = 0;
        path_ = fs::temp_directory_path() /
                ("fmtlint_test_" + stem + "_" + std::to_string(::testing::UnitTest::GetInstance()
                                                                   ->random_seed()) +
                 "_" + std::to_string(counter++));
        std::error_code ec;
        fs::remove(path_, ec);
    }

    ~TempPath()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string str() const
    {
        return path_.string();
    }

  private:
    fs::path path_;
};

void writeFile(const std::string &path, const std::string &text)
{
    std::ofstream out(path, std::ios::binary);
    out << text;
}

std::string readFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(Cli, InputOnly)
{
    CliOptions opts;
    EXPECT_EQ(parse({"main.c"}, opts), CliParseResult::Parsed);
    EXPECT_EQ(opts.inputPath, "main.c");
    EXPECT_TRUE(opts.optimizePath.empty());
    EXPECT_TRUE(opts.typecastPath.empty());
}

TEST(Cli, OutputsInBothForms)
{
    CliOptions opts;
    EXPECT_EQ(parse({"--optimize", "o.c", "main.c", "--typecast=t.c"}, opts),
              CliParseResult::Parsed);
    EXPECT_EQ(opts.inputPath, "main.c");
    EXPECT_EQ(opts.optimizePath, "o.c");
    EXPECT_EQ(opts.typecastPath, "t.c");
}

TEST(Cli, RejectsMalformedCommandLines)
{
    CliOptions none;
    EXPECT_EQ(parse({}, none), CliParseResult::Error);

    CliOptions twoInputs;
    EXPECT_EQ(parse({"a.c", "b.c"}, twoInputs), CliParseResult::Error);

    CliOptions missingValue;
    EXPECT_EQ(parse({"main.c", "--optimize"}, missingValue), CliParseResult::Error);

    CliOptions emptyValue;
    EXPECT_EQ(parse({"main.c", "--typecast="}, emptyValue), CliParseResult::Error);

    CliOptions duplicate;
    EXPECT_EQ(parse({"main.c", "--optimize", "a", "--optimize=b"}, duplicate),
              CliParseResult::Error);

    CliOptions unknown;
    EXPECT_EQ(parse({"main.c", "-x"}, unknown), CliParseResult::Error);
}

TEST(Cli, HelpAndVersionNeedNoInput)
{
    CliOptions help;
    EXPECT_EQ(parse({"--help"}, help), CliParseResult::Parsed);
    EXPECT_TRUE(help.showHelp);

    CliOptions shortHelp;
    EXPECT_EQ(parse({"-h"}, shortHelp), CliParseResult::Parsed);
    EXPECT_TRUE(shortHelp.showHelp);

    CliOptions version;
    EXPECT_EQ(parse({"--version"}, version), CliParseResult::Parsed);
    EXPECT_TRUE(version.showVersion);
}

TEST(Cli, LoneDashIsAnInputPath)
{
    CliOptions opts;
    EXPECT_EQ(parse({"-"}, opts), CliParseResult::Parsed);
    EXPECT_EQ(opts.inputPath, "-");
}

TEST(SourceLoader, LoadsWholeFile)
{
    TempPath src("load");
    writeFile(src.str(), "a\r\nb\n");
    auto loaded = loadSourceFile(src.str());
    ASSERT_TRUE(loaded.isOk());
    EXPECT_EQ(loaded.value(), "a\r\nb\n");
}

TEST(SourceLoader, MissingFileIsDiagnosed)
{
    TempPath src("missing");
    auto loaded = loadSourceFile(src.str());
    ASSERT_FALSE(loaded.isOk());
    EXPECT_EQ(loaded.error().message, "failed reading input at " + src.str());
}

TEST(SourceLoader, WriteNewFileAppendsNewline)
{
    TempPath out("write");
    EXPECT_FALSE(writeNewFile(out.str(), "int x;", "optimize").has_value());
    EXPECT_EQ(readFile(out.str()), "int x;\n");
}

TEST(SourceLoader, WriteNewFileRefusesExisting)
{
    TempPath out("exists");
    writeFile(out.str(), "keep");
    auto diag = writeNewFile(out.str(), "new", "typecast");
    ASSERT_TRUE(diag.has_value());
    EXPECT_EQ(diag->message,
              "Failed creating output for --typecast: " + out.str() + " already exists");
    EXPECT_EQ(readFile(out.str()), "keep");
}

TEST(Driver, WritesBothRenderings)
{
    TempPath src("ok_src");
    TempPath optimized("ok_opt");
    TempPath typecast("ok_cast");
    writeFile(src.str(), "printf(\"%d\\n\", x);");

    CliOptions opts;
    opts.inputPath = src.str();
    opts.optimizePath = optimized.str();
    opts.typecastPath = typecast.str();

    std::ostringstream err;
    EXPECT_EQ(runPipeline(opts, err), 0);
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(readFile(optimized.str()),
              "safe_printf(4, \"\", (void*) &(x), fmt_int, \"\\n\");\n");
    EXPECT_EQ(readFile(typecast.str()), "printf(\"%d\\n\", (int) (x));\n");
}

TEST(Driver, ValidationOnlyWritesNothing)
{
    TempPath src("check_src");
    writeFile(src.str(), "int main(void) { return 0; }\n");

    CliOptions opts;
    opts.inputPath = src.str();

    std::ostringstream err;
    EXPECT_EQ(runPipeline(opts, err), 0);
    EXPECT_TRUE(err.str().empty());
}

TEST(Driver, ReportsSourceErrors)
{
    TempPath src("bad_src");
    TempPath optimized("bad_opt");
    writeFile(src.str(), "printf(\"%d %d\", a);\n");

    CliOptions opts;
    opts.inputPath = src.str();
    opts.optimizePath = optimized.str();

    std::ostringstream err;
    EXPECT_EQ(runPipeline(opts, err), 1);
    EXPECT_NE(err.str().find("Source code contains errors."), std::string::npos);
    EXPECT_NE(err.str().find("error[F0004]"), std::string::npos);
    EXPECT_NE(err.str().find("1 too many specifiers"), std::string::npos);
    EXPECT_FALSE(fs::exists(optimized.str()));
}

TEST(Driver, MissingInputFails)
{
    TempPath src("no_src");

    CliOptions opts;
    opts.inputPath = src.str();

    std::ostringstream err;
    EXPECT_EQ(runPipeline(opts, err), 1);
    EXPECT_NE(err.str().find("error: failed reading input at"), std::string::npos);
}

TEST(Driver, ExistingOutputFails)
{
    TempPath src("dup_src");
    TempPath typecast("dup_cast");
    writeFile(src.str(), "puts(\"hi\");\n");
    writeFile(typecast.str(), "old");

    CliOptions opts;
    opts.inputPath = src.str();
    opts.typecastPath = typecast.str();

    std::ostringstream err;
    EXPECT_EQ(runPipeline(opts, err), 1);
    EXPECT_NE(err.str().find("already exists"), std::string::npos);
    EXPECT_EQ(readFile(typecast.str()), "old");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
