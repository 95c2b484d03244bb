#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "driver.hpp"
#include "file.hpp"

namespace fs = std::filesystem;
using jack::driver::analyze;
using jack::driver::analyze_all;
using jack::driver::collect_inputs;
using jack::driver::Options;

namespace
{
const char *const EMPTY_CLASS = "class A { }";

class DriverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("jack_driver_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        error_set.clear();
    }

    void TearDown() override
    {
        fs::remove_all(dir);
        error_set.clear();
    }

    fs::path put(const std::string &name, const std::string &text)
    {
        write_output(dir / name, text);
        return dir / name;
    }

    static std::string errors()
    {
        std::ostringstream os;
        output_errors(os);
        return os.str();
    }

    fs::path dir;
};
} // namespace

TEST_F(DriverTest, WritesIndentedTreeBesideInput)
{
    analyze(put("A.jack", "class A { field int x; }"), Options{});

    EXPECT_EQ(read_source(dir / "A.xml"),
              "<class>\n"
              "  <keyword>class</keyword>\n"
              "  <identifier>A</identifier>\n"
              "  <symbol>{</symbol>\n"
              "  <classVarDec>\n"
              "    <keyword>field</keyword>\n"
              "    <keyword>int</keyword>\n"
              "    <identifier>x</identifier>\n"
              "    <symbol>;</symbol>\n"
              "  </classVarDec>\n"
              "  <symbol>}</symbol>\n"
              "</class>\n");
    EXPECT_FALSE(fs::exists(dir / "AT.xml"));
}

TEST_F(DriverTest, TokenListingOnRequest)
{
    Options options;
    options.tokens = true;
    analyze(put("A.jack", EMPTY_CLASS), options);

    EXPECT_EQ(read_source(dir / "AT.xml"),
              "<tokens>\n"
              "<keyword>class</keyword>\n"
              "<identifier>A</identifier>\n"
              "<symbol>{</symbol>\n"
              "<symbol>}</symbol>\n"
              "</tokens>\n");
    EXPECT_TRUE(fs::exists(dir / "A.xml"));
}

TEST_F(DriverTest, CompactTree)
{
    Options options;
    options.compact = true;
    analyze(put("A.jack", EMPTY_CLASS), options);

    EXPECT_EQ(read_source(dir / "A.xml"),
              "<class><keyword>class</keyword><identifier>A</identifier>"
              "<symbol>{</symbol><symbol>}</symbol></class>\n");
}

TEST_F(DriverTest, OutputDirectoryOption)
{
    Options options;
    options.out_dir = dir / "out";
    fs::create_directories(options.out_dir);
    analyze(put("A.jack", EMPTY_CLASS), options);

    EXPECT_TRUE(fs::exists(dir / "out" / "A.xml"));
    EXPECT_FALSE(fs::exists(dir / "A.xml"));
}

TEST_F(DriverTest, DirectoryWithOneBrokenFile)
{
    const auto good = put("A.jack", EMPTY_CLASS);
    const auto bad = put("B.jack", "class B {\n  static int\n}");
    put("notes.txt", "not jack");

    const auto inputs = collect_inputs(dir);
    ASSERT_EQ(inputs.size(), 2u);
    EXPECT_EQ(inputs[0], good);
    EXPECT_EQ(inputs[1], bad);

    Options options;
    options.tokens = true;
    std::ostringstream log;
    EXPECT_EQ(analyze_all(dir, options, log), 1);

    EXPECT_TRUE(fs::exists(dir / "A.xml"));
    EXPECT_TRUE(fs::exists(dir / "AT.xml"));
    EXPECT_FALSE(fs::exists(dir / "B.xml"));
    EXPECT_EQ(log.str(), "analyzed " + good.string() + "\n");
    EXPECT_EQ(errors(), bad.string() + ":3: expected identifier but found symbol '}'\n");
}

TEST_F(DriverTest, CleanRunExitsZero)
{
    std::ostringstream log;
    EXPECT_EQ(analyze_all(put("A.jack", EMPTY_CLASS), Options{}, log), 0);
    EXPECT_TRUE(error_set.empty());
}

TEST_F(DriverTest, UnreadableInputIsReported)
{
    const auto missing = dir / "Missing.jack";
    std::ostringstream log;
    EXPECT_EQ(analyze_all(missing, Options{}, log), 1);
    EXPECT_EQ(errors(), missing.string() + ":0: cannot open " + missing.string() + "\n");
}

TEST_F(DriverTest, DirectoryWithoutSources)
{
    put("notes.txt", "not jack");
    std::ostringstream log;
    EXPECT_EQ(analyze_all(dir, Options{}, log), 1);
    EXPECT_EQ(errors(), dir.string() + ":0: no .jack files found\n");
}

TEST_F(DriverTest, ErrorsSortedByFileThenLine)
{
    error_report("b.jack", 2, "second");
    error_report("a.jack", 9, "only");
    error_report("b.jack", 1, "first");
    EXPECT_EQ(errors(), "a.jack:9: only\nb.jack:1: first\nb.jack:2: second\n");
}
