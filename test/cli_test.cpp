#include <gtest/gtest.h>
#include "cli.hpp"
#include "test_tables.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace vecanalogy;

// 测试命令行：输出格式、退出码、参数解析
class CommandLineTest : public ::testing::Test {
protected:
    void SetUp() override {
        WriteFile("cli_triangle.txt", testing_util::TriangleTableText());
        WriteFile("cli_analogy.txt", testing_util::AnalogyTableText());
        WriteFile("cli_bad.txt", "a 1 0\nb 1\nc 1 1\n");
        WriteFile("cli_dash.txt", "-lrb- 1 0\n-rrb- 0.9 0.1\nx 0 1\n");
        WriteFile("glove.6B.50d.txt", testing_util::TriangleTableText());
    }

    void TearDown() override {
        std::remove("cli_triangle.txt");
        std::remove("cli_analogy.txt");
        std::remove("cli_bad.txt");
        std::remove("cli_dash.txt");
        std::remove("glove.6B.50d.txt");
    }

    static void WriteFile(const char* name, const char* text) {
        std::ofstream file(name);
        file << text;
    }

    int Run(std::vector<std::string> args) {
        args.insert(args.begin(), "vecanalogy");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(&arg[0]);
        }
        argv.push_back(nullptr);

        out.str("");
        err.str("");
        return RunCommandLine(static_cast<int>(args.size()), argv.data(), out, err);
    }

    bool ErrContains(const std::string& text) const {
        return err.str().find(text) != std::string::npos;
    }

    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(CommandLineTest, ExpressionModeIsDefault) {
    EXPECT_EQ(Run({"-q", "cli_triangle.txt", "c", "-", "b"}), 0);
    EXPECT_EQ(out.str(), "a cosine similarity: 1.0000\n");
}

TEST_F(CommandLineTest, AverageWithTrailingEuclideanFlag) {
    EXPECT_EQ(Run({"-q", "--mode", "average", "cli_triangle.txt", "a", "b", "--euclidean"}), 0);
    EXPECT_EQ(out.str(), "c euclidean distance: 0.7071\n");
}

TEST_F(CommandLineTest, AverageWithTrailingCosineFlag) {
    EXPECT_EQ(Run({"-q", "-m", "average", "-M", "euclidean", "cli_triangle.txt", "a", "b", "--cosine"}), 0);
    EXPECT_EQ(out.str(), "c cosine similarity: 1.0000\n");
}

TEST_F(CommandLineTest, FileOptionMakesAllPositionalsTokens) {
    EXPECT_EQ(Run({"-q", "-f", "cli_triangle.txt", "c", "-", "b"}), 0);
    EXPECT_EQ(out.str(), "a cosine similarity: 1.0000\n");
}

TEST_F(CommandLineTest, DefaultTableOption) {
    EXPECT_EQ(Run({"-q", "-F", "a", "b", "--mode", "sum"}), 0);
    EXPECT_EQ(out.str(), "c cosine similarity: 1.0000\n");
}

TEST_F(CommandLineTest, TopKPrintsOneLinePerNeighbor) {
    EXPECT_EQ(Run({"-q", "-k", "2", "cli_triangle.txt", "a"}), 0);
    EXPECT_EQ(out.str(),
              "c cosine similarity: 0.7071\n"
              "b cosine similarity: 0.0000\n");
}

TEST_F(CommandLineTest, NoResultIsInformational) {
    EXPECT_EQ(Run({"-q", "cli_analogy.txt", "king", "-", "man", "+", "queen"}), 0);
    EXPECT_EQ(out.str(), "");
    EXPECT_TRUE(ErrContains("No nearest neighbor found."));
}

TEST_F(CommandLineTest, NoValidInputWordsIsInformational) {
    EXPECT_EQ(Run({"-q", "cli_analogy.txt", "foo", "+", "bar"}), 0);
    EXPECT_EQ(out.str(), "");
    EXPECT_TRUE(ErrContains("No valid input words"));
}

TEST_F(CommandLineTest, MissingFileExitsWithError) {
    EXPECT_EQ(Run({"-q", "does_not_exist.txt", "a"}), 1);
    EXPECT_EQ(out.str(), "");
    EXPECT_TRUE(ErrContains("Error: Cannot open vector file: does_not_exist.txt"));
}

TEST_F(CommandLineTest, MalformedRowExitsWithErrorUnlessLenient) {
    EXPECT_EQ(Run({"-q", "cli_bad.txt", "a"}), 1);
    EXPECT_TRUE(ErrContains("cli_bad.txt:2:"));

    EXPECT_EQ(Run({"-q", "--lenient", "cli_bad.txt", "a"}), 0);
    EXPECT_EQ(out.str(), "c cosine similarity: 0.7071\n");
}

TEST_F(CommandLineTest, DashedWordsAfterDoubleDash) {
    EXPECT_EQ(Run({"-q", "cli_dash.txt", "--", "-lrb-"}), 0);
    EXPECT_EQ(out.str(), "-rrb- cosine similarity: 0.9939\n");
}

TEST_F(CommandLineTest, NumericOptionsRejectTrailingJunk) {
    EXPECT_EQ(Run({"-q", "-p", "3abc", "cli_triangle.txt", "a"}), 1);
    EXPECT_TRUE(ErrContains("--threads"));
    EXPECT_EQ(out.str(), "");

    EXPECT_EQ(Run({"-q", "-k", "0", "cli_triangle.txt", "a"}), 1);
    EXPECT_EQ(Run({"-q", "--dim", "two", "cli_triangle.txt", "a"}), 1);
}

TEST_F(CommandLineTest, UnknownModeOrMetricIsUsageError) {
    EXPECT_EQ(Run({"-q", "--mode", "median", "cli_triangle.txt", "a"}), 1);
    EXPECT_TRUE(ErrContains("unknown mode 'median'"));
    EXPECT_EQ(Run({"-q", "--metric", "manhattan", "cli_triangle.txt", "a"}), 1);
    EXPECT_TRUE(ErrContains("unknown metric 'manhattan'"));
}

TEST_F(CommandLineTest, MissingWordsIsUsageError) {
    EXPECT_EQ(Run({"-q", "cli_triangle.txt"}), 1);
    EXPECT_TRUE(ErrContains("at least one word"));
}

TEST_F(CommandLineTest, HelpGoesToStdout) {
    EXPECT_EQ(Run({"--help"}), 0);
    EXPECT_NE(out.str().find("Usage:"), std::string::npos);
    EXPECT_NE(out.str().find("-- -lrb-"), std::string::npos);
}
