#include "common/exceptions.hpp"
#include "config.hpp"
#include "grader/compiler.hpp"
#include "gtest/gtest.h"
#include "test/helpers.hpp"

using namespace std;
using namespace std::filesystem;
using namespace bayview;

class BuildTest : public ::testing::Test {
protected:
    language_table languages;

    void SetUp() override {
        if (!has_program("g++")) GTEST_SKIP() << "g++ is not available";
    }

    void TearDown() override {
        COMPILE_TIME_LIMIT = 0;
    }
};

TEST_F(BuildTest, CompileTest) {
    auto request = make_request(language::CPP, "int main() { return 0; }\n", "", "");
    auto unit = materialize(request, languages.get(language::CPP), test_run_dir());
    executable_artifact artifact = build(unit, languages.get(language::CPP));
    ASSERT_EQ(artifact.command.size(), 1u);
    EXPECT_EQ(artifact.command[0], (unit.directory() / unit.token()).string());
    EXPECT_EQ(artifact.work_dir, unit.directory());
    EXPECT_TRUE(is_regular_file(artifact.command[0]));
}

TEST_F(BuildTest, CompileErrorTest) {
    auto request = make_request(language::CPP, "int main() { return 0 }\n", "", "");
    auto unit = materialize(request, languages.get(language::CPP), test_run_dir());
    try {
        build(unit, languages.get(language::CPP));
        FAIL() << "compilation should fail";
    } catch (compilation_error &ex) {
        EXPECT_FALSE(ex.error_log.empty());
        EXPECT_NE(ex.error_log.find("error"), string::npos);
    }
}

TEST_F(BuildTest, MissingCompilerTest) {
    language_table table;
    table.set_build_program(language::CPP, "bayview-no-such-compiler");
    auto request = make_request(language::CPP, "int main() {}\n", "", "");
    auto unit = materialize(request, table.get(language::CPP), test_run_dir());
    try {
        build(unit, table.get(language::CPP));
        FAIL() << "compilation should fail";
    } catch (compilation_error &ex) {
        EXPECT_NE(ex.error_log.find("bayview-no-such-compiler"), string::npos);
    }
}

TEST_F(BuildTest, SilentFailureTest) {
    // 编译器失败但没有输出时，仍然需要给出编译信息
    language_strategy strategy = languages.get(language::CPP);
    strategy.build_command = {"false"};
    auto request = make_request(language::CPP, "int main() {}\n", "", "");
    auto unit = materialize(request, strategy, test_run_dir());
    try {
        build(unit, strategy);
        FAIL() << "compilation should fail";
    } catch (compilation_error &ex) {
        EXPECT_FALSE(ex.error_log.empty());
    }
}

TEST_F(BuildTest, CompileTimeLimitTest) {
    language_strategy strategy = languages.get(language::CPP);
    strategy.build_command = {"sleep", "10"};
    COMPILE_TIME_LIMIT = 1;
    auto request = make_request(language::CPP, "int main() {}\n", "", "");
    auto unit = materialize(request, strategy, test_run_dir());
    EXPECT_THROW(build(unit, strategy), compilation_error);
}

TEST_F(BuildTest, InterpretedLanguageTest) {
    auto request = make_request(language::PYTHON, "print(1)\n", "", "");
    auto unit = materialize(request, languages.get(language::PYTHON), test_run_dir());
    executable_artifact artifact = build(unit, languages.get(language::PYTHON));
    EXPECT_EQ(artifact.command, (vector<string>{"python3", unit.source_name()}));
}
