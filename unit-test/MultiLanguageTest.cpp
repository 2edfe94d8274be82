#include <filesystem>
#include "common/base64.hpp"
#include "grader/pipeline.hpp"
#include "gtest/gtest.h"
#include "test/helpers.hpp"

using namespace std;
using namespace bayview;

class MultiLanguageTest : public ::testing::Test {
protected:
    language_table languages;
    counting_runner runner;

    void test(language lang, const string &source) {
        auto request = make_request(lang, encode_base64(source), "", "hello world\n", 5);
        request.encoding = source_encoding::BASE64;
        grading_pipeline pipeline(languages, runner, test_run_dir());
        verdict v = pipeline.judge(request);
        EXPECT_EQ(v.status, status::ACCEPTED) << v;
        EXPECT_EQ(runner.calls, 1);
        // 运行命令中的占位符已经展开，工作路径位于本次评测的运行目录下
        ASSERT_EQ(runner.artifacts.size(), 1u);
        auto &artifact = runner.artifacts[0];
        EXPECT_FALSE(artifact.command.empty());
        for (auto &arg : artifact.command) EXPECT_EQ(arg.find('{'), string::npos) << arg;
        EXPECT_EQ(artifact.work_dir.parent_path(), test_run_dir());
        EXPECT_FALSE(filesystem::exists(artifact.work_dir));
    }
};

TEST_F(MultiLanguageTest, CTest) {
    if (!has_program("gcc")) GTEST_SKIP() << "gcc is not available";
    test(language::C, R"(
#include <stdio.h>
int main() { puts("hello world"); })");
}

TEST_F(MultiLanguageTest, CppTest) {
    if (!has_program("g++")) GTEST_SKIP() << "g++ is not available";
    test(language::CPP, R"(
#include <iostream>
int main() { std::cout << "hello world" << std::endl; })");
}

TEST_F(MultiLanguageTest, JavaTest) {
    if (!has_program("javac") || !has_program("java")) GTEST_SKIP() << "javac is not available";
    test(language::JAVA, R"(
public class Main {
    public static void main(String[] args) {
        System.out.println("hello world");
    }
})");
}

TEST_F(MultiLanguageTest, PythonTest) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not available";
    test(language::PYTHON, R"(
print('hello world'))");
}

TEST_F(MultiLanguageTest, ReadInputTest) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not available";
    auto request = make_request(language::PYTHON, "a, b = map(int, input().split())\nprint(a + b)\n", "1 2\n", "3\n", 2);
    grading_pipeline pipeline(languages, runner, test_run_dir());
    EXPECT_EQ(pipeline.judge(request).status, status::ACCEPTED);
}
