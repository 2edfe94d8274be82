#include <set>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "grader/source.hpp"
#include "gtest/gtest.h"
#include "test/helpers.hpp"

using namespace std;
using namespace std::filesystem;
using namespace bayview;

class MaterializerTest : public ::testing::Test {
protected:
    language_table languages;
};

TEST_F(MaterializerTest, PlainSourceTest) {
    auto request = make_request(language::CPP, "int main() {}\n", "", "");
    path dir;
    {
        compilation_unit unit = materialize(request, languages.get(language::CPP), test_run_dir());
        dir = unit.directory();
        EXPECT_EQ(unit.token().size(), 32u);
        // 只包含小写十六进制字符，可以直接用作 Java 类名的一部分
        EXPECT_EQ(unit.token().find_first_not_of("0123456789abcdef"), string::npos) << unit.token();
        EXPECT_EQ(dir, test_run_dir() / unit.token());
        EXPECT_EQ(unit.source_name(), unit.token() + ".cpp");
        EXPECT_EQ(unit.entry_point(), unit.token());
        EXPECT_EQ(read_file_content(unit.source_path()), "int main() {}\n");
    }
    EXPECT_FALSE(exists(dir));
}

TEST_F(MaterializerTest, Base64SourceTest) {
    auto request = make_request(language::PYTHON, encode_base64("print(\"Hello, World!\")"), "", "");
    request.encoding = source_encoding::BASE64;
    compilation_unit unit = materialize(request, languages.get(language::PYTHON), test_run_dir());
    EXPECT_EQ(unit.source_name(), unit.token() + ".py");
    EXPECT_EQ(read_file_content(unit.source_path()), "print(\"Hello, World!\")");
}

TEST_F(MaterializerTest, MalformedBase64Test) {
    auto request = make_request(language::CPP, "not base64!", "", "");
    request.encoding = source_encoding::BASE64;
    size_t before = count_run_dir_entries();
    EXPECT_THROW(materialize(request, languages.get(language::CPP), test_run_dir()), materialization_error);
    size_t after = count_run_dir_entries();
    EXPECT_EQ(before, after);
}

TEST_F(MaterializerTest, JavaEntryPointRewriteTest) {
    auto request = make_request(language::JAVA, "public class Main {\n    public static void main(String[] args) {}\n}\n", "", "");
    compilation_unit unit = materialize(request, languages.get(language::JAVA), test_run_dir());
    EXPECT_EQ(unit.entry_point(), "C" + unit.token());
    EXPECT_EQ(unit.source_name(), "C" + unit.token() + ".java");
    string source = read_file_content(unit.source_path());
    EXPECT_NE(source.find("public class C" + unit.token() + " {"), string::npos);
    EXPECT_EQ(source.find("class Main"), string::npos);
}

TEST_F(MaterializerTest, JavaWithoutMainClassTest) {
    auto request = make_request(language::JAVA, "public class Solution {}\n", "", "");
    compilation_unit unit = materialize(request, languages.get(language::JAVA), test_run_dir());
    EXPECT_EQ(read_file_content(unit.source_path()), "public class Solution {}\n");
}

TEST_F(MaterializerTest, UniqueTokenTest) {
    auto request = make_request(language::C, "int main() { return 0; }", "", "");
    vector<compilation_unit> units;
    set<string> tokens;
    for (int i = 0; i < 64; ++i) {
        units.push_back(materialize(request, languages.get(language::C), test_run_dir()));
        tokens.insert(units.back().token());
    }
    EXPECT_EQ(tokens.size(), 64u);
}

TEST_F(MaterializerTest, ExpandTest) {
    compilation_unit unit(test_run_dir() / "abc", "abc", "abc.cpp", "abc");
    EXPECT_EQ(unit.expand(vector<string>{"g++", "{source}", "-o", "{entry}"}),
              (vector<string>{"g++", "abc.cpp", "-o", "abc"}));
    EXPECT_EQ(unit.expand("{workdir}/{entry}"), (test_run_dir() / "abc" / "abc").string());
    EXPECT_THROW(unit.expand("{unknown}"), internal_error);
    EXPECT_THROW(unit.expand("{source"), internal_error);
}

TEST_F(MaterializerTest, UnwritableRunDirTest) {
    auto request = make_request(language::CPP, "int main() {}", "", "");
    EXPECT_THROW(materialize(request, languages.get(language::CPP), "/proc/bayview-not-writable"), materialization_error);
}
