#include "grader/comparator.hpp"
#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <vector>

namespace bayview {
using namespace std;

string normalize_output(const string &text) {
    string result;
    result.reserve(text.size());
    for (char c : text)
        if (c != ' ' && c != '\n' && c != '\r')
            result.push_back(c);
    return result;
}

static vector<string> split_tokens(const string &text) {
    vector<string> tokens;
    boost::split(tokens, text, boost::is_any_of(" \t\r\n\f\v"), boost::token_compress_on);
    tokens.erase(remove(tokens.begin(), tokens.end(), ""), tokens.end());
    return tokens;
}

status compare_output(const string &actual, const string &expected, compare_mode mode) {
    bool equal = false;
    switch (mode) {
        case compare_mode::TOKENS:
            equal = split_tokens(actual) == split_tokens(expected);
            break;
        case compare_mode::COLLAPSE:
            equal = normalize_output(actual) == normalize_output(expected);
            break;
    }
    return equal ? status::ACCEPTED : status::WRONG_ANSWER;
}

}  // namespace bayview
