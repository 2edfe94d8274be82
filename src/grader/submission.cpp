#include "grader/submission.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/assign.hpp>
#include <map>
#include "common/exceptions.hpp"

namespace bayview {
using namespace std;

// clang-format off
static const map<string, language> language_tags = boost::assign::map_list_of
    ("c", language::C)
    ("c++", language::CPP)
    ("cpp", language::CPP)
    ("cxx", language::CPP)
    ("java", language::JAVA)
    ("python", language::PYTHON)
    ("python3", language::PYTHON)
    ("py", language::PYTHON);
// clang-format on

const char *get_language_tag(language lang) {
    switch (lang) {
        case language::C: return "c";
        case language::CPP: return "c++";
        case language::JAVA: return "java";
        case language::PYTHON: return "python";
    }
    return "unknown";
}

language parse_language(const string &tag) {
    auto it = language_tags.find(boost::algorithm::to_lower_copy(tag));
    if (it == language_tags.end())
        throw invalid_request("unsupported language " + tag);
    return it->second;
}

}  // namespace bayview
