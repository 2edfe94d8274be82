#include "common/io_utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>
#include "common/utils.hpp"

namespace bayview {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

optional<fs::path> find_program(const string &program) {
    if (program.empty()) return nullopt;
    if (program.find('/') != string::npos) {
        if (access(program.c_str(), X_OK) == 0) return fs::path(program);
        return nullopt;
    }

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", "/usr/local/bin:/usr/bin:/bin"), boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return nullopt;
}

}  // namespace bayview
