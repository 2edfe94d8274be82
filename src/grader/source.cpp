#include "grader/source.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <stdexcept>
#include <system_error>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace bayview {
using namespace std;

compilation_unit::compilation_unit(const filesystem::path &dir, const string &token,
                                   const string &source_name, const string &entry_point)
    : dir(dir), token_(token), source_name_(source_name), entry_point_(entry_point) {}

compilation_unit::compilation_unit(compilation_unit &&other) noexcept
    : dir(move(other.dir)), token_(move(other.token_)), source_name_(move(other.source_name_)), entry_point_(move(other.entry_point_)) {
    other.dir.clear();
}

compilation_unit::~compilation_unit() {
    if (dir.empty()) return;
    error_code ec;
    filesystem::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove compilation unit " << dir << ": " << ec.message();
}

const string &compilation_unit::token() const {
    return token_;
}

const filesystem::path &compilation_unit::directory() const {
    return dir;
}

const string &compilation_unit::source_name() const {
    return source_name_;
}

filesystem::path compilation_unit::source_path() const {
    return dir / source_name_;
}

const string &compilation_unit::entry_point() const {
    return entry_point_;
}

static string expand_pattern(const string &pattern, const string &token, const string &entry,
                             const string &source, const string &workdir) {
    try {
        return fmt::format(fmt::runtime(pattern),
                           fmt::arg("token", token),
                           fmt::arg("entry", entry),
                           fmt::arg("source", source),
                           fmt::arg("workdir", workdir));
    } catch (fmt::format_error &ex) {
        throw internal_error(fmt::format("Malformed command template \"{}\": {}", pattern, ex.what()));
    }
}

string compilation_unit::expand(const string &pattern) const {
    return expand_pattern(pattern, token_, entry_point_, source_name_, dir.string());
}

vector<string> compilation_unit::expand(const vector<string> &command) const {
    vector<string> result;
    for (auto &arg : command) result.push_back(expand(arg));
    return result;
}

compilation_unit materialize(const submission_request &request, const language_strategy &strategy,
                             const filesystem::path &run_dir) {
    string token = random_token();
    // 源文件名与入口点只允许使用 {token}
    string entry_point = expand_pattern(strategy.entry_point, token, "", "", "");
    string source_name = expand_pattern(strategy.source_file, token, entry_point, "", "");

    compilation_unit unit(run_dir / token, token, source_name, entry_point);

    string source;
    if (request.encoding == source_encoding::BASE64) {
        try {
            source = decode_base64(request.source);
        } catch (invalid_argument &ex) {
            throw materialization_error(string("Source code is not valid base64: ") + ex.what());
        }
    } else {
        source = request.source;
    }

    if (strategy.rewrite) {
        boost::replace_all(source, strategy.rewrite->placeholder, unit.expand(strategy.rewrite->replacement));
    }

    try {
        filesystem::create_directories(unit.directory());
        write_file_content(unit.source_path(), source);
    } catch (system_error &ex) {
        throw materialization_error(fmt::format("Unable to write source file {}: {}", unit.source_path().string(), ex.what()));
    }

    DLOG(INFO) << "Materialized " << unit.source_path() << " (" << source.size() << " bytes)";
    return unit;
}

}  // namespace bayview
