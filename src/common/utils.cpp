#include "common/utils.hpp"
#include <boost/algorithm/string/erase.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>

namespace bayview {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_token() {
    // random_generator 不是线程安全的，每个线程持有自己的生成器
    thread_local boost::uuids::random_generator generator;
    string token = boost::uuids::to_string(generator());
    boost::algorithm::erase_all(token, "-");
    return token;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace bayview
