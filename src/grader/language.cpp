#include "grader/language.hpp"
#include <algorithm>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace bayview {
using namespace std;

bool language_strategy::has_build_step() const {
    return !build_command.empty();
}

language_table::language_table() {
    // clang-format off
    set({language::C, "{token}.c", "{token}",
         {"gcc", "{source}", "-o", "{entry}"},
         {"{workdir}/{entry}"},
         nullopt});
    set({language::CPP, "{token}.cpp", "{token}",
         {"g++", "{source}", "-o", "{entry}"},
         {"{workdir}/{entry}"},
         nullopt});
    set({language::JAVA, "C{token}.java", "C{token}",
         {"javac", "{source}"},
         {"java", "-cp", "{workdir}", "{entry}"},
         entry_point_rewrite{"class Main", "class {entry}"}});
    set({language::PYTHON, "{token}.py", "{token}",
         {},
         {"python3", "{source}"},
         nullopt});
    // clang-format on
}

const language_strategy &language_table::get(language lang) const {
    return strategies.at(lang);
}

void language_table::set(const language_strategy &strategy) {
    strategies[strategy.lang] = strategy;
}

void language_table::set_build_program(language lang, const string &program) {
    auto &strategy = strategies.at(lang);
    if (strategy.build_command.empty())
        throw invalid_request(string("language ") + get_language_tag(lang) + " has no build step");
    strategy.build_command[0] = program;
}

void language_table::set_run_program(language lang, const string &program) {
    strategies.at(lang).run_command[0] = program;
}

static vector<string> parse_command(const nlohmann::json &j, const string &key) {
    if (!j.is_array() || !all_of(j.begin(), j.end(), [](auto &arg) { return arg.is_string(); }))
        throw invalid_request("language configuration " + key + " should be an array of strings");
    return j.get<vector<string>>();
}

void language_table::load(const nlohmann::json &config) {
    if (!config.is_object())
        throw invalid_request("language configuration should be an object");
    for (auto &[tag, value] : config.items()) {
        auto &strategy = strategies.at(parse_language(tag));
        if (!value.is_object())
            throw invalid_request("language configuration " + tag + " should be an object");
        if (value.count("build"))
            strategy.build_command = parse_command(value.at("build"), tag + ".build");
        if (value.count("run")) {
            auto run = parse_command(value.at("run"), tag + ".run");
            if (run.empty()) throw invalid_request("language configuration " + tag + ".run should not be empty");
            strategy.run_command = run;
        }
        if (value.count("source")) {
            if (!value.at("source").is_string()) throw invalid_request("language configuration " + tag + ".source should be a string");
            strategy.source_file = value.at("source").get<string>();
        }
        if (value.count("entry")) {
            if (!value.at("entry").is_string()) throw invalid_request("language configuration " + tag + ".entry should be a string");
            strategy.entry_point = value.at("entry").get<string>();
        }
        LOG(INFO) << "Loaded language configuration for " << tag;
    }
}

void language_table::load(const filesystem::path &config_file) {
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(read_file_content(config_file));
    } catch (nlohmann::json::exception &ex) {
        throw invalid_request("language configuration " + config_file.string() + " is malformed: " + ex.what());
    }
    load(config);
}

}  // namespace bayview
