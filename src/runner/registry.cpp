#include "runner/registry.hpp"
#include <functional>
#include <map>
#include "common/exceptions.hpp"
#include "runner/native_runner.hpp"
#include "runner/script_runner.hpp"

namespace engine {
using namespace std;

struct language_entry {
    string extension;
    function<runner_uptr(const string &, chrono::milliseconds)> create;
};

static const vector<string> python_syntax_check = {
    "-c", "import sys; compile(open(sys.argv[1]).read(), sys.argv[1], 'exec')"};

static const map<string, language_entry> languages = {
    {"cpp", {"cpp", [](const string &source_code, chrono::milliseconds time_limit) -> runner_uptr {
                 return make_unique<native_runner>("g++", source_code, time_limit);
             }}},
    {"c", {"c", [](const string &source_code, chrono::milliseconds time_limit) -> runner_uptr {
               return make_unique<native_runner>("gcc", source_code, time_limit);
           }}},
    {"python3", {"py", [](const string &source_code, chrono::milliseconds time_limit) -> runner_uptr {
                     return make_unique<script_runner>("python3", python_syntax_check, source_code, time_limit);
                 }}}};

static const language_entry &find_language(const string &language) {
    auto it = languages.find(language);
    if (it == languages.end())
        throw configuration_error("Unsupported language: " + language);
    return it->second;
}

runner_uptr make_runner(const string &language, const string &source_code, chrono::milliseconds time_limit) {
    return find_language(language).create(source_code, time_limit);
}

string source_extension(const string &language) {
    return find_language(language).extension;
}

bool is_supported_language(const string &language) {
    return languages.count(language) > 0;
}

vector<string> supported_languages() {
    vector<string> result;
    for (auto &language : languages) result.push_back(language.first);
    return result;
}

}  // namespace engine
