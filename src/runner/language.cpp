#include "runner/language.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<language, const char *> language_name = boost::assign::map_list_of
    (language::PYTHON, "python")
    (language::CPP, "cpp")
    (language::C, "c")
    (language::GO, "go")
    (language::JAVA, "java")
    (language::NODEJS, "nodejs")
    (language::TYPESCRIPT, "typescript")
    (language::BASH, "bash")
    (language::RUST, "rust")
    (language::LUA, "lua");
// clang-format on

const char *get_language_name(language lang) {
    return language_name.at(lang);
}

optional<language> parse_language(const string &name) {
    for (auto &[lang, lang_name] : language_name)
        if (name == lang_name) return lang;
    return {};
}

vector<language> all_languages() {
    return {language::PYTHON, language::CPP, language::C, language::GO, language::JAVA,
            language::NODEJS, language::TYPESCRIPT, language::BASH, language::RUST, language::LUA};
}

}  // namespace sandbox
