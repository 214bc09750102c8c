#include "runner/language_config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, language_template &value) {
    j.at("source").get_to(value.source);
    if (j.count("compile") && !j.at("compile").is_null())
        value.compile = j.at("compile").get<string>();
    j.at("run").get_to(value.run);
}

language_config language_config::parse(const json &j) {
    language_config config;
    for (auto &[name, value] : j.at("languages").items()) {
        auto lang = parse_language(name);
        if (!lang) throw sandbox_exception("unknown language in config: " + name);
        config.templates[*lang] = value.get<language_template>();
    }
    if (j.count("kernels"))
        j.at("kernels").get_to(config.kernels);
    return config;
}

language_config language_config::load(const filesystem::path &path) {
    return parse(json::parse(read_file_content(path)));
}

string expand_command(const string &command_template, const string &source,
                      const filesystem::path &workdir, const filesystem::path &script_dir) {
    return fmt::format(fmt::runtime(command_template),
                       fmt::arg("source", source),
                       fmt::arg("workdir", workdir.string()),
                       fmt::arg("script_dir", script_dir.string()));
}

}  // namespace sandbox
