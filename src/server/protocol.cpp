#include "server/protocol.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sandbox {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const command_run_result &value) {
    j = {{"status", get_display_message(value.status)},
         {"execution_time", value.execution_time},
         {"stdout", value.stdout_data},
         {"stderr", value.stderr_data}};
    if (value.return_code) j["return_code"] = *value.return_code;
    else j["return_code"] = nullptr;
}

void to_json(json &j, const cell_run_result &value) {
    j = {{"stdout", value.stdout_data},
         {"stderr", value.stderr_data},
         {"display", value.display},
         {"execution_count", value.execution_count},
         {"status", value.status}};
}

template <typename T>
static T value_or(const json &j, const char *key, const T &def) {
    if (!j.count(key) || j.at(key).is_null()) return def;
    return j.at(key).get<T>();
}

// 超时必须是有限的正数，过大的值由执行层限制在 MAX_TIMEOUT 之内
static chrono::duration<double> parse_timeout(const json &j, const char *key, double def) {
    double seconds = value_or<double>(j, key, def);
    if (!isfinite(seconds) || seconds <= 0)
        throw invalid_argument(string(key) + " should be a positive number of seconds");
    return chrono::duration<double>(seconds);
}

static optional<uint64_t> parse_memory_limit(const json &j) {
    int64_t mb = value_or<int64_t>(j, "memory_limit_MB", -1);
    if (mb <= 0) return {};
    return (uint64_t)mb * 1024 * 1024;
}

static file_map parse_files(const json &j) {
    file_map files;
    if (!j.count("files") || j.at("files").is_null()) return files;
    for (auto &[path, content] : j.at("files").items()) {
        if (content.is_null()) files[path] = nullopt;
        else files[path] = content.get<string>();
    }
    return files;
}

static vector<string> parse_fetch_files(const json &j) {
    vector<string> paths;
    for (auto &path : value_or<vector<string>>(j, "fetch_files", {}))
        if (find(paths.begin(), paths.end(), path) == paths.end())
            paths.push_back(path);
    return paths;
}

void from_json(const json &j, code_run_args &value) {
    j.at("code").get_to(value.code);
    string lang = j.at("language").get<string>();
    auto parsed = parse_language(lang);
    if (!parsed) throw invalid_argument("unsupported language: " + lang);
    value.lang = *parsed;
    value.compile_timeout = parse_timeout(j, "compile_timeout", 10);
    value.run_timeout = parse_timeout(j, "run_timeout", 10);
    value.memory_limit = parse_memory_limit(j);
    if (j.count("stdin") && !j.at("stdin").is_null())
        value.stdin_data = j.at("stdin").get<string>();
    value.files = parse_files(j);
    value.fetch_files = parse_fetch_files(j);
}

void from_json(const json &j, run_jupyter_args &value) {
    j.at("cells").get_to(value.cells);
    value.cell_timeout = parse_timeout(j, "cell_timeout", 10);
    value.total_timeout = parse_timeout(j, "total_timeout", 45);
    value.memory_limit = parse_memory_limit(j);
    value.kernel = value_or<string>(j, "kernel", "python3");
    value.files = parse_files(j);
    value.fetch_files = parse_fetch_files(j);
}

}  // namespace sandbox
