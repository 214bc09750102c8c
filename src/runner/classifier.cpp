#include "runner/classifier.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>

namespace sandbox {
using namespace std;

const char *DEFAULT_IMPORT_ERROR_PATTERN = R"((ModuleNotFoundError: No module named '([^']+)')|(ImportError: .+))";

import_error_matcher::import_error_matcher(const string &pattern) : pattern(pattern) {}

bool import_error_matcher::matches(const string &stderr_data) const {
    return search(stderr_data).has_value();
}

optional<pair<string, string>> import_error_matcher::search(const string &stderr_data) const {
    boost::smatch match;
    try {
        if (!boost::regex_search(stderr_data, match, pattern, boost::match_not_dot_newline)) return {};
    } catch (std::runtime_error &e) {
        LOG(WARNING) << "Gave up matching import errors in " << stderr_data.size() << " bytes of stderr: " << e.what();
        return {};
    }
    string module = match.size() > 2 && match[2].matched ? match[2].str() : "";
    return make_pair(match[0].str(), module);
}

pair<run_status, string> parse_run_status(const optional<command_run_result> &compile_result,
                                          const optional<command_run_result> &run_result) {
    const optional<command_run_result> *stages[] = {&compile_result, &run_result};

    for (auto stage : stages)
        if (*stage && (*stage)->status == command_run_status::ERROR)
            return {run_status::SANDBOX_ERROR, (*stage)->stderr_data};
    for (auto stage : stages)
        if (*stage && (*stage)->status == command_run_status::TIME_LIMIT_EXCEEDED)
            return {run_status::FAILED, ""};
    for (auto stage : stages)
        if (*stage && (*stage)->return_code && *(*stage)->return_code != 0)
            return {run_status::FAILED, ""};
    return {run_status::SUCCESS, ""};
}

static bool non_zero_exit(const command_run_result &result) {
    return result.return_code && *result.return_code != 0;
}

failure_reason classify_reason(run_status status,
                               const optional<command_run_result> &compile_result,
                               const optional<command_run_result> &run_result,
                               const import_error_matcher &matcher) {
    if (status == run_status::SUCCESS) return failure_reason::SUCCESS;
    // 请求在编译运行之前就失败了，没有任何步骤的结果
    if (!compile_result && !run_result) return failure_reason::SANDBOX_ERROR;

    if (compile_result) {
        if (compile_result->status == command_run_status::TIME_LIMIT_EXCEEDED)
            return failure_reason::COMPILE_TIMEOUT;
        if (matcher.matches(compile_result->stderr_data))
            return failure_reason::IMPORT_ERROR;
        if (compile_result->status == command_run_status::ERROR)
            return failure_reason::COMPILE_ERROR;
        if (non_zero_exit(*compile_result))
            return failure_reason::COMPILE_NON_ZERO_EXIT;
    }

    if (run_result) {
        if (run_result->status == command_run_status::TIME_LIMIT_EXCEEDED)
            return failure_reason::RUN_TIMEOUT;
        if (run_result->status == command_run_status::ERROR)
            return matcher.matches(run_result->stderr_data) ? failure_reason::IMPORT_ERROR
                                                            : failure_reason::RUN_RUNTIME_ERROR;
        if (matcher.matches(run_result->stderr_data))
            return failure_reason::IMPORT_ERROR;
        if (non_zero_exit(*run_result))
            return failure_reason::RUN_NON_ZERO_EXIT;
    }

    LOG(WARNING) << "Unable to classify failed request with status " << get_display_message(status)
                 << ", compile: " << (compile_result ? get_display_message(compile_result->status) : "none")
                 << ", run: " << (run_result ? get_display_message(run_result->status) : "none");
    return failure_reason::FAILED_UNKNOWN;
}

optional<import_failure> extract_import_failure(const string &code, language lang,
                                                const optional<command_run_result> &compile_result,
                                                const optional<command_run_result> &run_result,
                                                const import_error_matcher &matcher) {
    for (auto stage : {&compile_result, &run_result}) {
        if (!*stage) continue;
        auto matched = matcher.search(boost::algorithm::trim_copy((*stage)->stderr_data));
        if (!matched) continue;

        import_failure failure;
        failure.lang = get_language_name(lang);
        failure.error = matched->first;
        failure.module = matched->second;
        failure.code_preview = code.substr(0, import_failure::CODE_PREVIEW_LENGTH);
        return failure;
    }
    return {};
}

}  // namespace sandbox
