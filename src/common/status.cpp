#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<command_run_status, const char *> command_status_string = boost::assign::map_list_of
    (command_run_status::FINISHED, "Finished")
    (command_run_status::TIME_LIMIT_EXCEEDED, "TimeLimitExceeded")
    (command_run_status::ERROR, "Error");

static const unordered_map<run_status, const char *> run_status_string = boost::assign::map_list_of
    (run_status::SUCCESS, "Success")
    (run_status::FAILED, "Failed")
    (run_status::SANDBOX_ERROR, "SandboxError");

static const unordered_map<failure_reason, const char *> reason_string = boost::assign::map_list_of
    (failure_reason::SUCCESS, "success")
    (failure_reason::SANDBOX_ERROR, "sandbox_error")
    (failure_reason::COMPILE_TIMEOUT, "compile_timeout")
    (failure_reason::IMPORT_ERROR, "import_error")
    (failure_reason::COMPILE_ERROR, "compile_error")
    (failure_reason::COMPILE_NON_ZERO_EXIT, "compile_non_zero_exit")
    (failure_reason::RUN_TIMEOUT, "run_timeout")
    (failure_reason::RUN_RUNTIME_ERROR, "run_runtime_error")
    (failure_reason::RUN_NON_ZERO_EXIT, "run_non_zero_exit")
    (failure_reason::FAILED_UNKNOWN, "failed_unknown");
// clang-format on

const char *get_display_message(command_run_status stat) {
    return command_status_string.at(stat);
}

const char *get_display_message(run_status stat) {
    return run_status_string.at(stat);
}

const char *get_display_message(failure_reason reason) {
    return reason_string.at(reason);
}

}  // namespace sandbox
