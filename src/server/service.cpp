#include "server/service.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "runner/notebook.hpp"
#include "server/protocol.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

static const size_t CODE_LOG_PREVIEW = 120;

sandbox_service::sandbox_service(const language_config &config, recipe_environment env, import_error_matcher matcher,
                                 run_statistics &stats, monitor &mon, optional<string> pod_name)
    : recipes(recipe_registry::from_config(config, env)),
      kernels(config.kernels),
      env(move(env)),
      matcher(move(matcher)),
      stats(stats),
      mon(mon),
      pod_name(move(pod_name)) {}

const recipe_registry &sandbox_service::registry() const {
    return recipes;
}

// sandbox_exception 带有抛出时的调用栈
static void log_failure(const string &request_id, const std::exception &ex) {
    if (auto sandbox_ex = dynamic_cast<const sandbox_exception *>(&ex)) {
        LOG(ERROR) << "Request " << request_id << " failed: " << ex.what() << endl
                   << *sandbox_ex;
    } else {
        LOG(ERROR) << "Request " << request_id << " failed: " << ex.what();
    }
}

static json optional_result(const optional<command_run_result> &result) {
    if (result) return *result;
    return nullptr;
}

json sandbox_service::run_code(const json &request, const string &request_id) {
    code_run_args args = request.get<code_run_args>();
    if (!recipes.contains(args.lang))
        throw invalid_argument(string("language is not configured: ") + get_language_name(args.lang));

    VLOG(1) << "sandbox.run_code.start " << json({{"request_id", request_id},
                                                  {"language", get_language_name(args.lang)},
                                                  {"compile_timeout", args.compile_timeout.count()},
                                                  {"run_timeout", args.run_timeout.count()},
                                                  {"code_preview", args.code.substr(0, CODE_LOG_PREVIEW)}})
                                               .dump();

    code_run_result result;
    run_status status;
    string message;
    try {
        result = recipes.dispatch(args);
        tie(status, message) = parse_run_status(result.compile_result, result.run_result);
    } catch (std::exception &ex) {
        log_failure(request_id, ex);
        mon.report_exception("run_code", request_id, ex.what());
        result = code_run_result();
        status = run_status::SANDBOX_ERROR;
        message = fmt::format("exception on running code: {}", ex.what());
    }

    failure_reason reason = classify_reason(status, result.compile_result, result.run_result, matcher);
    if (auto failure = extract_import_failure(args.code, args.lang, result.compile_result, result.run_result, matcher))
        stats.update_import_failure(move(*failure));
    stats.record(status, reason);

    VLOG(1) << "sandbox.run_code.finish " << json({{"request_id", request_id},
                                                   {"status", get_display_message(status)},
                                                   {"reason", get_display_message(reason)}})
                                                .dump();

    json response = {{"status", get_display_message(status)},
                     {"message", message},
                     {"compile_result", optional_result(result.compile_result)},
                     {"run_result", optional_result(result.run_result)},
                     {"files", result.files}};
    if (pod_name) response["executor_pod_name"] = *pod_name;
    else response["executor_pod_name"] = nullptr;
    return response;
}

json sandbox_service::run_jupyter(const json &request, const string &request_id) {
    run_jupyter_args args = request.get<run_jupyter_args>();
    string code_preview = boost::algorithm::join(args.cells, "\n").substr(0, CODE_LOG_PREVIEW);

    VLOG(1) << "sandbox.run_jupyter.start " << json({{"request_id", request_id},
                                                     {"kernel", args.kernel},
                                                     {"code_preview", code_preview}})
                                                  .dump();

    json response = {{"status", get_display_message(run_status::SUCCESS)},
                     {"message", ""},
                     {"driver", nullptr},
                     {"cells", json::array()},
                     {"files", json::object()}};
    auto kernel = kernels.find(args.kernel);
    if (kernel == kernels.end())
        throw invalid_argument("unsupported kernel: " + args.kernel);

    try {
        notebook_config config{kernel->second, env};
        run_jupyter_result result = sandbox::run_jupyter(args, config);
        response["driver"] = result.driver;
        if (result.driver.status != command_run_status::FINISHED) {
            response["status"] = get_display_message(run_status::FAILED);
        } else {
            response["cells"] = result.cells;
            response["files"] = result.files;
        }
        VLOG(1) << "sandbox.run_jupyter.finish " << json({{"request_id", request_id},
                                                          {"status", response["status"]},
                                                          {"driver_status", get_display_message(result.driver.status)}})
                                                       .dump();
    } catch (std::exception &ex) {
        log_failure(request_id, ex);
        mon.report_exception("run_jupyter", request_id, ex.what());
        response["status"] = get_display_message(run_status::SANDBOX_ERROR);
        response["message"] = fmt::format("exception on running jupyter {}: {}", code_preview, ex.what());
    }

    if (pod_name) response["executor_pod_name"] = *pod_name;
    else response["executor_pod_name"] = nullptr;
    return response;
}

json sandbox_service::handle(const json &request) {
    string request_id = random_uuid();
    string endpoint;
    json response;
    try {
        if (request.count("request_id") && request.at("request_id").is_string())
            request_id = request.at("request_id").get<string>();
        endpoint = request.at("endpoint").get<string>();
        if (endpoint == "run_code") {
            response = run_code(request, request_id);
        } else if (endpoint == "run_jupyter") {
            response = run_jupyter(request, request_id);
        } else {
            throw invalid_argument("unknown endpoint: " + endpoint);
        }
    } catch (std::invalid_argument &ex) {
        LOG(WARNING) << "Rejected request " << request_id << ": " << ex.what();
        response = {{"error", ex.what()}};
    } catch (json::exception &ex) {
        LOG(WARNING) << "Rejected malformed request " << request_id << ": " << ex.what();
        response = {{"error", ex.what()}};
    }
    response["request_id"] = request_id;
    if (!endpoint.empty()) response["endpoint"] = endpoint;
    return response;
}

}  // namespace sandbox
