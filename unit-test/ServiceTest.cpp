#include <limits>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "server/service.hpp"
#include "test/sandbox_test.hpp"

using namespace std;
using namespace sandbox;
using namespace sandbox::test;
using nlohmann::json;

struct exception_recorder : public monitor {
    void report_exception(const string &endpoint, const string &request_id, const string &message) override {
        scoped_lock guard(mut);
        exceptions.push_back({endpoint, request_id, message});
    }

    void report_statistics(const json &summary) override {
        scoped_lock guard(mut);
        summaries.push_back(summary);
    }

    mutex mut;
    vector<vector<string>> exceptions;
    vector<json> summaries;
};

class ServiceTest : public ::testing::Test {
protected:
    ServiceTest() : stats(mon, 0, chrono::seconds(0)) {
        config.templates[language::BASH] = {"main.sh", nullopt, "bash {source}"};
        // 用 bash -n 做语法检查，模拟编译型语言
        config.templates[language::C] = {"main.sh", string("bash -n {source}"), "bash {source}"};
        config.kernels["bash"] = "bash " + (filesystem::path(__FILE__).parent_path() / "test" / "bash_notebook_driver.sh").string();

        env.workspace_root = root.path();
        env.script_dir = script_dir();
    }

    unique_ptr<sandbox_service> make_service(optional<string> pod_name = nullopt) {
        return make_unique<sandbox_service>(config, env, import_error_matcher(DEFAULT_IMPORT_ERROR_PATTERN), stats, mon, pod_name);
    }

    json run_code(const string &code, json extra = json::object()) {
        json request = {{"endpoint", "run_code"}, {"language", "bash"}, {"code", code}};
        request.update(extra);
        return make_service()->handle(request);
    }

    temp_directory root;
    language_config config;
    recipe_environment env;
    exception_recorder mon;
    run_statistics stats;
};

TEST_F(ServiceTest, SuccessTest) {
    json response = run_code("read x; echo \"got $x\"", {{"stdin", "42\n"}, {"request_id", "req-1"}});
    EXPECT_EQ(response["status"], "Success");
    EXPECT_EQ(response["message"], "");
    EXPECT_EQ(response["request_id"], "req-1");
    EXPECT_EQ(response["endpoint"], "run_code");
    EXPECT_TRUE(response["compile_result"].is_null());
    EXPECT_EQ(response["run_result"]["status"], "Finished");
    EXPECT_EQ(response["run_result"]["stdout"], "got 42\n");
    EXPECT_EQ(response["run_result"]["return_code"], 0);
    EXPECT_TRUE(response["executor_pod_name"].is_null());

    json summary = stats.summary();
    EXPECT_EQ(summary["total_requests"], 1);
    EXPECT_EQ(summary["success_count"], 1);
}

TEST_F(ServiceTest, NonZeroExitTest) {
    json response = run_code("echo 'ZeroDivisionError: division by zero' >&2; exit 1");
    EXPECT_EQ(response["status"], "Failed");
    EXPECT_EQ(response["run_result"]["return_code"], 1);
    EXPECT_EQ(stats.summary()["failure_breakdown"]["run_non_zero_exit"]["count"], 1);
}

TEST_F(ServiceTest, ImportErrorTest) {
    json response = run_code("echo \"ModuleNotFoundError: No module named 'nonexistent_module'\" >&2; exit 1");
    EXPECT_EQ(response["status"], "Failed");

    json summary = stats.summary();
    EXPECT_EQ(summary["failure_breakdown"]["import_error"]["count"], 1);
    ASSERT_FALSE(summary["import_error_example"].is_null());
    EXPECT_EQ(summary["import_error_example"]["language"], "bash");
    EXPECT_EQ(summary["import_error_example"]["module"], "nonexistent_module");
}

TEST_F(ServiceTest, TimeoutTest) {
    json response = run_code("echo partial; sleep 30", {{"run_timeout", 0.5}});
    EXPECT_EQ(response["status"], "Failed");
    EXPECT_EQ(response["run_result"]["status"], "TimeLimitExceeded");
    EXPECT_TRUE(response["run_result"]["return_code"].is_null());
    EXPECT_EQ(response["run_result"]["stdout"], "partial\n");
    EXPECT_EQ(stats.summary()["failure_breakdown"]["run_timeout"]["count"], 1);
}

TEST_F(ServiceTest, CompileFailureTest) {
    json request = {{"endpoint", "run_code"}, {"language", "c"}, {"code", "if then fi ("}};
    json response = make_service()->handle(request);
    EXPECT_EQ(response["status"], "Failed");
    EXPECT_NE(response["compile_result"]["return_code"], 0);
    EXPECT_TRUE(response["run_result"].is_null());
    EXPECT_EQ(stats.summary()["failure_breakdown"]["compile_non_zero_exit"]["count"], 1);
}

TEST_F(ServiceTest, FilesTest) {
    json response = run_code("tr a-z A-Z < in.txt > out.txt",
                             {{"files", {{"in.txt", base64_encode("hello")}}}, {"fetch_files", json::array({"out.txt", "out.txt", "missing.txt"})}});
    EXPECT_EQ(response["status"], "Success");
    ASSERT_EQ(response["files"].size(), 1u);
    EXPECT_EQ(base64_decode(response["files"]["out.txt"].get<string>()), "HELLO");
}

TEST_F(ServiceTest, SandboxErrorTest) {
    json response = run_code("echo never", {{"files", {{"../escape.txt", base64_encode("x")}}}, {"request_id", "req-bad"}});
    EXPECT_EQ(response["status"], "SandboxError");
    EXPECT_NE(response["message"].get<string>().find("exception on running code"), string::npos);
    EXPECT_TRUE(response["run_result"].is_null());
    EXPECT_FALSE(filesystem::exists(root.path() / "escape.txt"));

    ASSERT_EQ(mon.exceptions.size(), 1u);
    EXPECT_EQ(mon.exceptions[0][0], "run_code");
    EXPECT_EQ(mon.exceptions[0][1], "req-bad");
    EXPECT_EQ(stats.summary()["failure_breakdown"]["sandbox_error"]["count"], 1);
}

TEST_F(ServiceTest, InvalidRequestTest) {
    auto service = make_service();

    json response = service->handle({{"endpoint", "run_code"}, {"language", "cobol"}, {"code", ""}});
    EXPECT_TRUE(response.contains("error"));
    EXPECT_TRUE(response["request_id"].is_string());

    response = service->handle({{"endpoint", "run_code"}, {"language", "rust"}, {"code", ""}});
    EXPECT_TRUE(response.contains("error"));

    response = service->handle({{"endpoint", "run_code"}, {"language", "bash"}});
    EXPECT_TRUE(response.contains("error"));

    for (double timeout : {0.0, -1.0, numeric_limits<double>::infinity(), numeric_limits<double>::quiet_NaN()}) {
        response = service->handle({{"endpoint", "run_code"}, {"language", "bash"}, {"code", "true"}, {"run_timeout", timeout}});
        EXPECT_TRUE(response.contains("error")) << timeout;
        response = service->handle({{"endpoint", "run_jupyter"}, {"kernel", "bash"}, {"cells", json::array({"true"})}, {"cell_timeout", timeout}});
        EXPECT_TRUE(response.contains("error")) << timeout;
    }
    response = service->handle({{"endpoint", "run_code"}, {"language", "bash"}, {"code", "true"}, {"compile_timeout", "5"}});
    EXPECT_TRUE(response.contains("error"));

    response = service->handle({{"endpoint", "compile"}});
    EXPECT_TRUE(response.contains("error"));
    EXPECT_EQ(response["endpoint"], "compile");

    response = service->handle({{"endpoint", "run_jupyter"}, {"cells", json::array({"1"})}, {"kernel", "julia"}});
    EXPECT_TRUE(response.contains("error"));

    EXPECT_EQ(stats.summary()["total_requests"], 0);
    EXPECT_TRUE(mon.exceptions.empty());
}

TEST_F(ServiceTest, HugeTimeoutTest) {
    json response = run_code("echo done", {{"run_timeout", 1e20}, {"compile_timeout", 1e300}});
    EXPECT_EQ(response["status"], "Success");
    EXPECT_EQ(response["run_result"]["stdout"], "done\n");
}

TEST_F(ServiceTest, PodNameTest) {
    json response = make_service("executor-0")->handle({{"endpoint", "run_code"}, {"language", "bash"}, {"code", "true"}});
    EXPECT_EQ(response["executor_pod_name"], "executor-0");
}

TEST_F(ServiceTest, JupyterTest) {
    json request = {{"endpoint", "run_jupyter"}, {"kernel", "bash"}, {"cells", json::array({"x=3", "echo $((x * 2))"})}};
    json response = make_service()->handle(request);
    EXPECT_EQ(response["status"], "Success");
    EXPECT_EQ(response["driver"]["status"], "Finished");
    ASSERT_EQ(response["cells"].size(), 2u);
    EXPECT_EQ(response["cells"][1]["stdout"], "6\n");
    EXPECT_EQ(response["cells"][1]["execution_count"], 2);
    EXPECT_EQ(response["cells"][1]["status"], "ok");
}

TEST_F(ServiceTest, JupyterDriverFailureTest) {
    json request = {{"endpoint", "run_jupyter"}, {"kernel", "bash"}, {"cells", json::array({"echo 1", "sleep 30"})}, {"cell_timeout", 0.5}};
    json response = make_service()->handle(request);
    EXPECT_EQ(response["status"], "Failed");
    EXPECT_EQ(response["driver"]["status"], "TimeLimitExceeded");
    EXPECT_TRUE(response["cells"].empty());
    EXPECT_TRUE(response["files"].empty());
}
