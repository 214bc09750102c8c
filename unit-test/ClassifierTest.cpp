#include "gtest/gtest.h"
#include "runner/classifier.hpp"

using namespace std;
using namespace sandbox;

static command_run_result finished(int return_code, const string &stderr_data = "") {
    command_run_result result;
    result.status = command_run_status::FINISHED;
    result.return_code = return_code;
    result.stderr_data = stderr_data;
    return result;
}

static command_run_result timeout() {
    command_run_result result;
    result.status = command_run_status::TIME_LIMIT_EXCEEDED;
    return result;
}

static command_run_result error(const string &stderr_data) {
    command_run_result result;
    result.status = command_run_status::ERROR;
    result.stderr_data = stderr_data;
    return result;
}

static const string PYTHON_TRACEBACK = R"(Traceback (most recent call last):
  File "/tmp/main.py", line 1, in <module>
    print(1/0)
ZeroDivisionError: division by zero
)";

static const string MODULE_NOT_FOUND = R"(Traceback (most recent call last):
  File "/tmp/main.py", line 1, in <module>
    import nonexistent_module
ModuleNotFoundError: No module named 'nonexistent_module'
)";

class ClassifierTest : public ::testing::Test {
protected:
    failure_reason classify(const optional<command_run_result> &compile, const optional<command_run_result> &run) {
        auto [status, message] = parse_run_status(compile, run);
        return classify_reason(status, compile, run, matcher);
    }

    import_error_matcher matcher;
};

TEST_F(ClassifierTest, SuccessTest) {
    auto [status, message] = parse_run_status(finished(0), finished(0));
    EXPECT_EQ(status, run_status::SUCCESS);
    EXPECT_EQ(message, "");
    EXPECT_EQ(classify_reason(status, finished(0), finished(0), matcher), failure_reason::SUCCESS);
}

TEST_F(ClassifierTest, ErrorOutranksNonZeroExitTest) {
    auto [status, message] = parse_run_status(finished(1), error("internal failure"));
    EXPECT_EQ(status, run_status::SANDBOX_ERROR);
    EXPECT_EQ(message, "internal failure");

    tie(status, message) = parse_run_status(error("spawn failed"), nullopt);
    EXPECT_EQ(status, run_status::SANDBOX_ERROR);
    EXPECT_EQ(message, "spawn failed");
}

TEST_F(ClassifierTest, TimeoutOutranksNonZeroExitTest) {
    auto [status, message] = parse_run_status(finished(1), timeout());
    EXPECT_EQ(status, run_status::FAILED);
    EXPECT_EQ(message, "");

    EXPECT_EQ(classify(nullopt, timeout()), failure_reason::RUN_TIMEOUT);
    EXPECT_EQ(classify(timeout(), nullopt), failure_reason::COMPILE_TIMEOUT);
}

TEST_F(ClassifierTest, NonZeroExitTest) {
    auto [status, message] = parse_run_status(nullopt, finished(1, PYTHON_TRACEBACK));
    EXPECT_EQ(status, run_status::FAILED);
    EXPECT_EQ(classify(nullopt, finished(1, PYTHON_TRACEBACK)), failure_reason::RUN_NON_ZERO_EXIT);
    EXPECT_EQ(classify(finished(2, "main.cpp:1: error"), nullopt), failure_reason::COMPILE_NON_ZERO_EXIT);
}

TEST_F(ClassifierTest, ImportErrorTest) {
    EXPECT_EQ(classify(nullopt, finished(1, MODULE_NOT_FOUND)), failure_reason::IMPORT_ERROR);
    EXPECT_EQ(classify(nullopt, finished(1, "ImportError: cannot import name 'x' from 'y'")), failure_reason::IMPORT_ERROR);
    EXPECT_EQ(classify(nullopt, error(MODULE_NOT_FOUND)), failure_reason::IMPORT_ERROR);
    EXPECT_EQ(classify(finished(1, MODULE_NOT_FOUND), nullopt), failure_reason::IMPORT_ERROR);
    // 编译超时先于模块缺失
    EXPECT_EQ(classify_reason(run_status::FAILED, timeout(), finished(1, MODULE_NOT_FOUND), matcher),
              failure_reason::COMPILE_TIMEOUT);
}

TEST_F(ClassifierTest, ErrorReasonTest) {
    EXPECT_EQ(classify(error("cannot spawn compiler"), nullopt), failure_reason::COMPILE_ERROR);
    EXPECT_EQ(classify(nullopt, error("cannot spawn program")), failure_reason::RUN_RUNTIME_ERROR);
}

TEST_F(ClassifierTest, SandboxErrorWithoutResultsTest) {
    EXPECT_EQ(classify_reason(run_status::SANDBOX_ERROR, nullopt, nullopt, matcher), failure_reason::SANDBOX_ERROR);
}

TEST_F(ClassifierTest, UnknownFailureTest) {
    // 整体失败但所有步骤都正常结束，说明分类不完整
    EXPECT_EQ(classify_reason(run_status::FAILED, finished(0), finished(0), matcher), failure_reason::FAILED_UNKNOWN);
}

TEST_F(ClassifierTest, ExtractImportFailureTest) {
    string code = "import nonexistent_module\n" + string(300, '#');
    auto failure = extract_import_failure(code, language::PYTHON, nullopt, finished(1, MODULE_NOT_FOUND), matcher);
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->lang, "python");
    EXPECT_EQ(failure->module, "nonexistent_module");
    EXPECT_EQ(failure->error, "ModuleNotFoundError: No module named 'nonexistent_module'");
    EXPECT_EQ(failure->code_preview.size(), 200u);
    EXPECT_EQ(failure->code_preview, code.substr(0, 200));

    EXPECT_FALSE(extract_import_failure(code, language::PYTHON, nullopt, finished(1, PYTHON_TRACEBACK), matcher));
}

TEST_F(ClassifierTest, ExtractPrefersCompileStageTest) {
    auto failure = extract_import_failure("x", language::PYTHON,
                                          finished(1, "ImportError: bad compile"),
                                          finished(1, MODULE_NOT_FOUND), matcher);
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->error, "ImportError: bad compile");
    EXPECT_EQ(failure->module, "");
}

TEST_F(ClassifierTest, CustomPatternTest) {
    import_error_matcher custom(R"re(cannot find package "([^"]+)")re");
    EXPECT_TRUE(custom.matches(R"re(main.go:3:8: cannot find package "github.com/foo/bar")re"));
    EXPECT_FALSE(custom.matches(MODULE_NOT_FOUND));
    EXPECT_THROW(import_error_matcher("(unclosed"), boost::regex_error);
}

TEST_F(ClassifierTest, HugeStderrLineTest) {
    string line(1 << 20, 'x');
    EXPECT_FALSE(matcher.matches(line));

    string stderr_data = "Traceback (most recent call last):\nImportError: " + line + "\nnext line";
    EXPECT_TRUE(matcher.matches(stderr_data));
    EXPECT_EQ(classify(nullopt, finished(1, stderr_data)), failure_reason::IMPORT_ERROR);

    auto failure = extract_import_failure("import x", language::PYTHON, nullopt, finished(1, stderr_data), matcher);
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->error, "ImportError: " + line);
    EXPECT_EQ(failure->module, "");
}
