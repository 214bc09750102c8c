#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "runner/notebook.hpp"
#include "test/sandbox_test.hpp"

using namespace std;
using namespace sandbox;
using namespace sandbox::test;

class NotebookTest : public ::testing::Test {
protected:
    notebook_config bash_driver() {
        notebook_config config;
        config.command = "bash " + (filesystem::path(__FILE__).parent_path() / "test" / "bash_notebook_driver.sh").string();
        config.env.workspace_root = root.path();
        config.env.script_dir = script_dir();
        return config;
    }

    run_jupyter_args cells(vector<string> cells) {
        run_jupyter_args args;
        args.cells = move(cells);
        args.cell_timeout = chrono::seconds(5);
        args.total_timeout = chrono::seconds(20);
        return args;
    }

    temp_directory root;
};

TEST_F(NotebookTest, SequentialCellsTest) {
    auto result = run_jupyter(cells({"x=1; echo $x", "echo $((x + 1)); echo warning >&2", "echo -n no-newline"}), bash_driver());

    EXPECT_EQ(result.driver.status, command_run_status::FINISHED);
    EXPECT_EQ(result.driver.return_code, 0);
    ASSERT_EQ(result.cells.size(), 3u);
    EXPECT_EQ(result.cells[0].stdout_data, "1\n");
    EXPECT_EQ(result.cells[0].execution_count, 1);
    EXPECT_EQ(result.cells[0].status, "ok");
    EXPECT_EQ(result.cells[1].stdout_data, "2\n");
    EXPECT_EQ(result.cells[1].stderr_data, "warning\n");
    EXPECT_EQ(result.cells[1].execution_count, 2);
    EXPECT_EQ(result.cells[2].stdout_data, "no-newline");
    EXPECT_EQ(root.entries(), 0u);
}

TEST_F(NotebookTest, FailingCellTest) {
    auto result = run_jupyter(cells({"false", "echo after"}), bash_driver());
    EXPECT_EQ(result.driver.status, command_run_status::FINISHED);
    ASSERT_EQ(result.cells.size(), 2u);
    EXPECT_EQ(result.cells[0].status, "error");
    EXPECT_EQ(result.cells[1].status, "ok");
    EXPECT_EQ(result.cells[1].stdout_data, "after\n");
}

TEST_F(NotebookTest, DisplayTest) {
    auto result = run_jupyter(cells({"echo before; echo \"$SANDBOX_CELL_MARKER display {\\\"image/png\\\": \\\"AAAA\\\"}\"; echo after"}), bash_driver());
    ASSERT_EQ(result.cells.size(), 1u);
    EXPECT_EQ(result.cells[0].stdout_data, "before\nafter\n");
    ASSERT_EQ(result.cells[0].display.size(), 1u);
    EXPECT_EQ(result.cells[0].display[0], R"({"image/png": "AAAA"})");
}

TEST_F(NotebookTest, DriverKilledMidSequenceTest) {
    auto result = run_jupyter(cells({"echo 1", "echo 2", "kill -9 $$", "echo 4", "echo 5"}), bash_driver());
    EXPECT_EQ(result.driver.status, command_run_status::ERROR);
    EXPECT_EQ(result.driver.return_code, 128 + 9);
    ASSERT_EQ(result.cells.size(), 2u);
    EXPECT_EQ(result.cells[1].stdout_data, "2\n");
    EXPECT_NE(result.driver.stderr_data.find("2 of 5"), string::npos);
}

TEST_F(NotebookTest, CellTimeoutTest) {
    auto args = cells({"echo fast", "sleep 30 & echo $! > child.pid; wait", "echo never"});
    args.cell_timeout = chrono::milliseconds(500);
    args.fetch_files = {"child.pid"};

    elapsed_time timer;
    auto result = run_jupyter(args, bash_driver());
    EXPECT_LT(timer.seconds(), 5);
    EXPECT_EQ(result.driver.status, command_run_status::TIME_LIMIT_EXCEEDED);
    EXPECT_FALSE(result.driver.return_code);
    ASSERT_EQ(result.cells.size(), 1u);

    ASSERT_TRUE(result.files.count("child.pid"));
    pid_t child = stoi(base64_decode(result.files.at("child.pid")));
    EXPECT_TRUE(wait_process_gone(child, chrono::seconds(2)));
    EXPECT_EQ(root.entries(), 0u);
}

TEST_F(NotebookTest, TotalTimeoutTest) {
    auto args = cells({"sleep 0.4", "sleep 0.4", "sleep 0.4", "sleep 0.4", "sleep 0.4"});
    args.total_timeout = chrono::seconds(1);

    auto result = run_jupyter(args, bash_driver());
    EXPECT_EQ(result.driver.status, command_run_status::TIME_LIMIT_EXCEEDED);
    EXPECT_LT(result.cells.size(), 5u);
    EXPECT_GE(result.cells.size(), 1u);
}

TEST_F(NotebookTest, DriverExitsImmediatelyTest) {
    notebook_config config = bash_driver();
    config.command = "exit 3";
    auto result = run_jupyter(cells({"echo 1"}), config);
    EXPECT_EQ(result.driver.status, command_run_status::ERROR);
    EXPECT_EQ(result.driver.return_code, 3);
    EXPECT_TRUE(result.cells.empty());
}

TEST_F(NotebookTest, DriverMustExitAfterStdinClosedTest) {
    notebook_config config = bash_driver();
    config.command += "; sleep 30";
    auto args = cells({"echo 1"});
    args.total_timeout = chrono::seconds(1);

    auto result = run_jupyter(args, config);
    EXPECT_EQ(result.driver.status, command_run_status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.cells.size(), 1u);
}

TEST_F(NotebookTest, FilesTest) {
    auto args = cells({"cat in.txt > out.txt"});
    args.files["in.txt"] = base64_encode("shared input");
    args.fetch_files = {"out.txt"};

    auto result = run_jupyter(args, bash_driver());
    EXPECT_EQ(result.driver.status, command_run_status::FINISHED);
    ASSERT_TRUE(result.files.count("out.txt"));
    EXPECT_EQ(base64_decode(result.files.at("out.txt")), "shared input");
}

TEST_F(NotebookTest, PythonDriverTest) {
    if (!has_command("python3")) GTEST_SKIP() << "python3 is not installed";
    notebook_config config = bash_driver();
    config.command = "python3 -u {script_dir}/notebook_driver.py";

    auto result = run_jupyter(cells({"a = 21", "print(a * 2)", "a * 2", "import nonexistent_module"}), config);
    EXPECT_EQ(result.driver.status, command_run_status::FINISHED);
    ASSERT_EQ(result.cells.size(), 4u);
    EXPECT_EQ(result.cells[1].stdout_data, "42\n");
    ASSERT_EQ(result.cells[2].display.size(), 1u);
    EXPECT_EQ(result.cells[2].display[0], R"({"text/plain": "42"})");
    EXPECT_EQ(result.cells[3].status, "error");
    EXPECT_NE(result.cells[3].stderr_data.find("No module named 'nonexistent_module'"), string::npos);
}

TEST(CellStreamParserTest, SplitMarkerTest) {
    cell_stream_parser parser("@@mark");
    string data = "hello @@ma";
    EXPECT_FALSE(parser.feed(data));
    data += "rk display payload\nworld\n@@mark do";
    EXPECT_FALSE(parser.feed(data));
    data += "ne 7\nnext cell";
    EXPECT_TRUE(parser.feed(data));
    EXPECT_EQ(parser.output(), "hello world\n");
    EXPECT_EQ(parser.display(), vector<string>({"payload"}));
    EXPECT_EQ(parser.return_code(), 7);

    parser.next_cell();
    data += "\n@@mark done\n";
    EXPECT_TRUE(parser.feed(data));
    EXPECT_EQ(parser.output(), "next cell\n");
    EXPECT_FALSE(parser.return_code());
}
