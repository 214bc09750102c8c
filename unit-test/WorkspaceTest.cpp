#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "process/executor.hpp"
#include "runner/workspace.hpp"
#include "test/sandbox_test.hpp"

using namespace std;
using namespace sandbox;
using namespace sandbox::test;

class WorkspaceTest : public ::testing::Test {
protected:
    temp_directory root;
};

TEST_F(WorkspaceTest, CreateAndRemoveTest) {
    filesystem::path path;
    {
        workspace ws(root.path());
        path = ws.path();
        EXPECT_TRUE(filesystem::is_directory(path));
        EXPECT_EQ(path.parent_path(), root.path());
        ws.write("a/b/c.txt", "nested");
    }
    EXPECT_FALSE(filesystem::exists(path));
    EXPECT_EQ(root.entries(), 0u);
}

TEST_F(WorkspaceTest, RemoveRestrictedDirectoriesTest) {
    filesystem::path path;
    {
        workspace ws(root.path());
        path = ws.path();
        process::command_options options;
        options.command = "mkdir -p d/e && touch d/f d/e/g && chmod 0 d/e && chmod 0 d && chmod 0 .";
        options.workdir = ws.path();
        auto result = process::run_command(options);
        ASSERT_EQ(result.return_code, 0) << result.stderr_data;
    }
    EXPECT_FALSE(filesystem::exists(path));
    EXPECT_EQ(root.entries(), 0u);
}

TEST_F(WorkspaceTest, UniqueDirectoryTest) {
    workspace a(root.path()), b(root.path());
    EXPECT_NE(a.path(), b.path());
}

TEST_F(WorkspaceTest, MaterializeTest) {
    workspace ws(root.path());
    file_map files;
    files["data/input.txt"] = base64_encode("hello world");
    files["empty.txt"] = nullopt;
    files["binary.bin"] = base64_encode(string("\0\1\2\xff", 4));
    ws.materialize(files);

    EXPECT_EQ(read_file_content(ws.path() / "data" / "input.txt"), "hello world");
    EXPECT_TRUE(filesystem::is_regular_file(ws.path() / "empty.txt"));
    EXPECT_EQ(filesystem::file_size(ws.path() / "empty.txt"), 0u);
    EXPECT_EQ(read_file_content(ws.path() / "binary.bin"), string("\0\1\2\xff", 4));
}

TEST_F(WorkspaceTest, UnsafePathTest) {
    workspace ws(root.path());
    EXPECT_THROW(ws.materialize({{"../escape.txt", nullopt}}), unsafe_path_error);
    EXPECT_THROW(ws.materialize({{"/etc/escape.txt", nullopt}}), unsafe_path_error);
    EXPECT_THROW(ws.materialize({{"a/../../escape.txt", nullopt}}), unsafe_path_error);
    EXPECT_THROW(ws.fetch({"../../etc/passwd"}), unsafe_path_error);
    EXPECT_FALSE(filesystem::exists(root.path() / "escape.txt"));
}

TEST_F(WorkspaceTest, InvalidPayloadTest) {
    workspace ws(root.path());
    EXPECT_THROW(ws.materialize({{"a.txt", string("not base64!")}}), invalid_payload_error);
}

TEST_F(WorkspaceTest, FetchTest) {
    workspace ws(root.path());
    ws.write("out.txt", "result");
    filesystem::create_directories(ws.path() / "dir");

    auto files = ws.fetch({"out.txt", "missing.txt", "dir"});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(base64_decode(files.at("out.txt")), "result");
}

TEST_F(WorkspaceTest, FetchSymlinkEscapeTest) {
    temp_directory outside;
    write_file_content(outside.path() / "secret.txt", "secret");

    workspace ws(root.path());
    filesystem::create_symlink(outside.path() / "secret.txt", ws.path() / "link.txt");
    EXPECT_TRUE(ws.fetch({"link.txt"}).empty());
}
