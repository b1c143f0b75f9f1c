#include <filesystem>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "workspace.hpp"

using namespace std;
using namespace std::filesystem;
using namespace executor;

class WorkspaceTest : public ::testing::Test {
protected:
    path root;

    void SetUp() override {
        root = WORKSPACE_DIR / "workspace-test";
        create_directories(root);
    }

    void TearDown() override {
        error_code ec;
        remove_all(root, ec);
    }

    size_t entries() {
        return distance(directory_iterator(root), directory_iterator());
    }
};

TEST_F(WorkspaceTest, MaterializeFilesAndRemoveOnDestruction) {
    path dir;
    {
        workspace ws(root, {{"main.py", "import lib.util\n"}, {"lib/util.py", "X = 1\n"}}, "python");
        dir = ws.dir();
        EXPECT_EQ(dir.parent_path(), root);
        EXPECT_EQ(ws.id().rfind("executor_run_", 0), 0u);
        EXPECT_EQ(ws.id().size(), string("executor_run_").size() + 12);
        EXPECT_EQ(ws.lang(), language::python);
        EXPECT_EQ(ws.main_file(), "main.py");
        EXPECT_EQ(ws.files(), (vector<string>{"main.py", "lib/util.py"}));
        EXPECT_EQ(read_file_content(dir / "main.py"), "import lib.util\n");
        EXPECT_EQ(read_file_content(dir / "lib" / "util.py"), "X = 1\n");
    }
    EXPECT_FALSE(exists(dir));
}

TEST_F(WorkspaceTest, DestroyIsIdempotent) {
    workspace ws(root, {{"main.go", "package main"}}, "go");
    ws.destroy();
    EXPECT_FALSE(exists(ws.dir()));
    ws.destroy();
    EXPECT_EQ(entries(), 0u);
}

TEST_F(WorkspaceTest, UniqueDirectoryPerRequest) {
    workspace a(root, {{"main.py", ""}}, "python");
    workspace b(root, {{"main.py", ""}}, "python");
    EXPECT_NE(a.id(), b.id());
    EXPECT_EQ(entries(), 2u);
}

TEST_F(WorkspaceTest, RejectUnsafePaths) {
    EXPECT_THROW(workspace(root, {{"../escape.py", ""}}, "python"), workspace_io_error);
    EXPECT_THROW(workspace(root, {{"/etc/passwd.py", ""}}, "python"), workspace_io_error);
    EXPECT_THROW(workspace(root, {{"a/../../b.py", ""}}, "python"), workspace_io_error);
    EXPECT_EQ(entries(), 0u);
}

TEST_F(WorkspaceTest, RejectEmptySubmission) {
    EXPECT_THROW(workspace(root, {}, "python"), workspace_io_error);
    EXPECT_EQ(entries(), 0u);
}

TEST_F(WorkspaceTest, UnsupportedLanguageCreatesNothing) {
    EXPECT_THROW(workspace(root, {{"program.rb", "puts 1"}}, "ruby"), unsupported_language_error);
    EXPECT_EQ(entries(), 0u);
}

TEST_F(WorkspaceTest, WriteFailureRemovesPartialWorkspace) {
    // 第二个文件的父目录是第一个文件，无法创建
    EXPECT_THROW(workspace(root, {{"main.py", ""}, {"main.py/inner.py", ""}}, "python"), workspace_io_error);
    EXPECT_EQ(entries(), 0u);
}

TEST(IOUtilsTest, Utf8Sanitize) {
    EXPECT_EQ(utf8_sanitize("hello"), "hello");
    EXPECT_EQ(utf8_sanitize("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(utf8_sanitize("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(utf8_sanitize("\xC3"), "\xEF\xBF\xBD");
    EXPECT_EQ(utf8_sanitize("\xE4\xBD\xA0\xE5\xA5\xBD"), "\xE4\xBD\xA0\xE5\xA5\xBD");
    EXPECT_EQ(utf8_sanitize("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}
