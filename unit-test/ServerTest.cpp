#include <filesystem>
#include <sstream>
#include "gtest/gtest.h"
#include "common/utils.hpp"
#include "config.hpp"
#include "server.hpp"
#include "test/fake_container_runtime.hpp"

using namespace std;
using namespace std::chrono;
using namespace std::filesystem;
using namespace executor;
using json = nlohmann::json;

class ServerTest : public ::testing::Test {
protected:
    fake_container_runtime *fake;
    unique_ptr<execution_engine> engine;
    path root;

    void SetUp() override {
        root = WORKSPACE_DIR / "server-test";
        create_directories(root);
        auto runtime = make_unique<fake_container_runtime>();
        fake = runtime.get();
        // 程序输出主文件名，a.py 运行得最慢
        fake->handler = [](const vector<string> &command) {
            fake_container_runtime::behaviour b;
            string script = script_of(command);
            for (string name : {"a", "b", "c"})
                if (script.find("'" + name + ".py'") != string::npos)
                    b.stdout_text = name;
            if (b.stdout_text == "a")
                b.delay = milliseconds(600);
            return b;
        };
        engine_options options;
        options.workspace_root = root;
        options.workers = 4;
        engine = make_unique<execution_engine>(move(runtime), options);
    }

    void TearDown() override {
        engine.reset();
        error_code ec;
        remove_all(root, ec);
    }

    static string request_line(const string &name) {
        return R"({"language": "python", "files": {")" + name + R"(.py": ""}})";
    }

    vector<json> run(const string &input, size_t concurrency) {
        istringstream in(input);
        ostringstream out;
        serve(*engine, in, out, concurrency);
        vector<json> lines;
        istringstream result(out.str());
        string line;
        while (getline(result, line))
            lines.push_back(json::parse(line));
        return lines;
    }
};

TEST_F(ServerTest, ResultsFollowInputOrder) {
    string input = request_line("a") + "\n" + request_line("b") + "\n\n{not json\n" + request_line("c") + "\n";
    vector<json> lines = run(input, 3);

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0]["stdout"], "a");
    EXPECT_EQ(lines[1]["stdout"], "b");
    EXPECT_EQ(lines[2]["kind"], "invalid_request");
    EXPECT_EQ(lines[3]["stdout"], "c");
    EXPECT_EQ(fake->removes.load(), 3);
}

TEST_F(ServerTest, RequestsRunConcurrently) {
    string input;
    for (int i = 0; i < 3; ++i)
        input += request_line("a") + "\n";

    elapsed_time timer;
    vector<json> lines = run(input, 3);
    ASSERT_EQ(lines.size(), 3u);
    for (auto &line : lines)
        EXPECT_EQ(line["stdout"], "a");
    // 三个请求同时运行，总时间接近一个请求的时间
    EXPECT_LT(timer.milliseconds(), 1500);
}

TEST_F(ServerTest, HandleRequestReportsEnvelope) {
    bool ok = true;
    json envelope = json::parse(handle_request(*engine, R"({"files": {"main.rb": ""}})", ok));
    EXPECT_FALSE(ok);
    EXPECT_EQ(envelope["kind"], "unsupported_language");

    json result = json::parse(handle_request(*engine, request_line("b"), ok));
    EXPECT_TRUE(ok);
    EXPECT_EQ(result["stdout"], "b");
}
