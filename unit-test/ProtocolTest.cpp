#include "gtest/gtest.h"
#include "engine/reporter.hpp"
#include "protocol.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace executor;
using json = nlohmann::ordered_json;

TEST(ProtocolTest, ParseFullRequest) {
    execution_request request = parse_request(R"json({
        "language": "python",
        "files": {"util.py": "X = 1", "main.py": "print(input())", "lib/a.py": ""},
        "timeout": 5,
        "test_cases": [{"input": "hello", "output": "hello"}, {"input": "1"}]
    })json"s, 30);

    EXPECT_EQ(request.language, "python");
    EXPECT_EQ(request.timeout_seconds, 5);
    ASSERT_EQ(request.files.size(), 3u);
    // 保持提交顺序
    EXPECT_EQ(request.files[0].path, "util.py");
    EXPECT_EQ(request.files[1].path, "main.py");
    EXPECT_EQ(request.files[1].content, "print(input())");
    EXPECT_EQ(request.files[2].path, "lib/a.py");
    ASSERT_EQ(request.test_cases.size(), 2u);
    EXPECT_EQ(request.test_cases[0].input, "hello");
    EXPECT_EQ(request.test_cases[0].expected_output, "hello");
    EXPECT_EQ(request.test_cases[1].expected_output, "");
}

TEST(ProtocolTest, DefaultTimeoutAndNoTests) {
    execution_request request = parse_request(R"({"language": "go", "files": {"main.go": ""}})"s, 30);
    EXPECT_EQ(request.timeout_seconds, 30);
    EXPECT_TRUE(request.test_cases.empty());

    request = parse_request(R"({"language": "go", "files": {"main.go": ""}, "timeout": null, "test_cases": null})"s, 12);
    EXPECT_EQ(request.timeout_seconds, 12);
    EXPECT_TRUE(request.test_cases.empty());
}

TEST(ProtocolTest, RejectMalformedRequests) {
    EXPECT_THROW(parse_request("{not json"s, 30), invalid_argument);
    EXPECT_THROW(parse_request("[]"s, 30), invalid_argument);
    EXPECT_THROW(parse_request(R"({"language": "python"})"s, 30), invalid_argument);
    EXPECT_THROW(parse_request(R"({"files": {"main.py": 1}})"s, 30), invalid_argument);
    EXPECT_THROW(parse_request(R"({"files": {"main.py": ""}, "timeout": "soon"})"s, 30), invalid_argument);
    EXPECT_THROW(parse_request(R"({"files": {"main.py": ""}, "test_cases": {}})"s, 30), invalid_argument);
}

TEST(ProtocolTest, SingleRunResult) {
    process_output output;
    output.stdout_text = "2\n";
    execution_result result = report_completion(output, 42);

    json expected = {{"stdout", "2\n"},
                     {"stderr", ""},
                     {"exit_code", 0},
                     {"duration_ms", 42},
                     {"test_results", nullptr},
                     {"verdict", nullptr}};
    EXPECT_JSON_EQ(to_json(result), expected);
}

TEST(ProtocolTest, TestSuiteResult) {
    test_result r;
    r.index = 1;
    r.input = "1";
    r.expected_output = "2";
    r.actual_output = "1";
    r.passed = false;
    r.exit_code = 0;
    r.duration_ms = 7;
    execution_result result = report_test_suite({r}, "", 100);

    json j = to_json(result);
    EXPECT_EQ(j["verdict"], "WRONG ANSWER");
    EXPECT_EQ(j["exit_code"], 1);
    json expected_test = {{"test_index", 1},
                          {"input", "1"},
                          {"expected_output", "2"},
                          {"actual_output", "1"},
                          {"passed", false},
                          {"exit_code", 0},
                          {"duration_ms", 7}};
    EXPECT_JSON_EQ(j["test_results"][0], expected_test);
    EXPECT_EQ(j["stdout"], "Verdict: WRONG ANSWER\nPassed: 0/1\n\n[FAIL] Test 1: 1 (expected: 2)");
}

TEST(ProtocolTest, ErrorEnvelope) {
    json expected = {{"error", "Unsupported language: ruby"}, {"kind", "unsupported_language"}};
    EXPECT_JSON_EQ(error_envelope("Unsupported language: ruby", "unsupported_language"), expected);
}

TEST(ReporterTest, VerdictRequiresEveryTest) {
    test_result pass, fail;
    pass.passed = true;
    fail.passed = false;
    EXPECT_EQ(judge_verdict({pass, pass}), verdict::ACCEPTED);
    EXPECT_EQ(judge_verdict({pass, fail, pass}), verdict::WRONG_ANSWER);
    EXPECT_EQ(judge_verdict({}), verdict::ACCEPTED);
}

TEST(ReporterTest, TimeoutReport) {
    execution_result result = report_timeout(3, 3001);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.stderr_text, "Execution timeout after 3 seconds");
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_FALSE(result.verdict);
}
