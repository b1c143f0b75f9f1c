#include "protocol.hpp"
#include <fmt/core.h>
#include "common/json_utils.hpp"

namespace executor {
using namespace std;
using json = nlohmann::ordered_json;

execution_request parse_request(const json &j, int default_timeout) {
    if (!j.is_object())
        throw invalid_argument("Request should be a json object");

    execution_request request;
    // 语言可以省略，此时只根据文件扩展名判断
    request.language = get_value_def<string>(j, string(), "language");
    request.timeout_seconds = get_value_def<int>(j, default_timeout, "timeout");

    if (!exists(j, "files") || !j.at("files").is_object())
        throw invalid_argument("Request should contain a files object");
    for (auto &[path, content] : j.at("files").items()) {
        if (!content.is_string())
            throw invalid_argument(fmt::format("Content of file {} should be a string", path));
        request.files.push_back({path, content.get<string>()});
    }

    if (exists(j, "test_cases")) {
        const json &cases = j.at("test_cases");
        if (!cases.is_array())
            throw invalid_argument("test_cases should be an array");
        for (auto &c : cases) {
            test_case testcase;
            testcase.input = get_value_def<string>(c, string(), "input");
            testcase.expected_output = get_value_def<string>(c, string(), "output");
            request.test_cases.push_back(move(testcase));
        }
    }
    return request;
}

execution_request parse_request(const string &text, int default_timeout) {
    json j;
    try {
        j = json::parse(text);
    } catch (json::parse_error &ex) {
        throw invalid_argument(string("Malformed request: ") + ex.what());
    }
    return parse_request(j, default_timeout);
}

json to_json(const execution_result &result) {
    json j;
    j["stdout"] = result.stdout_text;
    j["stderr"] = result.stderr_text;
    j["exit_code"] = result.exit_code;
    j["duration_ms"] = result.duration_ms;

    if (result.test_results) {
        j["test_results"] = json::array();
        for (auto &r : *result.test_results) {
            j["test_results"].push_back({{"test_index", r.index},
                                         {"input", r.input},
                                         {"expected_output", r.expected_output},
                                         {"actual_output", r.actual_output},
                                         {"passed", r.passed},
                                         {"exit_code", r.exit_code},
                                         {"duration_ms", r.duration_ms}});
        }
    } else {
        j["test_results"] = nullptr;
    }

    if (result.verdict)
        j["verdict"] = get_display_message(*result.verdict);
    else
        j["verdict"] = nullptr;
    return j;
}

json error_envelope(const string &message, const string &kind) {
    return {{"error", message}, {"kind", kind}};
}

}  // namespace executor
