#include "engine/reporter.hpp"
#include <fmt/core.h>
#include <algorithm>
#include "common/utils.hpp"

namespace executor {
using namespace std;

string timeout_message(int timeout_seconds) {
    return fmt::format("Execution timeout after {} seconds", timeout_seconds);
}

execution_result report_completion(const process_output &output, long long duration_ms) {
    execution_result result;
    result.stdout_text = output.stdout_text;
    result.exit_code = output.exit_code;
    if (output.exit_code != 0 && !is_blank(output.stderr_text))
        result.stderr_text = output.stderr_text;
    result.duration_ms = duration_ms;
    return result;
}

execution_result report_timeout(int timeout_seconds, long long duration_ms) {
    return report_failure(timeout_message(timeout_seconds), duration_ms);
}

execution_result report_failure(const string &message, long long duration_ms) {
    execution_result result;
    result.stderr_text = message;
    result.exit_code = -1;
    result.duration_ms = duration_ms;
    return result;
}

verdict judge_verdict(const vector<test_result> &results) {
    bool all_passed = all_of(results.begin(), results.end(), [](const test_result &r) { return r.passed; });
    return all_passed ? verdict::ACCEPTED : verdict::WRONG_ANSWER;
}

string format_transcript(verdict v, const vector<test_result> &results) {
    size_t passed = count_if(results.begin(), results.end(), [](const test_result &r) { return r.passed; });
    string transcript = fmt::format("Verdict: {}\nPassed: {}/{}\n", get_display_message(v), passed, results.size());
    for (auto &r : results) {
        transcript += fmt::format("\n[{}] Test {}: {} (expected: {})",
                                  r.passed ? "PASS" : "FAIL", r.index, r.actual_output, r.expected_output);
    }
    return transcript;
}

execution_result report_test_suite(vector<test_result> results, const string &first_error, long long duration_ms) {
    execution_result result;
    verdict v = judge_verdict(results);
    result.stdout_text = format_transcript(v, results);
    if (v != verdict::ACCEPTED)
        result.stderr_text = first_error;
    result.exit_code = v == verdict::ACCEPTED ? 0 : 1;
    result.duration_ms = duration_ms;
    result.verdict = v;
    result.test_results = move(results);
    return result;
}

}  // namespace executor
