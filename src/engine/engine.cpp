#include "engine/engine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "engine/plan.hpp"
#include "engine/reporter.hpp"

namespace executor {
using namespace std;

void request_context::bind_workspace(const string &id) {
    workspace_id = id;
}

void request_context::bind_container(const string &id) {
    container_id = id.substr(0, 12);
}

void request_context::transition(execution_state next) {
    bool finished = current == execution_state::COMPLETED ||
                    current == execution_state::TIMED_OUT ||
                    current == execution_state::SETUP_FAILED;
    if (current == execution_state::CLEANED_UP ||
        (int)next <= (int)current ||
        (finished && next != execution_state::CLEANED_UP))
        throw internal_error(fmt::format("Illegal state transition {} -> {} of request {}",
                                         get_display_message(current), get_display_message(next), workspace_id));

    VLOG(1) << "Request " << workspace_id << (container_id.empty() ? "" : " [" + container_id + "]") << ": "
            << get_display_message(current) << " -> " << get_display_message(next);
    current = next;
}

execution_state request_context::state() const {
    return current;
}

execution_engine::execution_engine(unique_ptr<container_runtime> runtime, const engine_options &options)
    : options(options), manager(move(runtime), options.workers) {}

bool execution_engine::healthy() {
    return manager.ping();
}

container_spec execution_engine::make_spec(const workspace &ws, const vector<string> &command) const {
    const language_profile &profile = get_language_profile(ws.lang());
    container_spec spec;
    spec.image = profile.image;
    spec.command = command;
    spec.workdir = options.container_workdir;
    spec.network_enabled = profile.requires_network;
    if (profile.requires_network)
        spec.env["NPM_CONFIG_CACHE"] = "/tmp/.npm";
    spec.limits = options.limits;
    return spec;
}

execution_result execution_engine::execute(const execution_request &request) {
    elapsed_time timer;
    if (request.timeout_seconds <= 0)
        throw invalid_argument(fmt::format("timeout must be a positive number of seconds, got {}", request.timeout_seconds));

    request_context ctx;
    // 语言无法确定或者文件无法写入时直接抛出异常，不会创建任何容器
    workspace ws(options.workspace_root, request.files, request.language);
    ctx.bind_workspace(ws.id());
    ctx.transition(execution_state::WORKSPACE_READY);

    LOG(INFO) << "Executing " << ws.id() << ": " << get_language_name(ws.lang()) << ' ' << ws.main_file()
              << (request.test_cases.empty() ? string(", single run") : fmt::format(", {} tests", request.test_cases.size()));

    execution_result result;
    try {
        if (request.test_cases.empty())
            result = run_single(request, ws, ctx, timer);
        else
            result = run_test_suite(request, ws, ctx, timer);
    } catch (executor_exception &ex) {
        LOG(ERROR) << "Request " << ws.id() << " failed with " << ex.kind() << " error: " << ex.what() << endl
                   << ex;
        result = report_failure(string("Internal error: ") + ex.what(), timer.milliseconds());
    } catch (exception &ex) {
        LOG(ERROR) << "Request " << ws.id() << " failed with internal error: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        result = report_failure(string("Internal error: ") + ex.what(), timer.milliseconds());
    }

    ws.destroy();
    ctx.transition(execution_state::CLEANED_UP);
    LOG(INFO) << "Request " << ws.id() << " finished with exit code " << result.exit_code << " in " << result.duration_ms << "ms";
    return result;
}

execution_result execution_engine::run_single(const execution_request &request, const workspace &ws, request_context &ctx, const elapsed_time &timer) {
    run_plan plan = make_run_plan(ws.lang(), ws.main_file(), ws.files(), options.container_workdir);
    VLOG(1) << "Command of " << ws.id() << ": " << plan.single_run.script();

    container_spec spec = make_spec(ws, plan.single_run.argv());
    unique_ptr<container> c;
    try {
        c = make_unique<container>(manager.create(spec));
        ctx.bind_container(c->id());
        ctx.transition(execution_state::CONTAINER_CREATED);
        manager.populate(*c, ws.dir(), options.container_workdir);
        ctx.transition(execution_state::POPULATED);
        manager.start(*c);
        ctx.transition(execution_state::RUNNING);
    } catch (container_setup_error &ex) {
        LOG(WARNING) << "Container setup of " << ws.id() << " failed: " << ex.what();
        ctx.transition(execution_state::SETUP_FAILED);
        if (c) manager.remove(*c);
        return report_failure(string("Container error: ") + ex.what(), timer.milliseconds());
    }

    execution_result result;
    int exit_code;
    if (!manager.await_completion(*c, chrono::seconds(request.timeout_seconds), exit_code)) {
        ctx.transition(execution_state::TIMED_OUT);
        manager.remove(*c);
        result = report_timeout(request.timeout_seconds, timer.milliseconds());
    } else {
        process_output output = manager.collect_output(*c);
        output.exit_code = exit_code;
        ctx.transition(execution_state::COMPLETED);
        manager.remove(*c);
        result = report_completion(output, timer.milliseconds());
    }
    return result;
}

execution_result execution_engine::run_test_suite(const execution_request &request, workspace &ws, request_context &ctx, const elapsed_time &timer) {
    const language_profile &profile = get_language_profile(ws.lang());
    const auto deadline = chrono::seconds(request.timeout_seconds);
    run_plan plan = make_run_plan(ws.lang(), ws.main_file(), ws.files(), options.container_workdir);

    // 过大的输入无法写进命令行，在传输之前写入工作目录
    vector<string> staged_inputs(request.test_cases.size());
    for (size_t i = 0; i < request.test_cases.size(); ++i) {
        if (request.test_cases[i].input.size() > MAX_INLINE_STDIN) {
            staged_inputs[i] = fmt::format(".stdin/{}", i + 1);
            ws.stage_file(staged_inputs[i], request.test_cases[i].input);
        }
    }

    // 入口命令只是让容器保持运行，编译和测试都通过 exec 执行
    shell_command keepalive;
    keepalive.then({"sleep", to_string(options.keepalive_seconds)});
    container_spec spec = make_spec(ws, keepalive.argv());

    unique_ptr<container> c;
    try {
        c = make_unique<container>(manager.create(spec));
        ctx.bind_container(c->id());
        ctx.transition(execution_state::CONTAINER_CREATED);
        manager.populate(*c, ws.dir(), options.container_workdir);
        ctx.transition(execution_state::POPULATED);
        manager.start(*c);
        ctx.transition(execution_state::RUNNING);
    } catch (container_setup_error &ex) {
        LOG(WARNING) << "Container setup of " << ws.id() << " failed: " << ex.what();
        ctx.transition(execution_state::SETUP_FAILED);
        if (c) manager.remove(*c);
        return report_failure(string("Container error: ") + ex.what(), timer.milliseconds());
    }

    if (options.provision && !profile.provision_command.empty()) {
        shell_command provision;
        provision.in_directory(options.container_workdir).then(profile.provision_command);
        process_output output;
        if (!manager.exec(*c, provision.argv(), deadline, output))
            LOG(WARNING) << "Provisioning of " << ws.id() << " timed out";
        else if (output.exit_code != 0)
            LOG(WARNING) << "Provisioning of " << ws.id() << " exited with " << output.exit_code << ": " << output.stderr_text;
    }

    // 编译只执行一次，编译失败时所有测试都不再运行
    bool build_ok = true, build_timed_out = false;
    int build_exit_code = 0;
    string build_error;
    if (!plan.build.empty()) {
        process_output output;
        if (!manager.exec(*c, plan.build.argv(), deadline, output)) {
            build_ok = false;
            build_timed_out = true;
            build_exit_code = -1;
            build_error = timeout_message(request.timeout_seconds);
        } else if (output.exit_code != 0) {
            build_ok = false;
            build_exit_code = output.exit_code;
            build_error = trim(output.stdout_text + "\n" + output.stderr_text);
            if (build_error.empty())
                build_error = fmt::format("Compilation exited with {}", output.exit_code);
        }
        if (!build_ok)
            LOG(INFO) << "Build of " << ws.id() << " failed: " << build_error;
    }

    vector<test_result> results;
    string first_error;
    for (size_t i = 0; i < request.test_cases.size(); ++i) {
        const test_case &testcase = request.test_cases[i];
        test_result r;
        r.index = i + 1;
        r.input = testcase.input;
        r.expected_output = trim(testcase.expected_output);

        if (!build_ok) {
            r.exit_code = build_exit_code;
            r.actual_output = "Error: " + build_error;
            r.passed = false;
            if (first_error.empty()) first_error = build_error;
            results.push_back(move(r));
            continue;
        }

        elapsed_time test_timer;
        process_output output;
        shell_command test = staged_inputs[i].empty() ? plan.test(testcase.input) : plan.test_from_file(staged_inputs[i]);
        if (!manager.exec(*c, test.argv(), deadline, output)) {
            output.exit_code = -1;
            output.stdout_text.clear();
            output.stderr_text = timeout_message(request.timeout_seconds);
        }
        r.duration_ms = test_timer.milliseconds();
        r.exit_code = output.exit_code;
        r.actual_output = trim(output.stdout_text);
        r.passed = output.exit_code == 0 && r.actual_output == r.expected_output;

        if (!is_blank(output.stderr_text)) {
            string error = trim(output.stderr_text);
            if (first_error.empty()) first_error = error;
            r.actual_output = r.actual_output.empty() ? "Error: " + error : r.actual_output + "\nError: " + error;
        }

        VLOG(1) << "Test " << r.index << " of " << ws.id() << (r.passed ? " passed" : " failed") << " in " << r.duration_ms << "ms";
        results.push_back(move(r));
    }

    ctx.transition(build_timed_out ? execution_state::TIMED_OUT : execution_state::COMPLETED);
    manager.remove(*c);
    return report_test_suite(move(results), first_error, timer.milliseconds());
}

}  // namespace executor
