#include "engine/plan.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <filesystem>

namespace executor {
using namespace std;
namespace fs = std::filesystem;

shell_command run_plan::test(const string &input) const {
    shell_command cmd;
    cmd.in_directory(workdir).then(runner).with_stdin(input);
    return cmd;
}

shell_command run_plan::test_from_file(const string &path) const {
    shell_command cmd;
    cmd.in_directory(workdir).then(runner).with_stdin_file(path);
    return cmd;
}

static vector<string> typescript_compiler(const vector<string> &files) {
    vector<string> args = {"npx", "-y", "tsc", "--target", "ES2020", "--module", "commonjs", "--esModuleInterop", "--skipLibCheck"};
    for (auto &file : files)
        if (boost::algorithm::iends_with(file, ".ts"))
            args.push_back(file);
    return args;
}

run_plan make_run_plan(language lang, const string &main_file, const vector<string> &files, const string &workdir) {
    run_plan plan;
    plan.workdir = workdir;
    plan.single_run.in_directory(workdir);
    plan.build.in_directory(workdir);

    switch (lang) {
        case language::python:
            plan.runner = {"python", main_file};
            plan.single_run.then(plan.runner);
            break;

        case language::typescript:
            if (boost::algorithm::iends_with(main_file, ".ts")) {
                string script = fs::path(main_file).replace_extension(".js").string();
                auto compiler = typescript_compiler(files);
                plan.runner = {"node", script};
                plan.single_run.then(compiler).merge_stderr().then(plan.runner);
                plan.build.then(compiler);
            } else {
                // JavaScript 不需要编译
                plan.runner = {"node", main_file};
                plan.single_run.then(plan.runner);
            }
            break;

        case language::go:
            plan.runner = {"./main_bin"};
            plan.single_run.then({"go", "run", main_file});
            plan.build.then({"go", "build", "-o", "main_bin", main_file});
            break;

        case language::java: {
            fs::path main(main_file);
            string classpath = main.has_parent_path() ? main.parent_path().string() : ".";
            plan.runner = {"java", "-cp", classpath, main.stem().string()};
            plan.single_run.then({"javac", main_file}).then(plan.runner);
            plan.build.then({"javac", main_file});
            break;
        }
    }
    return plan;
}

}  // namespace executor
