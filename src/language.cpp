#include "language.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <filesystem>
#include "common/exceptions.hpp"

namespace executor {
using namespace std;

// clang-format off
static const language_profile python_profile{
    "python:3.12-slim", "main.py", {".py"}, {}, false};

static const language_profile typescript_profile{
    "node:20-slim", "main.ts", {".ts", ".js"}, {"npm", "install", "-g", "typescript", "ts-node"}, true};

static const language_profile go_profile{
    "golang:1.23-alpine", "main.go", {".go"}, {}, false};

static const language_profile java_profile{
    "openjdk:21-jdk-slim", "Main.java", {".java"}, {}, false};
// clang-format on

static const language all_languages[] = {language::python, language::typescript, language::go, language::java};

const language_profile &get_language_profile(language lang) {
    switch (lang) {
        case language::python:
            return python_profile;
        case language::typescript:
            return typescript_profile;
        case language::go:
            return go_profile;
        case language::java:
            return java_profile;
    }
    throw unsupported_language_error(to_string(static_cast<int>(lang)));
}

const char *get_language_name(language lang) {
    switch (lang) {
        case language::python:
            return "python";
        case language::typescript:
            return "typescript";
        case language::go:
            return "go";
        case language::java:
            return "java";
    }
    return "unknown";
}

bool parse_language(const string &name, language &lang) {
    for (language l : all_languages) {
        if (name == get_language_name(l)) {
            lang = l;
            return true;
        }
    }
    return false;
}

bool has_language_extension(const string &path, language lang) {
    string ext = boost::algorithm::to_lower_copy(filesystem::path(path).extension().string());
    if (ext.empty()) return false;
    for (auto &e : get_language_profile(lang).extensions)
        if (e == ext) return true;
    return false;
}

bool detect_language(const string &path, language &lang) {
    for (language l : all_languages) {
        if (has_language_extension(path, l)) {
            lang = l;
            return true;
        }
    }
    return false;
}

}  // namespace executor
