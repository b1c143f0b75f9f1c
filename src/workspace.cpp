#include "workspace.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/erase.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace executor {
using namespace std;
namespace fs = std::filesystem;

void resolve_language(const vector<source_file> &files, const string &declared, language &lang, string &main_file) {
    if (files.empty())
        throw workspace_io_error("Submission contains no files");

    // 扩展名的优先级高于声明的语言
    for (auto &file : files) {
        if (detect_language(file.path, lang)) {
            main_file = file.path;
            return;
        }
    }

    if (!parse_language(declared, lang))
        throw unsupported_language_error(declared);

    // 没有任何文件带有可识别的扩展名，因此主文件只能是第一个文件
    main_file = files.front().path;
}

static string generate_workspace_name() {
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    boost::uuids::uuid uuid;
    {
        scoped_lock guard(generator_mutex);
        uuid = generator();
    }
    string hex = boost::uuids::to_string(uuid);
    boost::algorithm::erase_all(hex, "-");
    return "executor_run_" + hex.substr(0, 12);
}

workspace::workspace(const fs::path &root, const vector<source_file> &files, const string &declared_language) {
    resolve_language(files, declared_language, resolved, main);

    for (auto &file : files) {
        try {
            assert_safe_path(file.path);
        } catch (invalid_argument &ex) {
            throw workspace_io_error(ex.what());
        }
    }

    name = generate_workspace_name();
    path = root / name;

    try {
        fs::create_directories(path);
        for (auto &file : files) {
            write_file_content(path / file.path, file.content);
            paths.push_back(file.path);
        }
    } catch (exception &ex) {
        destroy();
        throw workspace_io_error(string("Unable to materialize workspace ") + path.string() + ": " + ex.what());
    }

    VLOG(1) << "Workspace " << name << " ready with " << paths.size() << " files, language "
            << get_language_name(resolved) << ", main file " << main;
}

void workspace::stage_file(const string &relative, const string &content) {
    try {
        write_file_content(path / assert_safe_path(relative), content);
    } catch (exception &ex) {
        throw workspace_io_error(string("Unable to stage ") + relative + " in " + name + ": " + ex.what());
    }
}

workspace::~workspace() {
    destroy();
}

const string &workspace::id() const {
    return name;
}

const fs::path &workspace::dir() const {
    return path;
}

language workspace::lang() const {
    return resolved;
}

const string &workspace::main_file() const {
    return main;
}

const vector<string> &workspace::files() const {
    return paths;
}

void workspace::destroy() noexcept {
    if (destroyed) return;
    destroyed = true;
    error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove workspace " << path << ": " << ec.message();
}

}  // namespace executor
