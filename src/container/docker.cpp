#include "container/docker.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <mutex>
#include <sstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace executor {
using namespace std;
using namespace nlohmann;

// 结束容器内除了 1 号进程和当前 shell 以外的所有进程
// 只依赖 /proc 和 shell 内置命令，slim 和 alpine 镜像没有 ps 也能工作
static const char *TERMINATE_SCRIPT =
    "for p in /proc/[0-9]*; do pid=${p#/proc/}; "
    "if [ \"$pid\" != 1 ] && [ \"$pid\" != $$ ]; then kill -9 \"$pid\" 2>/dev/null; fi; "
    "done; true";

json build_create_body(const container_spec &spec) {
    json env = json::array();
    for (auto &[key, value] : spec.env)
        env.push_back(key + "=" + value);

    json host_config = {{"Memory", spec.limits.memory_bytes},
                        {"CpuPeriod", spec.limits.cpu_period},
                        {"CpuQuota", spec.limits.cpu_quota}};
    if (!spec.network_enabled)
        host_config["NetworkMode"] = "none";

    return {{"Image", spec.image},
            {"Cmd", spec.command},
            {"WorkingDir", spec.workdir},
            {"Env", env},
            {"Tty", false},
            {"OpenStdin", false},
            {"NetworkDisabled", !spec.network_enabled},
            {"HostConfig", host_config}};
}

void demultiplex_stream(const string &raw, string &out, string &err) {
    size_t pos = 0;
    while (pos < raw.size()) {
        unsigned char type = raw[pos];
        if (pos + 8 > raw.size() || type > 2 || raw[pos + 1] || raw[pos + 2] || raw[pos + 3]) {
            out.append(raw, pos, string::npos);
            return;
        }
        size_t length = ((size_t)(unsigned char)raw[pos + 4] << 24) |
                         ((size_t)(unsigned char)raw[pos + 5] << 16) |
                         ((size_t)(unsigned char)raw[pos + 6] << 8) |
                         ((size_t)(unsigned char)raw[pos + 7]);
        pos += 8;
        length = min(length, raw.size() - pos);
        (type == 2 ? err : out).append(raw, pos, length);
        pos += length;
    }
}

string url_encode(const string &value) {
    static const char *hex = "0123456789ABCDEF";
    string result;
    for (unsigned char c : value) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result.push_back(c);
        } else {
            result.push_back('%');
            result.push_back(hex[c >> 4]);
            result.push_back(hex[c & 15]);
        }
    }
    return result;
}

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static once_flag curl_init_flag;

docker_runtime::docker_runtime(const string &socket_path, const string &api_version, bool pull_images)
    : socket_path(boost::algorithm::starts_with(socket_path, "unix://") ? socket_path.substr(7) : socket_path),
      api_version(api_version),
      pull_images(pull_images) {
    call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

docker_response docker_runtime::request(const string &method, const string &path, const string &body, const string &content_type) {
    docker_response response;
    CURL *curl = curl_easy_init();
    if (!curl)
        throw docker_error("Unable to initialize curl", 0);
    defer { curl_easy_cleanup(curl); };

    string url = fmt::format("http://localhost/{}{}", api_version, path);
    curl_slist *headers = curl_slist_append(nullptr, ("Content-Type: " + content_type).c_str());
    defer { curl_slist_free_all(headers); };

    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    if (method != "GET" && method != "DELETE") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    VLOG(2) << method << ' ' << url;
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
        throw docker_error(fmt::format("{} {} failed: {}", method, path, curl_easy_strerror(res)), 0);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

// Docker 出错时返回 {"message": "..."}
static string error_message(const docker_response &response) {
    try {
        return json::parse(response.body).at("message").get<string>();
    } catch (json::exception &) {
        return response.body;
    }
}

json docker_runtime::request_json(const string &method, const string &path, const json &body, long expected_status) {
    docker_response response = request(method, path, body.is_null() ? "" : body.dump());
    if (response.status != expected_status)
        throw docker_error(fmt::format("{} {} returned {}: {}", method, path, response.status, error_message(response)), response.status);
    try {
        return response.body.empty() ? json() : json::parse(response.body);
    } catch (json::exception &ex) {
        throw docker_error(fmt::format("{} {} returned malformed body: {}", method, path, ex.what()), response.status);
    }
}

string docker_runtime::create(const container_spec &spec) {
    string body = build_create_body(spec).dump();
    docker_response response = request("POST", "/containers/create", body);
    if (response.status == 404 && pull_images) {
        LOG(INFO) << "Image " << spec.image << " not found, pulling";
        pull(spec.image);
        response = request("POST", "/containers/create", body);
    }
    if (response.status == 404)
        throw container_setup_error(fmt::format("Image {} is not available: {}", spec.image, error_message(response)));
    if (response.status != 201)
        throw container_setup_error(fmt::format("Unable to create container from {}: {}", spec.image, error_message(response)));
    try {
        return json::parse(response.body).at("Id").get<string>();
    } catch (json::exception &ex) {
        throw container_setup_error(fmt::format("Malformed create response: {}", ex.what()));
    }
}

void docker_runtime::put_archive(const string &id, const filesystem::path &dir, const string &dest) {
    filesystem::path tarpath = dir.string() + ".tar";
    defer {
        error_code ec;
        filesystem::remove(tarpath, ec);
    };

    if (int ret = call_process("tar", "-C", dir, "-cf", tarpath, "."); ret != 0)
        throw container_setup_error(fmt::format("Unable to pack workspace {}, tar exited with {}", dir.string(), ret));

    string archive = read_file_content(tarpath);
    docker_response response = request("PUT", fmt::format("/containers/{}/archive?path={}", id, url_encode(dest)), archive, "application/x-tar");
    if (response.status != 200)
        throw container_setup_error(fmt::format("Unable to copy files into container {}: {}", id, error_message(response)));
}

void docker_runtime::start(const string &id) {
    docker_response response = request("POST", fmt::format("/containers/{}/start", id));
    if (response.status != 204 && response.status != 304)
        throw container_setup_error(fmt::format("Unable to start container {}: {}", id, error_message(response)));
}

int docker_runtime::wait(const string &id) {
    json result = request_json("POST", fmt::format("/containers/{}/wait", id), nullptr, 200);
    return result.at("StatusCode").get<int>();
}

process_output docker_runtime::logs(const string &id) {
    process_output output;
    docker_response response = request("GET", fmt::format("/containers/{}/logs?stdout=1&stderr=1", id));
    if (response.status != 200)
        throw docker_error(fmt::format("Unable to read logs of container {}: {}", id, error_message(response)), response.status);

    string out, err;
    demultiplex_stream(response.body, out, err);
    output.stdout_text = utf8_sanitize(out);
    output.stderr_text = utf8_sanitize(err);

    json state = request_json("GET", fmt::format("/containers/{}/json", id), nullptr, 200);
    output.exit_code = state.at("State").value("ExitCode", 0);
    return output;
}

process_output docker_runtime::exec(const string &id, const vector<string> &command) {
    json create_body = {{"AttachStdin", false},
                        {"AttachStdout", true},
                        {"AttachStderr", true},
                        {"Tty", false},
                        {"Cmd", command}};
    json created = request_json("POST", fmt::format("/containers/{}/exec", id), create_body, 201);
    string exec_id = created.at("Id").get<string>();

    docker_response response = request("POST", fmt::format("/exec/{}/start", exec_id), json{{"Detach", false}, {"Tty", false}}.dump());
    if (response.status != 200)
        throw docker_error(fmt::format("Unable to start exec in container {}: {}", id, error_message(response)), response.status);

    process_output output;
    string out, err;
    demultiplex_stream(response.body, out, err);
    output.stdout_text = utf8_sanitize(out);
    output.stderr_text = utf8_sanitize(err);

    json state = request_json("GET", fmt::format("/exec/{}/json", exec_id), nullptr, 200);
    // 进程被强制结束时 ExitCode 可能为 null
    output.exit_code = state.at("ExitCode").is_number() ? state.at("ExitCode").get<int>() : -1;
    return output;
}

void docker_runtime::kill(const string &id) {
    docker_response response = request("POST", fmt::format("/containers/{}/kill", id));
    // 409: 容器没有在运行
    if (response.status != 204 && response.status != 409 && response.status != 404)
        throw docker_error(fmt::format("Unable to kill container {}: {}", id, error_message(response)), response.status);
}

void docker_runtime::terminate_processes(const string &id) {
    exec(id, {"/bin/sh", "-c", TERMINATE_SCRIPT});
}

void docker_runtime::remove(const string &id) {
    docker_response response = request("DELETE", fmt::format("/containers/{}?force=1", id));
    // 404: 容器不存在；409: 容器正在被删除
    if (response.status != 204 && response.status != 404 && response.status != 409)
        throw docker_error(fmt::format("Unable to remove container {}: {}", id, error_message(response)), response.status);
}

bool docker_runtime::ping() {
    try {
        docker_response response = request("GET", "/_ping");
        return response.status == 200;
    } catch (docker_error &ex) {
        LOG(WARNING) << "Docker daemon at " << socket_path << " is not reachable: " << ex.what();
        return false;
    }
}

void docker_runtime::pull(const string &image) {
    docker_response response = request("POST", "/images/create?fromImage=" + url_encode(image));
    if (response.status != 200)
        throw container_setup_error(fmt::format("Unable to pull image {}: {}", image, error_message(response)));

    // 拉取进度以每行一个 json 的形式返回，出错时某一行会包含 error 字段
    istringstream lines(response.body);
    string line;
    while (getline(lines, line)) {
        if (line.empty()) continue;
        json progress = json::parse(line, nullptr, false);
        if (!progress.is_discarded() && progress.is_object() && progress.count("error"))
            throw container_setup_error(fmt::format("Unable to pull image {}: {}", image, progress["error"].get<string>()));
    }
    LOG(INFO) << "Pulled image " << image;
}

}  // namespace executor
