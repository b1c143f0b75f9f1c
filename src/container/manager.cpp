#include "container/manager.hpp"
#include <glog/logging.h>
#include <future>
#include "common/exceptions.hpp"

namespace executor {
using namespace std;

container::container(container_manager &manager, const string &id)
    : manager(&manager), cid(id), is_removed(false) {}

container::container(container &&other)
    : manager(other.manager), cid(move(other.cid)), is_removed(other.is_removed) {
    other.is_removed = true;
}

container::~container() {
    if (!is_removed) manager->remove(*this);
}

const string &container::id() const {
    return cid;
}

string container::short_id() const {
    return cid.substr(0, 12);
}

bool container::removed() const {
    return is_removed;
}

container_manager::container_manager(unique_ptr<container_runtime> runtime, size_t workers)
    : runtime(move(runtime)), pool(workers) {}

container container_manager::create(const container_spec &spec) {
    string id;
    try {
        id = pool.enqueue([rt = runtime.get(), spec] { return rt->create(spec); }).get();
    } catch (docker_error &ex) {
        throw container_setup_error(string("Unable to create container: ") + ex.what());
    }
    VLOG(1) << "Created container " << id.substr(0, 12) << " from " << spec.image;
    return container(*this, id);
}

void container_manager::populate(container &c, const filesystem::path &dir, const string &dest) {
    try {
        pool.enqueue([rt = runtime.get(), id = c.id(), dir, dest] { rt->put_archive(id, dir, dest); }).get();
    } catch (docker_error &ex) {
        throw container_setup_error(string("Unable to copy files into container: ") + ex.what());
    }
}

void container_manager::start(container &c) {
    try {
        pool.enqueue([rt = runtime.get(), id = c.id()] { rt->start(id); }).get();
    } catch (docker_error &ex) {
        throw container_setup_error(string("Unable to start container: ") + ex.what());
    }
}

bool container_manager::await_completion(container &c, chrono::milliseconds deadline, int &exit_code) {
    auto result = pool.enqueue([rt = runtime.get(), id = c.id()] { return rt->wait(id); });
    if (result.wait_for(deadline) == future_status::timeout) {
        LOG(INFO) << "Container " << c.short_id() << " exceeded deadline of " << deadline.count() << "ms, killing";
        try {
            runtime->kill(c.id());
        } catch (exception &ex) {
            LOG(WARNING) << "Unable to kill container " << c.short_id() << ": " << ex.what();
        }

        if (result.wait_for(grace_period) == future_status::timeout) {
            LOG(WARNING) << "Container " << c.short_id() << " still running after being killed";
        } else {
            try {
                result.get();
            } catch (exception &ex) {
                VLOG(1) << "Wait on killed container " << c.short_id() << " failed: " << ex.what();
            }
        }
        return false;
    }
    exit_code = result.get();
    return true;
}

process_output container_manager::collect_output(container &c) {
    return pool.enqueue([rt = runtime.get(), id = c.id()] { return rt->logs(id); }).get();
}

bool container_manager::exec(container &c, const vector<string> &command, chrono::milliseconds deadline, process_output &output) {
    // 期限从命令真正开始执行时计算，在队列中等待空闲线程的时间不计入
    auto started = make_shared<promise<void>>();
    future<void> running = started->get_future();
    auto result = pool.enqueue([rt = runtime.get(), id = c.id(), command, started] {
        started->set_value();
        return rt->exec(id, command);
    });
    running.wait();

    if (result.wait_for(deadline) == future_status::timeout) {
        LOG(INFO) << "Command in container " << c.short_id() << " exceeded deadline of " << deadline.count() << "ms, terminating";
        try {
            runtime->terminate_processes(c.id());
        } catch (exception &ex) {
            LOG(WARNING) << "Unable to terminate processes in container " << c.short_id() << ": " << ex.what();
        }

        if (result.wait_for(grace_period) == future_status::timeout) {
            LOG(WARNING) << "Command in container " << c.short_id() << " still running after termination";
        } else {
            try {
                result.get();
            } catch (exception &ex) {
                VLOG(1) << "Terminated command in container " << c.short_id() << " failed: " << ex.what();
            }
        }
        return false;
    }
    output = result.get();
    return true;
}

void container_manager::remove(container &c) noexcept {
    if (c.is_removed) return;
    c.is_removed = true;
    try {
        pool.enqueue([rt = runtime.get(), id = c.id()] { rt->remove(id); }).get();
        VLOG(1) << "Removed container " << c.short_id();
    } catch (exception &ex) {
        LOG(WARNING) << "Unable to remove container " << c.short_id() << ": " << ex.what();
    }
}

bool container_manager::ping() {
    return pool.enqueue([rt = runtime.get()] { return rt->ping(); }).get();
}

}  // namespace executor
