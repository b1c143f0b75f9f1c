#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace executor {
using namespace std;

executor_exception::executor_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *executor_exception::what() const noexcept {
    return message.c_str();
}

const char *executor_exception::kind() const noexcept {
    return "internal";
}

std::ostream &operator<<(std::ostream &os, const executor_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

unsupported_language_error::unsupported_language_error(const string &language)
    : executor_exception("Unsupported language: " + language) {}

const char *unsupported_language_error::kind() const noexcept {
    return "unsupported_language";
}

workspace_io_error::workspace_io_error(const string &message)
    : executor_exception(message) {}

const char *workspace_io_error::kind() const noexcept {
    return "workspace_io";
}

container_setup_error::container_setup_error(const string &message)
    : executor_exception(message) {}

const char *container_setup_error::kind() const noexcept {
    return "container_setup";
}

docker_error::docker_error(const string &message, long status)
    : executor_exception(message), status(status) {}

const char *docker_error::kind() const noexcept {
    return "docker";
}

internal_error::internal_error(const string &message)
    : executor_exception(message) {}

const char *internal_error::kind() const noexcept {
    return "internal";
}

}  // namespace executor
