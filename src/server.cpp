#include "server.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <deque>
#include <future>
#include "common/exceptions.hpp"
#include "common/thread_pool.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "protocol.hpp"

namespace executor {
using namespace std;

string handle_request(execution_engine &engine, const string &text, bool &ok) {
    ok = false;
    try {
        execution_request request = parse_request(text, DEFAULT_TIMEOUT);
        execution_result result = engine.execute(request);
        ok = true;
        return to_json(result).dump();
    } catch (executor_exception &ex) {
        LOG(WARNING) << "Rejected request: " << ex.what();
        return error_envelope(ex.what(), ex.kind()).dump();
    } catch (invalid_argument &ex) {
        LOG(WARNING) << "Rejected malformed request: " << ex.what();
        return error_envelope(ex.what(), "invalid_request").dump();
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to handle request: " << boost::diagnostic_information(ex);
        return error_envelope(ex.what(), "internal").dump();
    }
}

void serve(execution_engine &engine, istream &in, ostream &out, size_t concurrency) {
    thread_pool requests(concurrency);
    deque<future<string>> in_flight;

    auto flush_front = [&]() {
        out << in_flight.front().get() << endl;
        in_flight.pop_front();
    };

    string line;
    while (getline(in, line)) {
        if (is_blank(line)) continue;
        if (in_flight.size() >= concurrency) flush_front();
        in_flight.push_back(requests.enqueue([&engine](string text) {
            bool ok;
            return handle_request(engine, text, ok);
        }, line));
    }
    while (!in_flight.empty()) flush_front();
}

}  // namespace executor
