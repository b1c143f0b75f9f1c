#include "engine/execution.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace executor {
using namespace std;

// clang-format off
static const unordered_map<execution_state, const char *> state_string = boost::assign::map_list_of
    (execution_state::INIT, "INIT")
    (execution_state::WORKSPACE_READY, "WORKSPACE_READY")
    (execution_state::CONTAINER_CREATED, "CONTAINER_CREATED")
    (execution_state::POPULATED, "POPULATED")
    (execution_state::RUNNING, "RUNNING")
    (execution_state::COMPLETED, "COMPLETED")
    (execution_state::TIMED_OUT, "TIMED_OUT")
    (execution_state::SETUP_FAILED, "SETUP_FAILED")
    (execution_state::CLEANED_UP, "CLEANED_UP");
// clang-format on

const char *get_display_message(execution_state state) {
    return state_string.at(state);
}

const char *get_display_message(verdict v) {
    switch (v) {
        case verdict::ACCEPTED:
            return "ACCEPTED";
        case verdict::WRONG_ANSWER:
            return "WRONG ANSWER";
    }
    return "WRONG ANSWER";
}

}  // namespace executor
