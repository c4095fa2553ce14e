#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codebench {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> status_string = boost::assign::map_list_of
    (execution_status::SUCCESS, "Success")
    (execution_status::RUNTIME_ERROR, "Runtime Error")
    (execution_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (execution_status::SYSTEM_ERROR, "System Error");
// clang-format on

const char *get_display_message(execution_status status) {
    return status_string.at(status);
}

}  // namespace codebench
