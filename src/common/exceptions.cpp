#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codebench {
using namespace std;

benchmark_exception::benchmark_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *benchmark_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const benchmark_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : benchmark_exception(message) {}

marshaling_error::marshaling_error(const string &message)
    : benchmark_exception(message) {}

missing_parameter_error::missing_parameter_error(const string &parameter)
    : marshaling_error("missing parameter '" + parameter + "' in test case"), name(parameter) {}

const string &missing_parameter_error::parameter() const {
    return name;
}

external_tool_missing::external_tool_missing(const string &tool)
    : benchmark_exception(tool + " command is required but was not found in PATH") {}

}  // namespace codebench
