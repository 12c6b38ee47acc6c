#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runexec {
using namespace std;

runexec_exception::runexec_exception()
    : runexec_exception("") {}

runexec_exception::runexec_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runexec_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runexec_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

configuration_error::configuration_error()
    : runexec_exception() {}

configuration_error::configuration_error(const string &message)
    : runexec_exception(message) {}

spawn_error::spawn_error()
    : runexec_exception() {}

spawn_error::spawn_error(const string &message)
    : runexec_exception(message) {}

internal_error::internal_error()
    : runexec_exception() {}

internal_error::internal_error(const string &message)
    : runexec_exception(message) {}

}  // namespace runexec
