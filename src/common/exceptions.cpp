#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace engine {
using namespace std;

engine_exception::engine_exception()
    : engine_exception("") {}

engine_exception::engine_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *engine_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const engine_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

configuration_error::configuration_error()
    : engine_exception() {}

configuration_error::configuration_error(const string &message)
    : engine_exception(message) {}

io_error::io_error()
    : engine_exception() {}

io_error::io_error(const string &message)
    : engine_exception(message) {}

network_error::network_error()
    : engine_exception() {}

network_error::network_error(const string &message)
    : engine_exception(message) {}

database_error::database_error()
    : engine_exception() {}

database_error::database_error(const string &message)
    : engine_exception(message) {}

}  // namespace engine
