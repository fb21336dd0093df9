#include <pybind11/pybind11.h>
#include <string>
#include "logger.hpp"

namespace py = pybind11;

void set_log_level(const std::string& level) {
    fastsampen::logger().set_level(fastsampen::parse_log_level(level));
}

std::string get_log_level() {
    switch (fastsampen::logger().level()) {
        case fastsampen::LogLevel::Error: return "error";
        case fastsampen::LogLevel::Warn: return "warn";
        case fastsampen::LogLevel::Info: return "info";
        case fastsampen::LogLevel::Debug: return "debug";
    }
    return "warn";
}

void bind_log_level(py::module& m) {
    m.def("set_log_level", &set_log_level, py::arg("level"),
          "Set the stderr log level: 'error', 'warn', 'info' or 'debug'.");
    m.def("get_log_level", &get_log_level);
}
