#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <string>
#include "sampen_core.hpp"
#include "logger.hpp"

namespace py = pybind11;

using series_t = py::array_t<double, py::array::c_style | py::array::forcecast>;

static const double* series_view(const series_t& series, ssize_t& n) {
    auto buf = series.request();
    if (buf.ndim != 1) {
        throw std::runtime_error("series must be 1D array");
    }
    n = buf.shape[0];
    return static_cast<const double*>(buf.ptr);
}

static void log_call(const char* name, ssize_t n, int m, double r, int n_workers) {
    auto& log = fastsampen::logger();
    if (!log.enabled(fastsampen::LogLevel::Debug)) return;
    log.debug(std::string(name) + ": N=" + std::to_string(n) + " m=" + std::to_string(m) +
              " r=" + std::to_string(r) + " workers=" +
              std::to_string(fastsampen::resolve_workers(n_workers)));
}

py::tuple count_matches(const series_t& series, int m, double r, int n_workers) {
    ssize_t n = 0;
    const double* x = series_view(series, n);
    log_call("count_matches", n, m, r, n_workers);
    fastsampen::MatchCounts counts;
    {
        py::gil_scoped_release release;
        counts = fastsampen::count_matches(x, static_cast<std::size_t>(n), m, r, n_workers);
    }
    return py::make_tuple(counts.B, counts.A);
}

static fastsampen::SampEnResult compute(const series_t& series, int m, double r, int n_workers) {
    ssize_t n = 0;
    const double* x = series_view(series, n);
    log_call("sample_entropy", n, m, r, n_workers);
    py::gil_scoped_release release;
    return fastsampen::sample_entropy(x, static_cast<std::size_t>(n), m, r, n_workers);
}

double sample_entropy(const series_t& series, int m, double r, int n_workers) {
    return compute(series, m, r, n_workers).value;
}

py::tuple sample_entropy_result(const series_t& series, int m, double r, int n_workers) {
    fastsampen::SampEnResult res = compute(series, m, r, n_workers);
    return py::make_tuple(res.value, fastsampen::status_name(res.status));
}

void bind_sample_entropy(py::module& m) {
    m.def("count_matches", &count_matches,
          py::arg("series"), py::arg("m"), py::arg("r"), py::arg("n_workers") = 0,
          "Ordered-pair template match counts (B, A) at lengths m and m+1, self-matches excluded.");
    m.def("sample_entropy", &sample_entropy,
          py::arg("series"), py::arg("m"), py::arg("r"), py::arg("n_workers") = 0,
          "Sample Entropy -ln(A/B). NaN when B == 0, inf when A == 0 < B.");
    m.def("sample_entropy_result", &sample_entropy_result,
          py::arg("series"), py::arg("m"), py::arg("r"), py::arg("n_workers") = 0,
          "Sample Entropy as (value, status), status in {'finite', 'infinite', 'undefined'}.");
}
