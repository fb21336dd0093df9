#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <vector>
#include <string>
#include <utility>
#include "sampen_core.hpp"
#include "logger.hpp"

namespace py = pybind11;

static fastsampen::SampEnParams make_params(int m, double r_factor, bool detrend, int n_workers) {
    fastsampen::SampEnParams params = fastsampen::default_sampen_params();
    params.m = m;
    params.r_factor = r_factor;
    params.detrend = detrend;
    params.n_workers = n_workers;
    fastsampen::validate_wave_params(params);
    return params;
}

double sample_entropy_wave(const py::array_t<double, py::array::c_style | py::array::forcecast>& series,
                           int m, double r_factor, bool detrend, int n_workers) {
    auto buf = series.request();
    if (buf.ndim != 1) {
        throw std::runtime_error("series must be 1D array");
    }
    const double* x = static_cast<const double*>(buf.ptr);
    std::vector<double> wave(x, x + buf.shape[0]);
    const fastsampen::SampEnParams params = make_params(m, r_factor, detrend, n_workers);
    py::gil_scoped_release release;
    return fastsampen::sampen_for_wave(std::move(wave), params).value;
}

// One wave per row, NaN padded on the right when waves differ in length.
void sample_entropy_rows(py::array_t<float, py::array::c_style | py::array::forcecast>& result,
                         const py::array_t<float, py::array::c_style | py::array::forcecast>& waves,
                         int m, double r_factor, bool detrend) {
    auto wbuf = waves.request();
    if (wbuf.ndim != 2) {
        throw std::runtime_error("waves must be 2D array (rows, samples)");
    }
    const ssize_t rows = wbuf.shape[0];
    const ssize_t len = wbuf.shape[1];
    auto rbuf = result.request();
    if (rbuf.ndim != 1 || rbuf.shape[0] != rows) {
        throw std::runtime_error("result must be 1D with one entry per row of waves");
    }
    const float* w_ptr = static_cast<float*>(wbuf.ptr);
    float* res_ptr = static_cast<float*>(rbuf.ptr);

    const fastsampen::SampEnParams params = make_params(m, r_factor, detrend, 1);
    auto& log = fastsampen::logger();
    if (log.enabled(fastsampen::LogLevel::Debug)) {
        log.debug("sample_entropy_rows: " + std::to_string(rows) + " rows of " +
                  std::to_string(len) + " samples");
    }

    std::size_t undefined = 0;
    {
        py::gil_scoped_release release;
        undefined = fastsampen::sampen_for_rows(w_ptr, static_cast<std::size_t>(rows),
                                                static_cast<std::size_t>(len), params, res_ptr);
    }
    if (undefined > 0) {
        log.warn("sample_entropy_rows: " + std::to_string(undefined) + " of " +
                 std::to_string(rows) + " rows have no length-m matches or are too short");
    }
}

void cube2mat_sample_entropy(py::array_t<float, py::array::c_style | py::array::forcecast>& result,
                             const py::dict& cubes_map, const std::string& key,
                             int m, double r_factor, bool detrend) {
    if (!cubes_map.contains(key)) {
        throw std::runtime_error("cubes_map must contain '" + key + "'");
    }
    auto arr = py::cast<py::array_t<float, py::array::c_style | py::array::forcecast>>(cubes_map[key.c_str()]);
    auto cbuf = arr.request();
    if (cbuf.ndim != 3) {
        throw std::runtime_error(key + " must be 3D array");
    }
    const ssize_t d0 = cbuf.shape[0];
    const ssize_t d1 = cbuf.shape[1];
    const ssize_t d2 = cbuf.shape[2];
    auto rbuf = result.request();
    if (rbuf.ndim != 2 || rbuf.shape[0] != d0 || rbuf.shape[1] != d1) {
        throw std::runtime_error("result must be 2D (d0,d1)");
    }
    const float* cube_ptr = static_cast<float*>(cbuf.ptr);
    float* res_ptr = static_cast<float*>(rbuf.ptr);
    const fastsampen::SampEnParams params = make_params(m, r_factor, detrend, 1);

    py::gil_scoped_release release;
    fastsampen::sampen_for_cube(cube_ptr, static_cast<std::size_t>(d0), static_cast<std::size_t>(d1),
                                static_cast<std::size_t>(d2), params, res_ptr);
}

void bind_sample_entropy_wave(py::module& m) {
    m.def("sample_entropy_wave", &sample_entropy_wave,
          py::arg("series"), py::arg("m") = 2, py::arg("r_factor") = 0.2,
          py::arg("detrend") = true, py::arg("n_workers") = 0,
          "Sample Entropy of a raw wave with r = r_factor * std, after optional linear detrending.");
    m.def("sample_entropy_rows", &sample_entropy_rows,
          py::arg("result"), py::arg("waves"), py::arg("m") = 2, py::arg("r_factor") = 0.2,
          py::arg("detrend") = true,
          "Sample Entropy of every row of a NaN-padded (rows, samples) array.");
    m.def("cube2mat_sample_entropy", &cube2mat_sample_entropy,
          py::arg("result"), py::arg("cubes_map"), py::arg("key"), py::arg("m") = 2,
          py::arg("r_factor") = 0.2, py::arg("detrend") = false,
          "Sample Entropy along the last axis of cubes_map[key] for each (i,j).");
}
