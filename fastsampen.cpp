#include <pybind11/pybind11.h>

namespace py = pybind11;

void bind_sample_entropy(py::module& m);
void bind_sample_entropy_wave(py::module& m);
void bind_log_level(py::module& m);

PYBIND11_MODULE(fastsampen, m) {
    m.doc() = "parallel Sample Entropy of physiological time series";
    bind_sample_entropy(m);
    bind_sample_entropy_wave(m);
    bind_log_level(m);
}
