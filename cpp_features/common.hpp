#pragma once
#include <vector>
#include <cmath>
#include <cstddef>
#include <limits>

namespace fastsampen {

template <typename T>
inline double mean(const T* x, std::size_t n) {
    if (n == 0) return std::numeric_limits<double>::quiet_NaN();
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) sum += x[i];
    return sum / static_cast<double>(n);
}

// Population standard deviation (divides by n).
template <typename T>
inline double standard_deviation(const T* x, std::size_t n) {
    if (n == 0) return std::numeric_limits<double>::quiet_NaN();
    const double xbar = mean(x, n);
    double ss = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double d = x[i] - xbar;
        ss += d * d;
    }
    return std::sqrt(ss / static_cast<double>(n));
}

template <typename T>
inline std::vector<double> drop_nonfinite(const T* x, std::size_t n) {
    std::vector<double> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (std::isfinite(x[i])) out.push_back(static_cast<double>(x[i]));
    }
    return out;
}

// Least-squares line against the 1-based sample index, returns the residuals
// x_t - alpha - beta * t. Shorter than 2 samples: returned unchanged.
inline std::vector<double> detrend_linear(const std::vector<double>& x) {
    const std::size_t n = x.size();
    if (n < 2) return x;
    const double tbar = (static_cast<double>(n) + 1.0) / 2.0;
    const double ybar = mean(x.data(), n);
    double num = 0.0, den = 0.0;
    for (std::size_t t = 0; t < n; ++t) {
        double dt = static_cast<double>(t + 1) - tbar;
        num += dt * (x[t] - ybar);
        den += dt * dt;
    }
    const double beta = num / den;
    const double alpha = ybar - beta * tbar;
    std::vector<double> out(n);
    for (std::size_t t = 0; t < n; ++t) {
        out[t] = x[t] - alpha - beta * static_cast<double>(t + 1);
    }
    return out;
}

} // namespace fastsampen
