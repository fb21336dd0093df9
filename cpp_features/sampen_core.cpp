#include "sampen_core.hpp"
#include "common.hpp"
#include <cmath>
#include <limits>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace fastsampen {

const char* status_name(SampEnStatus status) {
    switch (status) {
        case SampEnStatus::Finite: return "finite";
        case SampEnStatus::Infinite: return "infinite";
        case SampEnStatus::Undefined: return "undefined";
    }
    return "undefined";
}

void validate_match_params(int m, double r) {
    if (m < 1) {
        throw InvalidParameter("embedding dimension m must be positive, got " + std::to_string(m));
    }
    if (std::isnan(r) || r < 0.0) {
        throw InvalidParameter("tolerance r must be non-negative");
    }
}

int resolve_workers(int n_workers) {
    if (n_workers < 0) {
        throw InvalidParameter("n_workers must be >= 0, got " + std::to_string(n_workers));
    }
    int workers = n_workers;
    if (workers == 0) {
#ifdef _OPENMP
        workers = omp_get_max_threads();
#else
        workers = 1;
#endif
    }
    return workers > kMaxWorkers ? kMaxWorkers : workers;
}

std::vector<IndexRange> partition_outer_indices(std::size_t n_starts, std::size_t n_workers) {
    std::vector<IndexRange> ranges;
    if (n_starts == 0) return ranges;
    if (n_workers == 0) n_workers = 1;
    if (n_workers > n_starts) n_workers = n_starts;

    const std::uint64_t total = static_cast<std::uint64_t>(n_starts) * (n_starts - 1) / 2;
    std::uint64_t acc = 0;
    std::size_t begin = 0;
    for (std::size_t w = 1; w < n_workers && begin < n_starts; ++w) {
        const std::uint64_t target = total * w / n_workers;
        std::size_t end = begin;
        while (end < n_starts && acc < target) {
            acc += n_starts - 1 - end;
            ++end;
        }
        if (end == begin) continue;
        ranges.push_back(IndexRange{begin, end});
        begin = end;
    }
    if (begin < n_starts) ranges.push_back(IndexRange{begin, n_starts});
    return ranges;
}

SampEnResult sample_entropy(std::uint64_t B, std::uint64_t A) {
    if (A > B) {
        throw InvalidParameter("A (" + std::to_string(A) + ") cannot exceed B (" + std::to_string(B) + ")");
    }
    SampEnResult res;
    if (B == 0) {
        res.status = SampEnStatus::Undefined;
        res.value = std::numeric_limits<double>::quiet_NaN();
    } else if (A == 0) {
        res.status = SampEnStatus::Infinite;
        res.value = std::numeric_limits<double>::infinity();
    } else {
        res.status = SampEnStatus::Finite;
        res.value = std::log(static_cast<double>(B) / static_cast<double>(A));
    }
    return res;
}

SampEnParams default_sampen_params() {
    SampEnParams params;
    params.m = 2;
    params.r_factor = 0.2;
    params.detrend = true;
    params.n_workers = 0;
    return params;
}

void validate_wave_params(const SampEnParams& params) {
    if (params.m < 1) {
        throw InvalidParameter("embedding dimension m must be positive, got " + std::to_string(params.m));
    }
    if (!std::isfinite(params.r_factor) || params.r_factor < 0.0) {
        throw InvalidParameter("r_factor must be a finite non-negative number");
    }
    if (params.n_workers < 0) {
        throw InvalidParameter("n_workers must be >= 0, got " + std::to_string(params.n_workers));
    }
}

SampEnResult sampen_for_wave(std::vector<double> wave, const SampEnParams& params) {
    validate_wave_params(params);
    wave = drop_nonfinite(wave.data(), wave.size());
    if (wave.size() <= static_cast<std::size_t>(params.m) + 1) return SampEnResult{};

    if (params.detrend) wave = detrend_linear(wave);
    const double r = params.r_factor * standard_deviation(wave.data(), wave.size());
    return sample_entropy(wave.data(), wave.size(), params.m, r, params.n_workers);
}

std::size_t sampen_for_rows(const float* waves, std::size_t rows, std::size_t len,
                            const SampEnParams& params, float* out) {
    validate_wave_params(params);
    SampEnParams row_params = params;
    row_params.n_workers = 1;
    const std::ptrdiff_t n_rows = static_cast<std::ptrdiff_t>(rows);
    const std::ptrdiff_t stride = static_cast<std::ptrdiff_t>(len);

    std::size_t undefined = 0;
    #pragma omp parallel for schedule(dynamic) reduction(+:undefined)
    for (std::ptrdiff_t i = 0; i < n_rows; ++i) {
        const float* row = waves + i * stride;
        SampEnResult res = sampen_for_wave(std::vector<double>(row, row + stride), row_params);
        if (res.is_undefined()) ++undefined;
        out[i] = static_cast<float>(res.value);
    }
    return undefined;
}

std::size_t sampen_for_cube(const float* cube, std::size_t d0, std::size_t d1, std::size_t d2,
                            const SampEnParams& params, float* out) {
    validate_wave_params(params);
    SampEnParams series_params = params;
    series_params.n_workers = 1;
    const std::ptrdiff_t n0 = static_cast<std::ptrdiff_t>(d0);
    const std::ptrdiff_t n1 = static_cast<std::ptrdiff_t>(d1);
    const std::ptrdiff_t n2 = static_cast<std::ptrdiff_t>(d2);

    std::size_t undefined = 0;
    #pragma omp parallel for collapse(2) schedule(dynamic) reduction(+:undefined)
    for (std::ptrdiff_t i = 0; i < n0; ++i) {
        for (std::ptrdiff_t j = 0; j < n1; ++j) {
            const float* series = cube + i * (n1 * n2) + j * n2;
            SampEnResult res = sampen_for_wave(std::vector<double>(series, series + n2), series_params);
            if (res.is_undefined()) ++undefined;
            out[i * n1 + j] = static_cast<float>(res.value);
        }
    }
    return undefined;
}

} // namespace fastsampen
