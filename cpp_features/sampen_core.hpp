#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace fastsampen {

// Raised for m < 1, a negative/NaN tolerance, a negative worker count, or a
// series too short for the requested embedding.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

// Ordered-pair match counts. B: length-m templates, A: length-(m+1) templates.
struct MatchCounts {
    std::uint64_t B = 0;
    std::uint64_t A = 0;

    MatchCounts& operator+=(const MatchCounts& other) {
        B += other.B;
        A += other.A;
        return *this;
    }
};

inline bool operator==(const MatchCounts& lhs, const MatchCounts& rhs) {
    return lhs.B == rhs.B && lhs.A == rhs.A;
}

// Half-open range [begin, end) of outer template indices.
struct IndexRange {
    std::size_t begin = 0;
    std::size_t end = 0;
};

enum class SampEnStatus { Finite, Infinite, Undefined };

struct SampEnResult {
    SampEnStatus status = SampEnStatus::Undefined;
    double value = std::numeric_limits<double>::quiet_NaN();

    bool is_finite() const { return status == SampEnStatus::Finite; }
    bool is_infinite() const { return status == SampEnStatus::Infinite; }
    bool is_undefined() const { return status == SampEnStatus::Undefined; }
};

const char* status_name(SampEnStatus status);

void validate_match_params(int m, double r);

// Upper bound on the workers one count_matches call runs.
constexpr int kMaxWorkers = 256;

// Number of workers actually used for n_workers (0 = OpenMP default),
// clamped to kMaxWorkers.
int resolve_workers(int n_workers);

// Splits [0, n_starts) into at most n_workers contiguous, non-empty ranges
// holding roughly equal numbers of (i, j > i) pairs. Outer index i owns
// n_starts - 1 - i pairs, so early ranges are narrower than late ones.
std::vector<IndexRange> partition_outer_indices(std::size_t n_starts, std::size_t n_workers);

// Counts the pairs (i, j), i_begin <= i < i_end, i < j <= N-m-1, whose
// length-m templates match, and among those the pairs with j <= N-m-2 whose
// length-(m+1) templates also match. Each unordered match adds 2.
// Match means |x[i+k] - x[j+k]| <= r for every k; NaN never matches.
template <typename T>
MatchCounts count_matches_range(const T* x, std::size_t n, int m, T r,
                                std::size_t i_begin, std::size_t i_end) {
    validate_match_params(m, static_cast<double>(r));
    MatchCounts counts;
    const std::size_t mm = static_cast<std::size_t>(m);
    if (n <= mm + 1) return counts;
    const std::size_t n_starts = n - mm;
    const std::size_t n_ext = n_starts - 1;
    if (i_end > n_starts) i_end = n_starts;

    for (std::size_t i = i_begin; i < i_end; ++i) {
        const T* xi = x + i;
        for (std::size_t j = i + 1; j < n_starts; ++j) {
            const T* xj = x + j;
            std::size_t k = 0;
            while (k < mm && std::fabs(xi[k] - xj[k]) <= r) ++k;
            if (k < mm) continue;
            counts.B += 2;
            // the (m+1)-template distance only extends the m-template one
            if (j < n_ext && std::fabs(xi[mm] - xj[mm]) <= r) counts.A += 2;
        }
    }
    return counts;
}

// Match counts (B, A) for the whole series. N <= m+1 gives {0, 0}.
template <typename T>
MatchCounts count_matches(const T* x, std::size_t n, int m, T r, int n_workers = 0) {
    validate_match_params(m, static_cast<double>(r));
    const std::size_t mm = static_cast<std::size_t>(m);
    if (n <= mm + 1) return MatchCounts{};

    const int workers = resolve_workers(n_workers);
    const std::vector<IndexRange> ranges =
        partition_outer_indices(n - mm, static_cast<std::size_t>(workers));
    const std::ptrdiff_t n_ranges = static_cast<std::ptrdiff_t>(ranges.size());
    // at most one thread per range
    const int team = static_cast<int>(ranges.size());

    // one private result per range, summed below
    std::vector<MatchCounts> partial(ranges.size());
    #pragma omp parallel for schedule(dynamic, 1) num_threads(team)
    for (std::ptrdiff_t t = 0; t < n_ranges; ++t) {
        partial[t] = count_matches_range(x, n, m, r, ranges[t].begin, ranges[t].end);
    }

    MatchCounts total;
    for (const MatchCounts& p : partial) total += p;
    return total;
}

template <typename T>
MatchCounts count_matches(const std::vector<T>& x, int m, T r, int n_workers = 0) {
    return count_matches(x.data(), x.size(), m, r, n_workers);
}

// -ln(A / B). B == 0 is Undefined, A == 0 < B is Infinite.
SampEnResult sample_entropy(std::uint64_t B, std::uint64_t A);

inline SampEnResult sample_entropy(const MatchCounts& counts) {
    return sample_entropy(counts.B, counts.A);
}

// Full pipeline. Unlike count_matches, a series with m + 1 >= N is rejected.
template <typename T>
SampEnResult sample_entropy(const T* x, std::size_t n, int m, T r, int n_workers = 0) {
    validate_match_params(m, static_cast<double>(r));
    if (static_cast<std::size_t>(m) + 1 >= n) {
        throw InvalidParameter("series of length " + std::to_string(n) +
                               " is too short for m=" + std::to_string(m));
    }
    return sample_entropy(count_matches(x, n, m, r, n_workers));
}

template <typename T>
SampEnResult sample_entropy(const std::vector<T>& x, int m, T r, int n_workers = 0) {
    return sample_entropy(x.data(), x.size(), m, r, n_workers);
}

struct SampEnParams {
    int m = 2;               // embedding dimension
    double r_factor = 0.2;   // tolerance as a fraction of the standard deviation
    bool detrend = true;     // remove the least-squares line first
    int n_workers = 0;       // 0 = OpenMP default
};

SampEnParams default_sampen_params();

void validate_wave_params(const SampEnParams& params);

// SampEn of one raw waveform: non-finite samples dropped, optional linear
// detrend, r = r_factor * std. A wave too short for m is Undefined.
SampEnResult sampen_for_wave(std::vector<double> wave, const SampEnParams& params);

// sampen_for_wave over a (rows, len) row-major block, one wave per row,
// rows in parallel with a single-threaded kernel each. Fills out[rows] and
// returns the number of Undefined rows.
std::size_t sampen_for_rows(const float* waves, std::size_t rows, std::size_t len,
                            const SampEnParams& params, float* out);

// sampen_for_wave along the last axis of a row-major (d0, d1, d2) cube.
// Fills out[d0 * d1] and returns the number of Undefined series.
std::size_t sampen_for_cube(const float* cube, std::size_t d0, std::size_t d1, std::size_t d2,
                            const SampEnParams& params, float* out);

} // namespace fastsampen
