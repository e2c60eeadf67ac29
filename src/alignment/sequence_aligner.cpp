// File: src/alignment/sequence_aligner.cpp
#include "alignment/sequence_aligner.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>

namespace pitchsim {

namespace {

constexpr float kInfinity = std::numeric_limits<float>::infinity();

enum Step : uint8_t {
    STEP_NONE = 0,
    STEP_DIAGONAL = 1,
    STEP_UP = 2,     // from (i-1, j)
    STEP_LEFT = 3,   // from (i, j-1)
};

} // namespace

// ============================================================================
// Public entry points
// ============================================================================

Alignment SequenceAligner::Align(const std::vector<FeatureRecord>& a,
                                 const std::vector<FeatureRecord>& b,
                                 const EventCost& cost) const {
    auto cost_fn = [&a, &b, &cost](size_t i, size_t j) {
        return cost.Compute(a[i], b[j]);
    };
    return AlignIndices(a.size(), b.size(), cost_fn);
}

Alignment SequenceAligner::AlignExact(const std::vector<FeatureRecord>& a,
                                      const std::vector<FeatureRecord>& b,
                                      const EventCost& cost) const {
    auto cost_fn = [&a, &b, &cost](size_t i, size_t j) {
        return cost.Compute(a[i], b[j]);
    };
    return AlignIndicesExact(a.size(), b.size(), cost_fn);
}

Alignment SequenceAligner::AlignIndices(size_t n, size_t m, const CostFunction& cost) const {
    if (n == 0 || m == 0) {
        return Alignment{kInfinity, {}};
    }
    return FastAlign(Identity(n), Identity(m), cost);
}

Alignment SequenceAligner::AlignIndicesExact(size_t n, size_t m,
                                             const CostFunction& cost) const {
    if (n == 0 || m == 0) {
        return Alignment{kInfinity, {}};
    }
    return AlignInWindow(Identity(n), Identity(m), FullWindow(n, m), cost);
}

// ============================================================================
// Coarsen / project / refine
// ============================================================================

Alignment SequenceAligner::FastAlign(const std::vector<size_t>& rep_a,
                                     const std::vector<size_t>& rep_b,
                                     const CostFunction& cost) const {
    const size_t min_size = radius_ + 2;
    const size_t n = rep_a.size();
    const size_t m = rep_b.size();

    if (n < min_size || m < min_size) {
        return AlignInWindow(rep_a, rep_b, FullWindow(n, m), cost);
    }

    Alignment coarse = FastAlign(Coarsen(rep_a), Coarsen(rep_b), cost);
    Window window = ExpandWindow(coarse.path, n, m);
    return AlignInWindow(rep_a, rep_b, window, cost);
}

std::vector<size_t> SequenceAligner::Coarsen(const std::vector<size_t>& rep) {
    std::vector<size_t> coarse;
    coarse.reserve((rep.size() + 1) / 2);
    for (size_t i = 0; i < rep.size(); i += 2) {
        coarse.push_back(rep[i]);
    }
    return coarse;
}

SequenceAligner::Window SequenceAligner::ExpandWindow(const AlignmentPath& coarse_path,
                                                      size_t n, size_t m) const {
    const size_t coarse_n = (n + 1) / 2;
    const size_t coarse_m = (m + 1) / 2;
    constexpr size_t kUnset = std::numeric_limits<size_t>::max();

    Window window;
    window.lo.assign(n, kUnset);
    window.hi.assign(n, 0);

    for (const auto& [ci, cj] : coarse_path) {
        size_t row_begin = ci >= radius_ ? ci - radius_ : 0;
        size_t row_end = std::min(ci + radius_, coarse_n - 1);
        size_t col_begin = cj >= radius_ ? cj - radius_ : 0;
        size_t col_end = std::min(cj + radius_, coarse_m - 1);

        size_t fine_lo = 2 * col_begin;
        size_t fine_hi = std::min(2 * col_end + 1, m - 1);

        for (size_t r = row_begin; r <= row_end; ++r) {
            for (size_t i = 2 * r; i <= 2 * r + 1 && i < n; ++i) {
                window.lo[i] = std::min(window.lo[i], fine_lo);
                window.hi[i] = std::max(window.hi[i], fine_hi);
            }
        }
    }

    // Every row must intersect the reachable part of the previous one and the
    // corners must be inside the window.
    window.lo[0] = 0;
    for (size_t i = 1; i < n; ++i) {
        size_t reach = std::min(window.hi[i - 1] + 1, m - 1);
        if (window.lo[i] == kUnset) {
            window.lo[i] = reach;
        }
        window.lo[i] = std::min(window.lo[i], reach);
        window.hi[i] = std::max({window.hi[i], window.hi[i - 1], window.lo[i]});
    }
    window.hi[n - 1] = m - 1;

    return window;
}

SequenceAligner::Window SequenceAligner::FullWindow(size_t n, size_t m) {
    Window window;
    window.lo.assign(n, 0);
    window.hi.assign(n, m - 1);
    return window;
}

Alignment SequenceAligner::AlignInWindow(const std::vector<size_t>& rep_a,
                                         const std::vector<size_t>& rep_b,
                                         const Window& window,
                                         const CostFunction& cost) {
    const size_t n = rep_a.size();
    const size_t m = rep_b.size();

    std::vector<std::vector<float>> acc(n);
    std::vector<std::vector<uint8_t>> steps(n);
    for (size_t i = 0; i < n; ++i) {
        size_t width = window.hi[i] - window.lo[i] + 1;
        acc[i].assign(width, kInfinity);
        steps[i].assign(width, STEP_NONE);
    }

    auto at = [&acc, &window](size_t i, size_t j) {
        if (j < window.lo[i] || j > window.hi[i]) {
            return kInfinity;
        }
        return acc[i][j - window.lo[i]];
    };

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = window.lo[i]; j <= window.hi[i]; ++j) {
            float c = cost(rep_a[i], rep_b[j]);
            size_t col = j - window.lo[i];

            if (i == 0 && j == 0) {
                acc[i][col] = c;
                continue;
            }

            float best = kInfinity;
            uint8_t step = STEP_NONE;

            if (i > 0 && j > 0) {
                float diagonal = at(i - 1, j - 1);
                if (diagonal < best) {
                    best = diagonal;
                    step = STEP_DIAGONAL;
                }
            }
            if (i > 0) {
                float up = at(i - 1, j);
                if (up < best) {
                    best = up;
                    step = STEP_UP;
                }
            }
            if (j > 0) {
                float left = at(i, j - 1);
                if (left < best) {
                    best = left;
                    step = STEP_LEFT;
                }
            }

            if (step != STEP_NONE) {
                acc[i][col] = best + c;
                steps[i][col] = step;
            }
        }
    }

    Alignment result;
    result.distance = at(n - 1, m - 1);

    size_t i = n - 1;
    size_t j = m - 1;
    result.path.emplace_back(i, j);
    while (i > 0 || j > 0) {
        uint8_t step = steps[i][j - window.lo[i]];
        if (step == STEP_DIAGONAL) {
            --i;
            --j;
        } else if (step == STEP_UP) {
            --i;
        } else if (step == STEP_LEFT) {
            --j;
        } else {
            break;
        }
        result.path.emplace_back(i, j);
    }
    std::reverse(result.path.begin(), result.path.end());

    return result;
}

std::vector<size_t> SequenceAligner::Identity(size_t n) {
    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), size_t{0});
    return indices;
}

} // namespace pitchsim
