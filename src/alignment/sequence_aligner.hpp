// File: src/alignment/sequence_aligner.hpp
#pragma once

#include "features/event_cost.hpp"
#include <functional>
#include <utility>
#include <vector>

namespace pitchsim {

/// Ordered (i, j) index pairs from (0, 0) to (n-1, m-1)
using AlignmentPath = std::vector<std::pair<size_t, size_t>>;

/// Result of aligning two sequences
struct Alignment {
    /// Sum of the pairwise costs along the path (+inf if either side is empty)
    float distance;
    AlignmentPath path;
};

/// Approximate dynamic time warping (coarsen / project / refine).
///
/// Both sequences are recursively halved until one side is shorter than
/// radius + 2, solved exactly there, and the coarse path is projected one
/// level up and widened by `radius` cells to form the search window of the
/// finer level. Time and memory are O((n + m) * radius) for any pairwise
/// cost function.
///
/// The result is an upper bound on the exact DTW cost; it is exact whenever
/// either sequence is shorter than radius + 2. Ties between predecessor cells
/// resolve diagonal first, then (i-1, j), then (i, j-1), so identical inputs
/// always produce the identical path.
class SequenceAligner {
public:
    /// Pairwise cost between element i of the first and j of the second side
    using CostFunction = std::function<float(size_t, size_t)>;

    static constexpr size_t kDefaultRadius = 1;

    explicit SequenceAligner(size_t radius = kDefaultRadius) : radius_(radius) {}

    /// Approximate alignment of two feature sequences under `cost`
    Alignment Align(const std::vector<FeatureRecord>& a,
                    const std::vector<FeatureRecord>& b,
                    const EventCost& cost) const;

    /// Full O(n*m) alignment of two feature sequences
    Alignment AlignExact(const std::vector<FeatureRecord>& a,
                         const std::vector<FeatureRecord>& b,
                         const EventCost& cost) const;

    /// Approximate alignment of two index ranges [0, n) and [0, m)
    Alignment AlignIndices(size_t n, size_t m, const CostFunction& cost) const;

    /// Exact alignment of two index ranges
    Alignment AlignIndicesExact(size_t n, size_t m, const CostFunction& cost) const;

    size_t GetRadius() const { return radius_; }
    void SetRadius(size_t radius) { radius_ = radius; }

private:
    /// Inclusive column range [lo[i], hi[i]] searched in each row i
    struct Window {
        std::vector<size_t> lo;
        std::vector<size_t> hi;
    };

    size_t radius_;

    /// Recursive step over representative element indices
    Alignment FastAlign(const std::vector<size_t>& rep_a,
                        const std::vector<size_t>& rep_b,
                        const CostFunction& cost) const;

    /// Keep every second representative (ceil(n / 2) remain)
    static std::vector<size_t> Coarsen(const std::vector<size_t>& rep);

    /// Project a coarse path onto an n x m grid, widened by the radius
    Window ExpandWindow(const AlignmentPath& coarse_path, size_t n, size_t m) const;

    static Window FullWindow(size_t n, size_t m);

    /// Constrained DTW over the cells of `window`
    static Alignment AlignInWindow(const std::vector<size_t>& rep_a,
                                   const std::vector<size_t>& rep_b,
                                   const Window& window,
                                   const CostFunction& cost);

    static std::vector<size_t> Identity(size_t n);
};

} // namespace pitchsim
