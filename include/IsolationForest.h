#pragma once

#include "Cancellation.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief Isolation Forest anomaly scorer over dense row-major feature vectors.
 * @details Each tree isolates a random subsample by axis-aligned random splits.
 *          Scores follow s(x) = 2^(-E[h(x)] / c(psi)), so values near 1 are
 *          anomalous and values near 0.5 or below are ordinary. Tree t draws from
 *          its own generator seeded from (seed, t); results do not depend on the
 *          number of OpenMP threads.
 */
class IsolationForest {
public:
    struct Options {
        size_t trees = 100;
        size_t sampleSize = 256;
        uint32_t seed = 1337;
        // Checked between trees; fit throws Veritas::CancelledException once set.
        CancellationFlag cancel;
    };

    explicit IsolationForest(Options options);

    void fit(const std::vector<std::vector<double>>& rows);
    double score(const std::vector<double>& x) const;
    std::vector<double> scoreAll(const std::vector<std::vector<double>>& rows) const;

    size_t treeCount() const noexcept { return trees_.size(); }

    // Average unsuccessful-search path length in a binary search tree of n points.
    static double averagePathLength(size_t n);

private:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        size_t size = 0;
    };
    using Tree = std::vector<Node>;

    Options options_;
    size_t psi_ = 0;
    std::vector<Tree> trees_;

    double pathLength(const Tree& tree, const std::vector<double>& x) const;
};
