#include "IsolationForest.h"
#include "VeritasExceptions.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kEulerGamma = 0.5772156649015329;

struct TreeBuilder {
    const std::vector<std::vector<double>>& rows;
    std::vector<size_t>& idx;
    size_t maxDepth;
    std::mt19937& rng;

    template <typename Tree>
    int grow(Tree& tree, size_t begin, size_t end, size_t depth) {
        const int nodeId = static_cast<int>(tree.size());
        tree.emplace_back();
        tree[nodeId].size = end - begin;
        if (end - begin <= 1 || depth >= maxDepth) return nodeId;

        const size_t dims = rows[idx[begin]].size();
        std::vector<size_t> splittable;
        std::vector<double> lo(dims, 0.0);
        std::vector<double> hi(dims, 0.0);
        for (size_t f = 0; f < dims; ++f) {
            double mn = rows[idx[begin]][f];
            double mx = mn;
            for (size_t i = begin + 1; i < end; ++i) {
                const double v = rows[idx[i]][f];
                mn = std::min(mn, v);
                mx = std::max(mx, v);
            }
            lo[f] = mn;
            hi[f] = mx;
            if (mx > mn) splittable.push_back(f);
        }
        if (splittable.empty()) return nodeId;

        std::uniform_int_distribution<size_t> pickFeature(0, splittable.size() - 1);
        const size_t feature = splittable[pickFeature(rng)];
        std::uniform_real_distribution<double> pickThreshold(lo[feature], hi[feature]);
        const double threshold = pickThreshold(rng);

        auto first = idx.begin() + static_cast<std::ptrdiff_t>(begin);
        auto last = idx.begin() + static_cast<std::ptrdiff_t>(end);
        auto mid = std::partition(first, last, [&](size_t r) { return rows[r][feature] < threshold; });
        const size_t split = static_cast<size_t>(std::distance(idx.begin(), mid));
        if (split == begin || split == end) return nodeId;

        tree[nodeId].feature = static_cast<int>(feature);
        tree[nodeId].threshold = threshold;
        const int left = grow(tree, begin, split, depth + 1);
        const int right = grow(tree, split, end, depth + 1);
        tree[nodeId].left = left;
        tree[nodeId].right = right;
        return nodeId;
    }
};
} // namespace

IsolationForest::IsolationForest(Options options) : options_(options) {}

double IsolationForest::averagePathLength(size_t n) {
    if (n <= 1) return 0.0;
    if (n == 2) return 1.0;
    const double nd = static_cast<double>(n);
    return 2.0 * (std::log(nd - 1.0) + kEulerGamma) - 2.0 * (nd - 1.0) / nd;
}

void IsolationForest::fit(const std::vector<std::vector<double>>& rows) {
    if (rows.size() < 2) throw Veritas::DatasetException("Isolation forest needs at least two rows");
    const size_t dims = rows.front().size();
    if (dims == 0) throw Veritas::DatasetException("Isolation forest needs at least one feature");
    for (const auto& row : rows) {
        if (row.size() != dims) throw Veritas::DatasetException("Isolation forest rows must share one width");
    }

    psi_ = std::min(std::max<size_t>(2, options_.sampleSize), rows.size());
    const size_t maxDepth = static_cast<size_t>(std::ceil(std::log2(static_cast<double>(psi_))));
    trees_.assign(options_.trees, Tree{});

    const long long treeCount = static_cast<long long>(options_.trees);
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long t = 0; t < treeCount; ++t) {
        if (cancellationRequested(options_.cancel)) continue;
        std::mt19937 rng(static_cast<uint32_t>(options_.seed + static_cast<uint32_t>(t) * 7919u + 17u));
        std::vector<size_t> order(rows.size());
        std::iota(order.begin(), order.end(), 0);
        // Partial Fisher-Yates: the first psi entries become the subsample.
        for (size_t i = 0; i < psi_; ++i) {
            std::uniform_int_distribution<size_t> pick(i, order.size() - 1);
            std::swap(order[i], order[pick(rng)]);
        }
        order.resize(psi_);

        Tree tree;
        tree.reserve(2 * psi_);
        TreeBuilder builder{rows, order, maxDepth, rng};
        builder.grow(tree, 0, order.size(), 0);
        trees_[static_cast<size_t>(t)] = std::move(tree);
    }
    if (cancellationRequested(options_.cancel)) {
        trees_.clear();
        throw Veritas::CancelledException("isolation forest fit");
    }
}

double IsolationForest::pathLength(const Tree& tree, const std::vector<double>& x) const {
    int node = 0;
    double depth = 0.0;
    while (tree[static_cast<size_t>(node)].feature >= 0) {
        const Node& n = tree[static_cast<size_t>(node)];
        node = (x[static_cast<size_t>(n.feature)] < n.threshold) ? n.left : n.right;
        depth += 1.0;
    }
    return depth + averagePathLength(tree[static_cast<size_t>(node)].size);
}

double IsolationForest::score(const std::vector<double>& x) const {
    if (trees_.empty()) throw Veritas::DatasetException("Isolation forest scored before fit");
    double total = 0.0;
    for (const auto& tree : trees_) total += pathLength(tree, x);
    const double meanPath = total / static_cast<double>(trees_.size());
    const double norm = averagePathLength(psi_);
    if (norm <= 0.0) return 0.5;
    return std::pow(2.0, -meanPath / norm);
}

std::vector<double> IsolationForest::scoreAll(const std::vector<std::vector<double>>& rows) const {
    std::vector<double> out(rows.size(), 0.0);
    const long long n = static_cast<long long>(rows.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long long i = 0; i < n; ++i) {
        out[static_cast<size_t>(i)] = score(rows[static_cast<size_t>(i)]);
    }
    return out;
}
