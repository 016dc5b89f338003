#include "forecast/bagged_trees.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace forecast {

void RegressionTree::fit(const Dataset& d, const std::vector<std::size_t>& rows, const TreeConfig& cfg,
                         double max_features, std::mt19937_64& rng){
    nodes_.clear();
    if (rows.empty()) throw std::invalid_argument("RegressionTree::fit: no rows");
    std::vector<std::size_t> r = rows;
    build(d, r, 0, r.size(), 0, cfg, max_features, rng);
}

int RegressionTree::build(const Dataset& d, std::vector<std::size_t>& rows, std::size_t lo, std::size_t hi, int depth,
                          const TreeConfig& cfg, double max_features, std::mt19937_64& rng){
    const std::size_t n = hi - lo;
    double s = 0.0, s2 = 0.0;
    for (std::size_t i = lo; i < hi; ++i){ const double y = d.y[rows[i]]; s += y; s2 += y*y; }
    const double total_sse = std::max(0.0, s2 - s*s/static_cast<double>(n));

    const int id = static_cast<int>(nodes_.size());
    nodes_.push_back(Node{});
    nodes_[id].value = s / static_cast<double>(n);

    const std::size_t min_leaf = std::max<std::size_t>(1, cfg.min_samples_leaf);
    if (depth >= cfg.max_depth || n < cfg.min_samples_split || n < 2*min_leaf || total_sse <= 0.0)
        return id;

    // candidate features, a random subset when max_features < 1
    const std::size_t nf = d.features();
    std::vector<std::size_t> feats(nf);
    std::iota(feats.begin(), feats.end(), std::size_t{0});
    std::size_t k = nf;
    if (max_features < 1.0){
        k = std::max<std::size_t>(1, static_cast<std::size_t>(std::lround(max_features * static_cast<double>(nf))));
        for (std::size_t i = 0; i < k; ++i){
            std::uniform_int_distribution<std::size_t> pick(i, nf - 1);
            std::swap(feats[i], feats[pick(rng)]);
        }
    }

    int best_f = -1;
    double best_thr = 0.0;
    double best_cost = total_sse;
    std::vector<std::pair<double, std::size_t>> vals(n);

    for (std::size_t fi = 0; fi < k; ++fi){
        const std::size_t f = feats[fi];
        for (std::size_t j = 0; j < n; ++j) vals[j] = {d.x[rows[lo + j]][f], rows[lo + j]};
        std::sort(vals.begin(), vals.end());   // ties broken by row index

        double sl = 0.0, sl2 = 0.0;
        for (std::size_t j = 0; j + 1 < n; ++j){
            const double y = d.y[vals[j].second];
            sl += y; sl2 += y*y;
            const std::size_t nl = j + 1, nr = n - nl;
            if (vals[j].first == vals[j+1].first) continue;
            if (nl < min_leaf || nr < min_leaf) continue;
            const double sr = s - sl, sr2 = s2 - sl2;
            const double cost = (sl2 - sl*sl/static_cast<double>(nl)) + (sr2 - sr*sr/static_cast<double>(nr));
            if (cost < best_cost){
                best_cost = cost;
                best_f = static_cast<int>(f);
                best_thr = 0.5 * (vals[j].first + vals[j+1].first);
            }
        }
    }
    if (best_f < 0) return id;

    auto first = rows.begin() + static_cast<std::ptrdiff_t>(lo);
    auto last  = rows.begin() + static_cast<std::ptrdiff_t>(hi);
    auto mid_it = std::stable_partition(first, last, [&](std::size_t r){ return d.x[r][static_cast<std::size_t>(best_f)] <= best_thr; });
    const std::size_t mid = static_cast<std::size_t>(mid_it - rows.begin());
    if (mid == lo || mid == hi) return id;

    const int left  = build(d, rows, lo, mid, depth + 1, cfg, max_features, rng);
    const int right = build(d, rows, mid, hi, depth + 1, cfg, max_features, rng);
    nodes_[id].feature = best_f;
    nodes_[id].threshold = best_thr;
    nodes_[id].left = left;
    nodes_[id].right = right;
    return id;
}

double RegressionTree::predict(const std::vector<double>& x) const {
    if (nodes_.empty()) return 0.0;
    int i = 0;
    while (nodes_[i].feature >= 0){
        const auto& nd = nodes_[i];
        i = x[static_cast<std::size_t>(nd.feature)] <= nd.threshold ? nd.left : nd.right;
    }
    return nodes_[i].value;
}

double BaggedTreesModel::predict(const std::vector<double>& x) const {
    if (trees_.empty()) return 0.0;
    double s = 0.0;
    for (auto& t : trees_) s += t.predict(x);
    return s / static_cast<double>(trees_.size());
}

double BaggedTreesModel::spread(const std::vector<double>& x) const {
    if (trees_.size() < 2) return 0.0;
    const double m = predict(x);
    double v = 0.0;
    for (auto& t : trees_){ const double e = t.predict(x) - m; v += e*e; }
    return std::sqrt(v / static_cast<double>(trees_.size() - 1));
}

std::unique_ptr<IModel> BaggedTreesRegressor::train(const Dataset& d) const {
    if (d.size() == 0 || d.x.size() != d.y.size())
        throw std::invalid_argument("BaggedTreesRegressor::train: empty or ragged dataset");

    std::mt19937_64 rng(cfg_.seed);
    std::uniform_int_distribution<std::size_t> draw(0, d.size() - 1);
    const std::size_t n_trees = std::max<std::size_t>(1, cfg_.trees);

    std::vector<RegressionTree> trees(n_trees);
    std::vector<std::size_t> rows(d.size());
    for (auto& t : trees){
        for (auto& r : rows) r = draw(rng);   // bootstrap sample
        t.fit(d, rows, cfg_.tree, cfg_.max_features, rng);
    }
    return std::make_unique<BaggedTreesModel>(std::move(trees));
}

} // namespace forecast
