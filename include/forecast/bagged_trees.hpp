#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include "forecast/model.hpp"

namespace forecast {

struct TreeConfig {
    int max_depth{12};
    std::size_t min_samples_leaf{2};
    std::size_t min_samples_split{4};
};

struct BaggingConfig {
    std::size_t trees{100};
    TreeConfig tree;
    double max_features{1.0};    // fraction of features tried per split
    std::uint64_t seed{42};
};

// CART regression tree, variance-reduction splits.
class RegressionTree {
public:
    void fit(const Dataset& d, const std::vector<std::size_t>& rows, const TreeConfig& cfg,
             double max_features, std::mt19937_64& rng);
    double predict(const std::vector<double>& x) const;
    std::size_t node_count() const { return nodes_.size(); }

private:
    struct Node {
        int feature{-1};        // -1 -> leaf
        double threshold{0.0};  // x[feature] <= threshold goes left
        int left{-1}, right{-1};
        double value{0.0};
    };
    int build(const Dataset& d, std::vector<std::size_t>& rows, std::size_t lo, std::size_t hi, int depth,
              const TreeConfig& cfg, double max_features, std::mt19937_64& rng);

    std::vector<Node> nodes_;
};

class BaggedTreesModel final : public IModel {
public:
    explicit BaggedTreesModel(std::vector<RegressionTree> trees) : trees_(std::move(trees)) {}
    double predict(const std::vector<double>& x) const override;
    double spread(const std::vector<double>& x) const override;
    std::size_t size() const { return trees_.size(); }
private:
    std::vector<RegressionTree> trees_;
};

// Bootstrap-aggregated regression trees. Same data + same seed -> same model.
class BaggedTreesRegressor final : public IRegressor {
public:
    explicit BaggedTreesRegressor(BaggingConfig cfg = {}) : cfg_(cfg) {}
    std::string id() const override { return "bagged_trees"; }
    std::unique_ptr<IModel> train(const Dataset& d) const override;
    const BaggingConfig& config() const { return cfg_; }
private:
    BaggingConfig cfg_;
};

} // namespace forecast
