#pragma once
#include <memory>
#include <string>
#include <vector>

namespace forecast {

// Row-major training set: x[i] is one feature vector, y[i] its label.
struct Dataset {
    std::vector<std::vector<double>> x;
    std::vector<double> y;

    std::size_t size() const { return y.size(); }
    std::size_t features() const { return x.empty() ? 0 : x.front().size(); }
};

// A trained regression model.
class IModel {
public:
    virtual ~IModel() = default;
    virtual double predict(const std::vector<double>& features) const = 0;
    // Disagreement between ensemble members (0 when not an ensemble)
    virtual double spread(const std::vector<double>&) const { return 0.0; }
};

// Training algorithm; swapping it does not touch the pipeline or the store.
class IRegressor {
public:
    virtual ~IRegressor() = default;
    virtual std::string id() const = 0;
    virtual std::unique_ptr<IModel> train(const Dataset& d) const = 0;
};

} // namespace forecast
