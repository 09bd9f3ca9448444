#pragma once

#include <Eigen/Dense>
#include <memory>
#include <utility>
#include <vector>

namespace segdist::distributions {

/// Generic weighted container of immutable components.
///
/// Components are shared, so copying a mixture never copies a component and
/// T may be incomplete where the mixture is declared.
template <typename T>
class Mixture {
public:
    Mixture() = default;

    // ---- Component access ----

    [[nodiscard]] std::size_t size() const { return components_.size(); }
    [[nodiscard]] bool empty() const { return components_.empty(); }

    [[nodiscard]] const T& component(std::size_t i) const { return *components_[i]; }

    [[nodiscard]] double weight(std::size_t i) const { return weights_(static_cast<Eigen::Index>(i)); }
    [[nodiscard]] const Eigen::VectorXd& weights() const { return weights_; }

    [[nodiscard]] double total_weight() const { return weights_.sum(); }

    // ---- Component management ----

    void add_component(std::shared_ptr<const T> dist, double weight) {
        components_.push_back(std::move(dist));
        weights_.conservativeResize(weights_.size() + 1);
        weights_(weights_.size() - 1) = weight;
    }

    void add_component(T dist, double weight) {
        add_component(std::make_shared<const T>(std::move(dist)), weight);
    }

    /// Sub-mixture of the components whose weight is at least `threshold`.
    [[nodiscard]] Mixture<T> extract_mix(double threshold) const {
        Mixture<T> result;
        for (std::size_t i = 0; i < size(); ++i) {
            if (weight(i) >= threshold) {
                result.add_component(components_[i], weight(i));
            }
        }
        return result;
    }

    [[nodiscard]] const std::vector<std::shared_ptr<const T>>& components() const { return components_; }

private:
    std::vector<std::shared_ptr<const T>> components_;
    Eigen::VectorXd weights_;
};

} // namespace segdist::distributions
