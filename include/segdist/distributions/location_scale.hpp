#pragma once

#include "segdist/piecewise/piecewise_distribution.hpp"
#include "segdist/random.hpp"
#include <Eigen/Dense>
#include <string>

namespace segdist::distributions {

/// Normal(mu, sigma). Split at the inflection points mu +- sigma.
class Normal {
public:
    Normal(double mu = 0.0, double sigma = 1.0);

    [[nodiscard]] double mu() const { return mu_; }
    [[nodiscard]] double sigma() const { return sigma_; }

    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double mu_;
    double sigma_;
    double one_over_twosigma2_;
    double nrm_;
};

/// Uniform on [a, b]: a single constant segment.
class Uniform {
public:
    Uniform(double a = 0.0, double b = 1.0);

    [[nodiscard]] double a() const { return a_; }
    [[nodiscard]] double b() const { return b_; }

    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double a_;
    double b_;
    double p_;
};

/// Cauchy with scale gamma and location center. Split at center +- gamma.
class Cauchy {
public:
    Cauchy(double gamma = 1.0, double center = 0.0);

    [[nodiscard]] double gamma() const { return gamma_; }
    [[nodiscard]] double center() const { return center_; }

    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double gamma_;
    double center_;
};

/// Laplace with scale lambda and location mu.
/// Split at mu - 2 lambda, at the kink mu, and at mu + 2 lambda.
class Laplace {
public:
    Laplace(double lambda = 1.0, double mu = 0.0);

    [[nodiscard]] double lambda() const { return lambda_; }
    [[nodiscard]] double mu() const { return mu_; }

    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double lambda_;
    double mu_;
    double nrm_;
};

/// Standard Student t with df degrees of freedom, evaluated in the log domain.
/// Split at the inflection points +- sqrt(df / (df + 2)).
class StudentT {
public:
    explicit StudentT(double df = 2.0);

    [[nodiscard]] double df() const { return df_; }

    [[nodiscard]] double log_pdf(double x) const;
    [[nodiscard]] double pdf(double x) const;
    [[nodiscard]] Eigen::ArrayXd pdf(const Eigen::ArrayXd& x) const;
    [[nodiscard]] piecewise::PiecewiseDistribution build_piecewise() const;
    [[nodiscard]] Eigen::VectorXd sample(Eigen::Index n, Rng& rng) const;
    [[nodiscard]] std::string name() const;

private:
    double df_;
    double lg_norm_;
};

} // namespace segdist::distributions
