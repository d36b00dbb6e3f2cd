#pragma once

#include <Eigen/Dense>
#include <vector>

namespace cellalign {
namespace stats {

double digamma(double x);
double trigamma(double x);
// Solves trigamma(y) = x for y by Newton iteration
double trigammaInverse(double x);

// Prior of the empirical-Bayes variance model
struct VariancePrior {
    double df;                 // d0, infinite when the sample variances show no extra spread
    Eigen::VectorXd variance;  // s0^2 per gene (constant without a trend)
};

// Method-of-moments fit of a scaled F distribution to the sample variances.
// With a covariate, the prior log-variance follows a polynomial trend in it.
VariancePrior fitVariancePrior(const Eigen::VectorXd& variances, double df,
                               const Eigen::VectorXd* covariate = nullptr);

// Per-gene one-way linear model of expression on cluster membership, moderated
// by an empirical-Bayes variance prior. Rows of the matrix are samples.
class ModeratedStatistics {
public:
    ModeratedStatistics(const Eigen::MatrixXd& expression, const std::vector<int>& groups,
                        int numGroups, bool trend = true);

    // Moderated t of group 1 minus group 0; requires exactly two groups
    Eigen::VectorXd moderatedT() const;

    // Moderated F of the null hypothesis that all group means are equal
    Eigen::VectorXd moderatedF() const;

    const Eigen::MatrixXd& groupMeans() const { return means; }
    const Eigen::VectorXd& residualVariance() const { return sigma2; }
    const Eigen::VectorXd& posteriorVariance() const { return posterior; }
    double residualDf() const { return dfResidual; }
    double priorDf() const { return prior.df; }

private:
    Eigen::MatrixXd means;          // groups x genes
    Eigen::VectorXd groupSizes;
    Eigen::VectorXd betweenSS;      // between-group sum of squares per gene
    Eigen::VectorXd sigma2;
    Eigen::VectorXd posterior;
    double dfResidual;
    VariancePrior prior;
};

}
}
