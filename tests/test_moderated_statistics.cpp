/**
 * Unit tests for the empirical-Bayes moderated statistics.
 */

#include "ModeratedStatistics.hpp"
#include "AlignmentErrors.hpp"
#include "TestUtils.hpp"
#include <random>

using namespace cellalign;
using namespace cellalign::stats;
using namespace cellalign::test;

namespace {

const double kPi = 3.14159265358979323846;

// Rows alternate between groups; gene 0 separates them, the rest are noise
// with gene-specific spread
Eigen::MatrixXd twoGroupExpression(int n, int genes, double effect, std::vector<int>& groups, unsigned seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::MatrixXd x(n, genes);
    groups.clear();
    for (int i = 0; i < n; ++i) {
        groups.push_back(i % 2);
        for (int j = 0; j < genes; ++j) {
            double sd = 0.5 + 0.02 * j;
            x(i, j) = 3.0 + sd * normal(gen);
        }
        if (i % 2 == 1) x(i, 0) += effect;
    }
    return x;
}

bool test_special_functions() {
    CHECK(near(digamma(1.0), -0.5772156649015329, 1e-8));
    CHECK(near(digamma(0.5), -1.9635100260214235, 1e-8));
    CHECK(near(trigamma(1.0), kPi * kPi / 6.0, 1e-8));
    CHECK(near(trigamma(0.5), kPi * kPi / 2.0, 1e-8));
    for (double y : {0.3, 1.0, 3.7, 25.0, 400.0}) {
        CHECK(near(trigammaInverse(trigamma(y)), y, 1e-6));
    }
    CHECK_THROWS(trigammaInverse(0.0), NumericalError);
    return true;
}

bool test_constant_variances_give_infinite_prior_df() {
    Eigen::VectorXd variances = Eigen::VectorXd::Constant(100, 2.0);
    VariancePrior prior = fitVariancePrior(variances, 10.0);
    CHECK(std::isinf(prior.df));
    CHECK(prior.variance.size() == 100);
    CHECK(prior.variance.minCoeff() > 0);
    CHECK(near(prior.variance.minCoeff(), prior.variance.maxCoeff()));
    return true;
}

bool test_posterior_between_sample_and_prior() {
    std::vector<int> groups;
    Eigen::MatrixXd x = twoGroupExpression(40, 60, 3.0, groups, 11);
    ModeratedStatistics fit(x, groups, 2);
    CHECK(near(fit.residualDf(), 38.0));
    const Eigen::VectorXd& s2 = fit.residualVariance();
    const Eigen::VectorXd& post = fit.posteriorVariance();
    CHECK(s2.size() == 60 && post.size() == 60);
    for (Eigen::Index j = 0; j < post.size(); ++j) {
        CHECK(post(j) > 0);
    }
    if (std::isfinite(fit.priorDf())) {
        // The posterior is a weighted mean, so it never leaves the hull of its parts
        Eigen::VectorXd amean = x.colwise().mean().transpose();
        VariancePrior trended = fitVariancePrior(s2, fit.residualDf(), &amean);
        for (Eigen::Index j = 0; j < post.size(); ++j) {
            double lo = std::min(s2(j), trended.variance(j));
            double hi = std::max(s2(j), trended.variance(j));
            CHECK(post(j) >= lo - 1e-12 && post(j) <= hi + 1e-12);
        }
    }
    return true;
}

bool test_moderated_t_direction_and_magnitude() {
    std::vector<int> groups;
    Eigen::MatrixXd x = twoGroupExpression(40, 60, 3.0, groups, 5);
    ModeratedStatistics fit(x, groups, 2);
    Eigen::VectorXd t = fit.moderatedT();
    CHECK(t(0) > 0);
    Eigen::Index best;
    t.cwiseAbs().maxCoeff(&best);
    CHECK(best == 0);

    // Swapping the groups flips the sign
    for (auto& g : groups) g = 1 - g;
    ModeratedStatistics swapped(x, groups, 2);
    CHECK(near(swapped.moderatedT()(0), -t(0), 1e-9));
    return true;
}

bool test_moderated_f_ranks_signal_first() {
    std::mt19937 gen(3);
    std::normal_distribution<double> normal(0.0, 1.0);
    const int n = 45, genes = 30;
    Eigen::MatrixXd x(n, genes);
    std::vector<int> groups;
    for (int i = 0; i < n; ++i) {
        groups.push_back(i % 3);
        for (int j = 0; j < genes; ++j) x(i, j) = normal(gen);
        x(i, 7) += 2.0 * (i % 3);
    }
    ModeratedStatistics fit(x, groups, 3);
    Eigen::VectorXd f = fit.moderatedF();
    CHECK(f.minCoeff() >= 0);
    Eigen::Index best;
    f.maxCoeff(&best);
    CHECK(best == 7);
    CHECK(fit.groupMeans().rows() == 3);
    CHECK_THROWS(fit.moderatedT(), NumericalError);
    return true;
}

bool test_degenerate_designs_rejected() {
    Eigen::MatrixXd x = Eigen::MatrixXd::Random(4, 5);
    CHECK_THROWS(ModeratedStatistics(x, {0, 0, 0, 0}, 1), NumericalError);
    // An empty cluster
    CHECK_THROWS(ModeratedStatistics(x, {0, 0, 2, 2}, 3), NumericalError);
    // As many clusters as samples leaves no residual df
    CHECK_THROWS(ModeratedStatistics(x, {0, 1, 2, 3}, 4), NumericalError);
    CHECK_THROWS(ModeratedStatistics(x, {0, 1, 0}, 2), DataShapeError);
    return true;
}

}

int main() {
    return runTests("Moderated Statistics Tests", {
        {"special functions", test_special_functions},
        {"constant variances", test_constant_variances_give_infinite_prior_df},
        {"posterior variance", test_posterior_between_sample_and_prior},
        {"moderated t", test_moderated_t_direction_and_magnitude},
        {"moderated F", test_moderated_f_ranks_signal_first},
        {"degenerate designs", test_degenerate_designs_rejected},
    });
}
