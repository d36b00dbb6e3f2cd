#include "ModeratedStatistics.hpp"
#include "AlignmentErrors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace cellalign {
namespace stats {

namespace {

const char* const kStage = "RankGenes";

// Second derivative of digamma
double tetragamma(double x) {
    double result = 0.0;

    // Use recurrence for small x
    while (x < 6.0) {
        result -= 2.0 / (x * x * x);
        x += 1.0;
    }

    double inv_x = 1.0 / x;
    double inv_x2 = inv_x * inv_x;
    result += -inv_x2 - inv_x2 * inv_x - 0.5 * inv_x2 * inv_x2
              + inv_x2 * inv_x2 * inv_x2 * (1.0/6.0 - inv_x2 * (1.0/6.0 - inv_x2 * 0.3));
    return result;
}

double median(Eigen::VectorXd values) {
    std::sort(values.data(), values.data() + values.size());
    const Eigen::Index n = values.size();
    return n % 2 == 1 ? values(n / 2) : 0.5 * (values(n / 2 - 1) + values(n / 2));
}

}

// Digamma function (derivative of log-gamma)
double digamma(double x) {
    double result = 0.0;

    // Use recurrence for small x
    while (x < 6.0) {
        result -= 1.0 / x;
        x += 1.0;
    }

    // Asymptotic series for large x
    double inv_x = 1.0 / x;
    double inv_x2 = inv_x * inv_x;
    result += std::log(x) - 0.5 * inv_x
              - inv_x2 * (1.0/12.0 - inv_x2 * (1.0/120.0 - inv_x2 / 252.0));

    return result;
}

// Trigamma function (second derivative of log-gamma)
double trigamma(double x) {
    double result = 0.0;

    // Use recurrence for small x
    while (x < 6.0) {
        result += 1.0 / (x * x);
        x += 1.0;
    }

    // Asymptotic series for large x
    double inv_x = 1.0 / x;
    double inv_x2 = inv_x * inv_x;
    result += inv_x + 0.5 * inv_x2
              + inv_x2 * inv_x * (1.0/6.0 - inv_x2 * (1.0/30.0 - inv_x2 / 42.0));

    return result;
}

double trigammaInverse(double x) {
    if (!(x > 0)) {
        throw NumericalError("trigamma inverse needs a positive argument", kStage);
    }
    if (x > 1e7) return 1.0 / std::sqrt(x);
    if (x < 1e-6) return 1.0 / x;

    double y = 0.5 + 1.0 / x;
    for (int iter = 0; iter < 50; ++iter) {
        double tri = trigamma(y);
        double dif = tri * (1.0 - tri / x) / tetragamma(y);
        y += dif;
        if (-dif / y < 1e-8) break;
    }
    return y;
}

VariancePrior fitVariancePrior(const Eigen::VectorXd& variances, double df,
                               const Eigen::VectorXd* covariate) {
    const Eigen::Index n = variances.size();
    VariancePrior prior;
    if (n == 0) {
        prior.df = 0.0;
        return prior;
    }

    // Guard against zero variances before taking logs
    Eigen::VectorXd x = variances.cwiseMax(0.0);
    double m = median(x);
    if (m == 0) m = 1.0;
    x = x.cwiseMax(1e-5 * m);

    Eigen::VectorXd e = x.array().log() - digamma(df / 2.0) + std::log(df / 2.0);

    Eigen::VectorXd emean;
    double evar;
    bool useTrend = false;
    if (covariate && covariate->size() == n) {
        double lo = covariate->minCoeff(), hi = covariate->maxCoeff();
        useTrend = hi - lo > 1e-8 * (1.0 + std::abs(covariate->mean()));
    }

    if (useTrend) {
        // Low-degree polynomial trend in the standardised covariate
        int splineDf = 1 + (n >= 3) + (n >= 6) + (n >= 30);
        Eigen::VectorXd c = covariate->array() - covariate->mean();
        double scale = std::sqrt(c.squaredNorm() / std::max<Eigen::Index>(1, n - 1));
        c /= scale;

        Eigen::MatrixXd design(n, splineDf);
        design.col(0).setOnes();
        for (int d = 1; d < splineDf; ++d) {
            design.col(d) = design.col(d - 1).cwiseProduct(c);
        }
        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
        Eigen::VectorXd coef = qr.solve(e);
        emean = design * coef;
        const auto rank = qr.rank();
        evar = n > rank ? (e - emean).squaredNorm() / static_cast<double>(n - rank) : 0.0;
    } else {
        double mean = e.mean();
        emean = Eigen::VectorXd::Constant(n, mean);
        evar = n > 1 ? (e.array() - mean).square().sum() / static_cast<double>(n - 1) : 0.0;
    }

    evar -= trigamma(df / 2.0);
    if (evar > 0) {
        prior.df = 2.0 * trigammaInverse(evar);
        prior.variance = (emean.array() + digamma(prior.df / 2.0) - std::log(prior.df / 2.0)).exp();
    } else {
        prior.df = std::numeric_limits<double>::infinity();
        prior.variance = emean.array().exp();
    }
    return prior;
}

ModeratedStatistics::ModeratedStatistics(const Eigen::MatrixXd& expression, const std::vector<int>& groups,
                                         int numGroups, bool trend) {
    const Eigen::Index n = expression.rows();
    const Eigen::Index genes = expression.cols();

    if (static_cast<size_t>(n) != groups.size()) {
        throw DataShapeError("expression has " + std::to_string(n) + " samples but " +
                             std::to_string(groups.size()) + " group labels", kStage);
    }
    if (numGroups < 2) {
        throw NumericalError("a linear model across clusters needs at least two clusters", kStage);
    }
    dfResidual = static_cast<double>(n - numGroups);
    if (dfResidual < 1) {
        throw NumericalError("no residual degrees of freedom: " + std::to_string(n) + " samples in " +
                             std::to_string(numGroups) + " clusters", kStage);
    }

    means = Eigen::MatrixXd::Zero(numGroups, genes);
    groupSizes = Eigen::VectorXd::Zero(numGroups);
    for (Eigen::Index i = 0; i < n; ++i) {
        int g = groups[i];
        if (g < 0 || g >= numGroups) {
            throw DataShapeError("group label " + std::to_string(g) + " out of range", kStage);
        }
        means.row(g) += expression.row(i);
        groupSizes(g) += 1.0;
    }
    for (int g = 0; g < numGroups; ++g) {
        if (groupSizes(g) == 0) {
            throw NumericalError("cluster " + std::to_string(g) + " has no samples", kStage);
        }
        means.row(g) /= groupSizes(g);
    }

    Eigen::RowVectorXd grand = expression.colwise().mean();
    betweenSS = Eigen::VectorXd::Zero(genes);
    for (int g = 0; g < numGroups; ++g) {
        betweenSS += groupSizes(g) * (means.row(g) - grand).array().square().matrix().transpose();
    }

    Eigen::VectorXd withinSS = Eigen::VectorXd::Zero(genes);
    for (Eigen::Index i = 0; i < n; ++i) {
        withinSS += (expression.row(i) - means.row(groups[i])).array().square().matrix().transpose();
    }
    sigma2 = withinSS / dfResidual;

    Eigen::VectorXd amean = grand.transpose();
    prior = fitVariancePrior(sigma2, dfResidual, trend ? &amean : nullptr);

    if (std::isinf(prior.df)) {
        posterior = prior.variance;
    } else {
        posterior = (prior.df * prior.variance + dfResidual * sigma2) / (prior.df + dfResidual);
    }
}

Eigen::VectorXd ModeratedStatistics::moderatedT() const {
    if (means.rows() != 2) {
        throw NumericalError("moderated t needs exactly two clusters, got " + std::to_string(means.rows()), kStage);
    }
    const double unscaled = 1.0 / groupSizes(0) + 1.0 / groupSizes(1);
    Eigen::VectorXd t(means.cols());
    for (Eigen::Index j = 0; j < means.cols(); ++j) {
        double diff = means(1, j) - means(0, j);
        double se = std::sqrt(posterior(j) * unscaled);
        t(j) = se > 0 ? diff / se : (diff == 0 ? 0.0 : std::copysign(std::numeric_limits<double>::infinity(), diff));
    }
    return t;
}

Eigen::VectorXd ModeratedStatistics::moderatedF() const {
    const double numeratorDf = static_cast<double>(means.rows() - 1);
    Eigen::VectorXd f(means.cols());
    for (Eigen::Index j = 0; j < means.cols(); ++j) {
        double denom = numeratorDf * posterior(j);
        f(j) = denom > 0 ? betweenSS(j) / denom
                         : (betweenSS(j) == 0 ? 0.0 : std::numeric_limits<double>::infinity());
    }
    return f;
}

}
}
