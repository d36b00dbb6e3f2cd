#include "EmbeddingBuilder.hpp"
#include "AlignmentErrors.hpp"
#include "NearestNeighbors.hpp"
#include <Eigen/SVD>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace cellalign {

namespace {

const char* const kStage = "BuildEmbedding";

// Flip columns so the largest-magnitude loading of each is positive
void fixSigns(Eigen::MatrixXd& loadings, Eigen::MatrixXd& scores) {
    for (Eigen::Index c = 0; c < loadings.cols(); ++c) {
        Eigen::Index idx;
        loadings.col(c).cwiseAbs().maxCoeff(&idx);
        if (loadings(idx, c) < 0) {
            loadings.col(c) *= -1.0;
            scores.col(c) *= -1.0;
        }
    }
}

}

EmbeddingBuilder::EmbeddingBuilder(const AlignmentParameters& params)
    : params(params) {}

int EmbeddingBuilder::imputeMissing(ExpressionMatrix& matrix) {
    int replaced = 0;
    for (Eigen::Index j = 0; j < matrix.values.cols(); ++j) {
        double sum = 0.0;
        int count = 0;
        for (Eigen::Index i = 0; i < matrix.values.rows(); ++i) {
            if (std::isfinite(matrix.values(i, j))) {
                sum += matrix.values(i, j);
                ++count;
            }
        }
        if (count == matrix.values.rows()) {
            continue;
        }
        double fill = count > 0 ? sum / count : 0.0;
        for (Eigen::Index i = 0; i < matrix.values.rows(); ++i) {
            if (!std::isfinite(matrix.values(i, j))) {
                matrix.values(i, j) = fill;
                ++replaced;
            }
        }
    }
    return replaced;
}

ExpressionMatrix EmbeddingBuilder::centerGenes(const ExpressionMatrix& matrix, Eigen::VectorXd& geneMeans) {
    ExpressionMatrix centered = matrix;
    geneMeans = matrix.values.colwise().mean().transpose();
    centered.values.rowwise() -= geneMeans.transpose();
    return centered;
}

DomainEmbedding EmbeddingBuilder::buildEmbedding(const ExpressionMatrix& matrix) const {
    checkConsistent(matrix, kStage);
    if (matrix.numSamples() < 3) {
        throw NumericalError("at least 3 samples are needed for an embedding, got " +
                             std::to_string(matrix.numSamples()), kStage);
    }
    if (!matrix.values.allFinite()) {
        throw NumericalError("matrix contains missing or non-finite values", kStage);
    }

    DomainEmbedding embedding;
    embedding.centered = centerGenes(matrix, embedding.geneMeans);
    computePrincipalComponents(embedding);

    UmapLayout layout(params.umapNeighbors, params.umapMinDist, params.umapEpochs, params.randomSeed);
    embedding.layout = layout.computeLayout(embedding.pcs);
    return embedding;
}

void EmbeddingBuilder::computePrincipalComponents(DomainEmbedding& embedding) const {
    const Eigen::MatrixXd& x = embedding.centered.values;
    const Eigen::Index n = x.rows();

    Eigen::Index dims = std::min<Eigen::Index>({params.pcDims, n - 1, x.cols()});
    if (dims < params.pcDims) {
        embedding.warnings.push_back("requested " + std::to_string(params.pcDims) +
                                     " principal components, computed " + std::to_string(dims));
    }

    Eigen::BDCSVD<Eigen::MatrixXd> svd(x, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& singular = svd.singularValues();
    if (singular.size() == 0 || singular(0) < 1e-12) {
        throw NumericalError("matrix has no variance to decompose", kStage);
    }

    embedding.loadings = svd.matrixV().leftCols(dims);
    embedding.pcs = svd.matrixU().leftCols(dims) * singular.head(dims).asDiagonal();
    embedding.sdev = singular.head(dims) / std::sqrt(static_cast<double>(n - 1));
    fixSigns(embedding.loadings, embedding.pcs);
}

UmapLayout::UmapLayout(int numNeighbors, double minDist, int numEpochs, unsigned int seed)
    : numNeighbors(numNeighbors), minDist(minDist), numEpochs(numEpochs), seed(seed) {}

std::pair<double, double> UmapLayout::fitCurve(double minDist, double spread) {
    // Levenberg-Marquardt fit of 1 / (1 + a x^(2b)) to the target membership curve
    const int points = 300;
    Eigen::VectorXd xs = Eigen::VectorXd::LinSpaced(points, 0.0, 3.0 * spread);
    Eigen::VectorXd ys(points);
    for (int i = 0; i < points; ++i) {
        ys(i) = xs(i) < minDist ? 1.0 : std::exp(-(xs(i) - minDist) / spread);
    }

    auto residuals = [&](double a, double b, Eigen::VectorXd& r, Eigen::MatrixXd* jac) {
        r.resize(points);
        if (jac) jac->resize(points, 2);
        for (int i = 0; i < points; ++i) {
            double x = xs(i);
            double p = x > 0 ? std::pow(x, 2.0 * b) : 0.0;
            double denom = 1.0 + a * p;
            r(i) = 1.0 / denom - ys(i);
            if (jac) {
                (*jac)(i, 0) = -p / (denom * denom);
                (*jac)(i, 1) = x > 0 ? -a * p * 2.0 * std::log(x) / (denom * denom) : 0.0;
            }
        }
    };

    double a = 1.8, b = 0.8, lambda = 1e-3;
    Eigen::VectorXd r;
    Eigen::MatrixXd jac;
    residuals(a, b, r, &jac);
    double cost = r.squaredNorm();

    for (int iter = 0; iter < 200; ++iter) {
        Eigen::Matrix2d h = jac.transpose() * jac;
        Eigen::Vector2d g = jac.transpose() * r;
        h.diagonal() *= (1.0 + lambda);
        Eigen::Vector2d step = h.ldlt().solve(-g);

        double na = a + step(0), nb = b + step(1);
        if (na <= 0 || nb <= 0) {
            lambda *= 10.0;
            continue;
        }
        Eigen::VectorXd nr;
        residuals(na, nb, nr, nullptr);
        double newCost = nr.squaredNorm();
        if (newCost < cost) {
            bool converged = cost - newCost < 1e-12;
            a = na;
            b = nb;
            cost = newCost;
            lambda = std::max(lambda / 10.0, 1e-12);
            residuals(a, b, r, &jac);
            if (converged) break;
        } else {
            lambda *= 10.0;
            if (lambda > 1e12) break;
        }
    }
    return {a, b};
}

std::vector<UmapLayout::Edge> UmapLayout::fuzzyGraph(const Eigen::MatrixXd& embedding, int k) const {
    const int n = static_cast<int>(embedding.rows());
    NeighborList knn = findNearestNeighbors(embedding, embedding, k, true);
    k = static_cast<int>(knn.indices.cols());

    const double target = std::log2(static_cast<double>(k));
    const double meanDistance = knn.distances.size() > 0 ? knn.distances.mean() : 1.0;

    // Directed memberships, calibrated per sample
    std::vector<Edge> directed;
    directed.reserve(static_cast<size_t>(n) * k);
    for (int i = 0; i < n; ++i) {
        double rho = 0.0;
        for (int c = 0; c < k; ++c) {
            if (knn.distances(i, c) > 0) {
                rho = knn.distances(i, c);
                break;
            }
        }

        double lo = 0.0, hi = std::numeric_limits<double>::infinity(), sigma = 1.0;
        for (int iter = 0; iter < 64; ++iter) {
            double sum = 0.0;
            for (int c = 0; c < k; ++c) {
                double d = knn.distances(i, c) - rho;
                sum += d > 0 ? std::exp(-d / sigma) : 1.0;
            }
            if (std::abs(sum - target) < 1e-5) break;
            if (sum > target) {
                hi = sigma;
                sigma = (lo + hi) / 2.0;
            } else {
                lo = sigma;
                sigma = std::isinf(hi) ? sigma * 2.0 : (lo + hi) / 2.0;
            }
        }
        sigma = std::max(sigma, 1e-3 * meanDistance);

        for (int c = 0; c < k; ++c) {
            double d = knn.distances(i, c) - rho;
            directed.push_back(Edge{i, knn.indices(i, c), d > 0 ? std::exp(-d / sigma) : 1.0});
        }
    }

    // Fuzzy union: w + w' - w w'
    for (auto& e : directed) {
        if (e.head > e.tail) std::swap(e.head, e.tail);
    }
    std::sort(directed.begin(), directed.end(), [](const Edge& x, const Edge& y) {
        return x.head != y.head ? x.head < y.head : x.tail < y.tail;
    });

    std::vector<Edge> edges;
    for (size_t i = 0; i < directed.size();) {
        size_t j = i + 1;
        double w = directed[i].weight;
        if (j < directed.size() && directed[j].head == directed[i].head && directed[j].tail == directed[i].tail) {
            w = w + directed[j].weight - w * directed[j].weight;
            ++j;
        }
        edges.push_back(Edge{directed[i].head, directed[i].tail, w});
        i = j;
    }
    return edges;
}

Eigen::MatrixXd UmapLayout::initialLayout(const Eigen::MatrixXd& embedding) const {
    const Eigen::Index n = embedding.rows();
    Eigen::MatrixXd init = Eigen::MatrixXd::Zero(n, 2);
    init.leftCols(std::min<Eigen::Index>(2, embedding.cols())) =
        embedding.leftCols(std::min<Eigen::Index>(2, embedding.cols()));

    std::mt19937 gen(seed);
    std::normal_distribution<double> jitter(0.0, 1e-4);
    for (Eigen::Index c = 0; c < 2; ++c) {
        double lo = init.col(c).minCoeff();
        double span = init.col(c).maxCoeff() - lo;
        for (Eigen::Index i = 0; i < n; ++i) {
            double v = span > 0 ? 10.0 * (init(i, c) - lo) / span : 0.0;
            init(i, c) = v + jitter(gen);
        }
    }
    return init;
}

Eigen::MatrixXd UmapLayout::computeLayout(const Eigen::MatrixXd& embedding) const {
    const int n = static_cast<int>(embedding.rows());
    Eigen::MatrixXd y = initialLayout(embedding);
    if (n < 3) {
        return y;
    }

    std::vector<Edge> edges = fuzzyGraph(embedding, numNeighbors);
    auto [a, b] = fitCurve(minDist);

    double maxWeight = 0.0;
    for (const auto& e : edges) maxWeight = std::max(maxWeight, e.weight);

    // Edges too weak to be sampled within the epoch budget are dropped
    std::vector<Edge> active;
    std::vector<double> epochsPerSample;
    for (const auto& e : edges) {
        if (e.weight >= maxWeight / numEpochs) {
            active.push_back(e);
            epochsPerSample.push_back(maxWeight / e.weight);
        }
    }

    const double negativeRate = 5.0;
    std::vector<double> nextSample = epochsPerSample;
    std::vector<double> epochsPerNegative(epochsPerSample.size());
    for (size_t i = 0; i < epochsPerSample.size(); ++i) {
        epochsPerNegative[i] = epochsPerSample[i] / negativeRate;
    }
    std::vector<double> nextNegative = epochsPerNegative;

    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> pick(0, n - 1);
    auto clip = [](double v) { return std::max(-4.0, std::min(4.0, v)); };

    for (int epoch = 0; epoch < numEpochs; ++epoch) {
        const double alpha = 1.0 - static_cast<double>(epoch) / numEpochs;
        for (size_t e = 0; e < active.size(); ++e) {
            if (nextSample[e] > epoch) continue;

            const int i = active[e].head;
            const int j = active[e].tail;
            Eigen::Vector2d diff = (y.row(i) - y.row(j)).transpose();
            double d2 = diff.squaredNorm();
            if (d2 > 0) {
                double coeff = -2.0 * a * b * std::pow(d2, b - 1.0) / (1.0 + a * std::pow(d2, b));
                for (int c = 0; c < 2; ++c) {
                    double g = clip(coeff * diff(c)) * alpha;
                    y(i, c) += g;
                    y(j, c) -= g;
                }
            }
            nextSample[e] += epochsPerSample[e];

            int negatives = std::max(0, static_cast<int>((epoch - nextNegative[e]) / epochsPerNegative[e]));
            for (int s = 0; s < negatives; ++s) {
                int other = pick(gen);
                if (other == i) continue;
                Eigen::Vector2d away = (y.row(i) - y.row(other)).transpose();
                double dn2 = away.squaredNorm();
                if (dn2 <= 0) continue;
                double coeff = 2.0 * b / ((0.001 + dn2) * (1.0 + a * std::pow(dn2, b)));
                for (int c = 0; c < 2; ++c) {
                    y(i, c) += clip(coeff * away(c)) * alpha;
                }
            }
            nextNegative[e] += negatives * epochsPerNegative[e];
        }
    }
    return y;
}

}
