#include "ContrastiveDirectionRemover.hpp"
#include "AlignmentErrors.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace cellalign {

namespace {

const char* const kStage = "RemoveContrastiveDirections";

void normalizeSigns(Eigen::MatrixXd& vectors) {
    for (Eigen::Index c = 0; c < vectors.cols(); ++c) {
        Eigen::Index idx;
        vectors.col(c).cwiseAbs().maxCoeff(&idx);
        if (vectors(idx, c) < 0) {
            vectors.col(c) *= -1.0;
        }
    }
}

}

ContrastiveDirectionRemover::ContrastiveDirectionRemover(std::optional<int> fastDims, std::vector<int> removeDims,
                                                         unsigned int seed)
    : fastDims(fastDims), removeDims(std::move(removeDims)), seed(seed) {
    if (this->removeDims.empty()) {
        throw ConfigurationError("no contrastive direction selected for removal", kStage);
    }
    for (int d : this->removeDims) {
        if (d < 0) {
            throw ConfigurationError("negative contrastive direction index " + std::to_string(d), kStage);
        }
        if (fastDims && d >= *fastDims) {
            throw ConfigurationError("contrastive direction index " + std::to_string(d) +
                                     " exceeds the " + std::to_string(*fastDims) + " computed directions", kStage);
        }
    }
}

Eigen::MatrixXd ContrastiveDirectionRemover::withinClusterResiduals(
    const Eigen::MatrixXd& values, const ClusterAssignment& clusters) {

    Eigen::MatrixXd means = Eigen::MatrixXd::Zero(clusters.numClusters, values.cols());
    Eigen::VectorXd sizes = Eigen::VectorXd::Zero(clusters.numClusters);
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        means.row(clusters.labels[i]) += values.row(i);
        sizes(clusters.labels[i]) += 1.0;
    }
    for (int c = 0; c < clusters.numClusters; ++c) {
        if (sizes(c) > 0) means.row(c) /= sizes(c);
    }

    Eigen::MatrixXd residuals = values;
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        residuals.row(i) -= means.row(clusters.labels[i]);
    }
    return residuals;
}

ContrastiveBasis ContrastiveDirectionRemover::computeBasis(
    const ExpressionMatrix& tumorCentered,
    const ClusterAssignment& tumorClusters,
    const ExpressionMatrix& cellLineCentered,
    const ClusterAssignment& cellLineClusters) const {

    checkSameGenes(tumorCentered, cellLineCentered, kStage);
    checkSameSamples(tumorCentered, tumorClusters, kStage);
    checkSameSamples(cellLineCentered, cellLineClusters, kStage);
    if (tumorCentered.numSamples() < 2 || cellLineCentered.numSamples() < 2) {
        throw NumericalError("covariance needs at least two samples per domain", kStage);
    }

    Eigen::MatrixXd tumorResiduals = withinClusterResiduals(tumorCentered.values, tumorClusters);
    Eigen::MatrixXd cellLineResiduals = withinClusterResiduals(cellLineCentered.values, cellLineClusters);

    ContrastiveBasis basis = fastDims
        ? truncatedDecomposition(tumorResiduals, cellLineResiduals, *fastDims)
        : fullDecomposition(tumorResiduals, cellLineResiduals);
    if (!basis.directions.allFinite() || !basis.eigenvalues.allFinite()) {
        throw NumericalError("contrastive eigendecomposition produced non-finite values", kStage);
    }
    normalizeSigns(basis.directions);
    return basis;
}

ContrastiveBasis ContrastiveDirectionRemover::fullDecomposition(
    const Eigen::MatrixXd& tumorResiduals,
    const Eigen::MatrixXd& cellLineResiduals) const {

    // Residuals have zero column means, so the covariances are plain cross products
    Eigen::MatrixXd diff = tumorResiduals.transpose() * tumorResiduals / double(tumorResiduals.rows() - 1);
    diff.noalias() -= cellLineResiduals.transpose() * cellLineResiduals / double(cellLineResiduals.rows() - 1);

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(diff);
    if (solver.info() != Eigen::Success) {
        throw NumericalError("covariance-difference eigendecomposition did not converge", kStage);
    }

    // Eigen returns ascending eigenvalues
    ContrastiveBasis basis;
    basis.fastMode = false;
    basis.eigenvalues = solver.eigenvalues().reverse();
    basis.directions = solver.eigenvectors().rowwise().reverse();
    return basis;
}

ContrastiveBasis ContrastiveDirectionRemover::truncatedDecomposition(
    const Eigen::MatrixXd& tumorResiduals,
    const Eigen::MatrixXd& cellLineResiduals,
    int dims) const {

    const Eigen::Index genes = tumorResiduals.cols();
    dims = static_cast<int>(std::min<Eigen::Index>(dims, genes));
    const Eigen::Index width = std::min<Eigen::Index>(genes, dims + 10);
    const double tumorScale = 1.0 / double(tumorResiduals.rows() - 1);
    const double cellLineScale = 1.0 / double(cellLineResiduals.rows() - 1);

    // Product with the covariance difference without forming it
    auto apply = [&](const Eigen::MatrixXd& v) {
        Eigen::MatrixXd out = tumorResiduals.transpose() * (tumorResiduals * v) * tumorScale;
        out.noalias() -= cellLineResiduals.transpose() * (cellLineResiduals * v) * cellLineScale;
        return out;
    };
    auto orthonormalize = [&](const Eigen::MatrixXd& m) {
        Eigen::HouseholderQR<Eigen::MatrixXd> qr(m);
        return Eigen::MatrixXd(qr.householderQ() * Eigen::MatrixXd::Identity(m.rows(), m.cols()));
    };

    std::mt19937 gen(seed);
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::MatrixXd q(genes, width);
    for (Eigen::Index j = 0; j < width; ++j) {
        for (Eigen::Index i = 0; i < genes; ++i) {
            q(i, j) = normal(gen);
        }
    }
    q = orthonormalize(q);

    for (int iter = 0; iter < 20; ++iter) {
        q = orthonormalize(apply(q));
    }

    Eigen::MatrixXd small = q.transpose() * apply(q);
    small = (small + small.transpose()) / 2.0;
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(small);
    if (solver.info() != Eigen::Success) {
        throw NumericalError("truncated contrastive eigendecomposition did not converge", kStage);
    }

    // Largest magnitude first
    std::vector<Eigen::Index> order(width);
    std::iota(order.begin(), order.end(), 0);
    const Eigen::VectorXd& values = solver.eigenvalues();
    std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
        return std::abs(values(a)) > std::abs(values(b));
    });

    ContrastiveBasis basis;
    basis.fastMode = true;
    basis.eigenvalues.resize(dims);
    basis.directions.resize(genes, dims);
    for (int d = 0; d < dims; ++d) {
        basis.eigenvalues(d) = values(order[d]);
        basis.directions.col(d) = q * solver.eigenvectors().col(order[d]);
    }
    return basis;
}

Eigen::MatrixXd ContrastiveDirectionRemover::selectRemovalBasis(const ContrastiveBasis& basis) const {
    Eigen::MatrixXd removal(basis.directions.rows(), static_cast<Eigen::Index>(removeDims.size()));
    for (size_t c = 0; c < removeDims.size(); ++c) {
        if (removeDims[c] >= basis.directions.cols()) {
            throw NumericalError("contrastive direction " + std::to_string(removeDims[c]) + " requested but only " +
                                 std::to_string(basis.directions.cols()) + " directions exist; "
                                 "reduce the requested dimension count", kStage);
        }
        removal.col(static_cast<Eigen::Index>(c)) = basis.directions.col(removeDims[c]);
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(removal);
    qr.setThreshold(1e-10);
    if (qr.rank() < removal.cols()) {
        throw NumericalError("removal basis has rank " + std::to_string(qr.rank()) + " for " +
                             std::to_string(removal.cols()) + " requested directions; "
                             "reduce the requested dimension count", kStage);
    }
    return removal;
}

ExpressionMatrix ContrastiveDirectionRemover::regressOut(const ExpressionMatrix& raw, const Eigen::MatrixXd& basis) {
    checkConsistent(raw, kStage);
    if (basis.rows() != raw.numGenes()) {
        throw DataShapeError("removal basis spans " + std::to_string(basis.rows()) + " genes, matrix has " +
                             std::to_string(raw.numGenes()), kStage);
    }
    if (basis.cols() >= basis.rows()) {
        throw NumericalError("more removal directions than genes", kStage);
    }

    // Projection onto the column space through a thin orthonormal factor
    Eigen::HouseholderQR<Eigen::MatrixXd> qr(basis);
    Eigen::MatrixXd q = qr.householderQ() * Eigen::MatrixXd::Identity(basis.rows(), basis.cols());

    ExpressionMatrix corrected = raw;
    corrected.values.noalias() -= (raw.values * q) * q.transpose();
    return corrected;
}

ContrastiveDirectionRemover::Result ContrastiveDirectionRemover::removeContrastiveDirections(
    const ExpressionMatrix& tumorRaw,
    const ExpressionMatrix& tumorCentered,
    const ClusterAssignment& tumorClusters,
    const ExpressionMatrix& cellLineRaw,
    const ExpressionMatrix& cellLineCentered,
    const ClusterAssignment& cellLineClusters) const {

    checkSameGenes(tumorRaw, cellLineRaw, kStage);
    checkSameGenes(tumorRaw, tumorCentered, kStage);
    if (tumorRaw.sampleIds != tumorCentered.sampleIds || cellLineRaw.sampleIds != cellLineCentered.sampleIds) {
        throw DataShapeError("raw and centered matrices list different samples", kStage);
    }

    Result result;
    result.basis = computeBasis(tumorCentered, tumorClusters, cellLineCentered, cellLineClusters);
    result.removalBasis = selectRemovalBasis(result.basis);
    result.tumor = regressOut(tumorRaw, result.removalBasis);
    result.cellLine = regressOut(cellLineRaw, result.removalBasis);
    return result;
}

}
