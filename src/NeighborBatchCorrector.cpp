#include "NeighborBatchCorrector.hpp"
#include "AlignmentErrors.hpp"
#include "NearestNeighbors.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace cellalign {

namespace {

const char* const kStage = "CorrectNeighbors";

}

NeighborBatchCorrector::NeighborBatchCorrector(int targetNeighbors, int referenceNeighbors, double distanceScale)
    : targetNeighbors(targetNeighbors), referenceNeighbors(referenceNeighbors), distanceScale(distanceScale) {
    if (targetNeighbors < 1 || referenceNeighbors < 1) {
        throw ConfigurationError("neighbour counts must be positive", kStage);
    }
    if (!(distanceScale > 0)) {
        throw ConfigurationError("distance scale must be positive", kStage);
    }
}

Eigen::MatrixXd NeighborBatchCorrector::alignmentColumns(const ExpressionMatrix& matrix,
                                                         const std::vector<int>& columns) {
    Eigen::MatrixXd subset(matrix.values.rows(), static_cast<Eigen::Index>(columns.size()));
    for (size_t c = 0; c < columns.size(); ++c) {
        subset.col(static_cast<Eigen::Index>(c)) = matrix.values.col(columns[c]);
    }
    return subset;
}

std::vector<std::pair<int, int>> NeighborBatchCorrector::findMutualPairs(
    const Eigen::MatrixXd& reference,
    const Eigen::MatrixXd& target) const {

    std::vector<std::pair<int, int>> pairs;
    if (reference.rows() == 0 || target.rows() == 0) {
        return pairs;
    }

    NeighborList referenceToTarget = findNearestNeighbors(reference, target, targetNeighbors);
    NeighborList targetToReference = findNearestNeighbors(target, reference, referenceNeighbors);

    for (Eigen::Index r = 0; r < referenceToTarget.indices.rows(); ++r) {
        for (Eigen::Index c = 0; c < referenceToTarget.indices.cols(); ++c) {
            const int t = referenceToTarget.indices(r, c);
            for (Eigen::Index b = 0; b < targetToReference.indices.cols(); ++b) {
                if (targetToReference.indices(t, b) == r) {
                    pairs.emplace_back(static_cast<int>(r), t);
                    break;
                }
            }
        }
    }
    std::sort(pairs.begin(), pairs.end());
    return pairs;
}

NeighborCorrection NeighborBatchCorrector::correct(
    const ExpressionMatrix& reference,
    const ExpressionMatrix& target,
    const AlignmentGeneSet& alignmentGenes) const {

    checkSameGenes(reference, target, kStage);
    if (alignmentGenes.empty()) {
        throw ConfigurationError("alignment gene set is empty", kStage);
    }

    std::unordered_map<std::string, int> column;
    for (size_t j = 0; j < target.genes.size(); ++j) {
        column.emplace(target.genes[j], static_cast<int>(j));
    }
    std::vector<int> columns;
    for (const auto& gene : alignmentGenes) {
        auto it = column.find(gene);
        if (it == column.end()) {
            throw DataShapeError("alignment gene " + gene + " is not a matrix column", kStage);
        }
        columns.push_back(it->second);
    }
    std::sort(columns.begin(), columns.end());

    const Eigen::MatrixXd referenceSubset = alignmentColumns(reference, columns);
    const Eigen::MatrixXd targetSubset = alignmentColumns(target, columns);
    if (!referenceSubset.allFinite() || !targetSubset.allFinite()) {
        throw NumericalError("alignment genes contain non-finite values", kStage);
    }

    NeighborCorrection result;
    result.reference = reference;
    result.target = target;
    result.pairs = findMutualPairs(referenceSubset, targetSubset);

    const int numTarget = static_cast<int>(target.numSamples());

    // Mean reference - target offset over each paired target sample's pairs
    std::vector<int> paired;
    std::vector<int> pairCount(numTarget, 0);
    Eigen::MatrixXd offsets = Eigen::MatrixXd::Zero(numTarget, target.numGenes());
    for (const auto& [r, t] : result.pairs) {
        offsets.row(t) += reference.values.row(r) - target.values.row(t);
        if (pairCount[t]++ == 0) paired.push_back(t);
    }
    std::sort(paired.begin(), paired.end());
    for (int t : paired) {
        offsets.row(t) /= pairCount[t];
    }
    result.unpairedTargetSamples = numTarget - static_cast<int>(paired.size());

    if (paired.empty()) {
        result.isolatedTargetSamples = numTarget;
        return result;
    }

    // Tricube-weighted average of the offsets of the nearest paired samples
    Eigen::MatrixXd pairedSubset(paired.size(), targetSubset.cols());
    for (size_t p = 0; p < paired.size(); ++p) {
        pairedSubset.row(static_cast<Eigen::Index>(p)) = targetSubset.row(paired[p]);
    }
    NeighborList nearest = findNearestNeighbors(targetSubset, pairedSubset, referenceNeighbors);
    const Eigen::Index k = nearest.indices.cols();
    const Eigen::Index middle = (k + 1) / 2 - 1;

    for (int t = 0; t < numTarget; ++t) {
        const double bandwidth = std::max(1e-8, distanceScale * nearest.distances(t, middle));
        Eigen::VectorXd weights(k);
        for (Eigen::Index c = 0; c < k; ++c) {
            double rel = std::min(1.0, nearest.distances(t, c) / bandwidth);
            double tri = 1.0 - rel * rel * rel;
            weights(c) = tri * tri * tri;
        }
        const double total = weights.sum();
        if (!(total > 0)) {
            ++result.isolatedTargetSamples;
            continue;
        }
        for (Eigen::Index c = 0; c < k; ++c) {
            if (weights(c) > 0) {
                result.target.values.row(t) += (weights(c) / total) * offsets.row(paired[nearest.indices(t, c)]);
            }
        }
    }
    return result;
}

}
