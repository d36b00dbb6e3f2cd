#include "DataStructures.hpp"
#include "AlignmentErrors.hpp"
#include <algorithm>
#include <cmath>

namespace cellalign {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:
            return "ConfigurationError";
        case ErrorKind::NUMERICAL:
            return "NumericalError";
        case ErrorKind::DATA_SHAPE:
            return "DataShapeError";
    }
    return "AlignmentError";
}

AlignmentError::AlignmentError(ErrorKind kind, const std::string& message, const std::string& stage)
    : std::runtime_error(stage.empty() ? errorKindName(kind) + ": " + message
                                       : errorKindName(kind) + " in " + stage + ": " + message),
      errorKind(kind), stageLabel(stage), detail(message) {}

std::string domainName(Domain domain) {
    return domain == Domain::TUMOR ? "tumor" : "cell_line";
}

std::vector<std::vector<int>> ClusterAssignment::members() const {
    std::vector<std::vector<int>> groups(numClusters);
    for (size_t i = 0; i < labels.size(); ++i) {
        groups[labels[i]].push_back(static_cast<int>(i));
    }
    return groups;
}

void validateParameters(const AlignmentParameters& params) {
    if (params.pcDims < 2) {
        throw ConfigurationError("pcDims must be at least 2");
    }
    if (params.umapNeighbors < 2) {
        throw ConfigurationError("umapNeighbors must be at least 2");
    }
    if (params.umapMinDist <= 0 || params.umapMinDist > 3) {
        throw ConfigurationError("umapMinDist must be in (0, 3]");
    }
    if (params.umapEpochs < 1) {
        throw ConfigurationError("umapEpochs must be positive");
    }
    if (params.clusterNeighbors < 2) {
        throw ConfigurationError("clusterNeighbors must be at least 2");
    }
    if (params.clusterResolution <= 0) {
        throw ConfigurationError("clusterResolution must be positive");
    }
    if (params.snnPruneThreshold < 0 || params.snnPruneThreshold >= 1) {
        throw ConfigurationError("snnPruneThreshold must be in [0, 1)");
    }
    if (params.kmeansClusters < 1) {
        throw ConfigurationError("kmeansClusters must be positive");
    }
    if (params.topDEGenes < 1) {
        throw ConfigurationError("topDEGenes must be positive");
    }
    if (params.fastContrastiveDims && *params.fastContrastiveDims < 1) {
        throw ConfigurationError("fastContrastiveDims must be positive when set");
    }
    if (params.removeContrastiveDims.empty()) {
        throw ConfigurationError("removeContrastiveDims must name at least one direction");
    }
    std::vector<int> dims = params.removeContrastiveDims;
    std::sort(dims.begin(), dims.end());
    if (std::adjacent_find(dims.begin(), dims.end()) != dims.end()) {
        throw ConfigurationError("removeContrastiveDims contains duplicate indices");
    }
    if (dims.front() < 0) {
        throw ConfigurationError("removeContrastiveDims indices must be non-negative");
    }
    if (params.fastContrastiveDims && dims.back() >= *params.fastContrastiveDims) {
        throw ConfigurationError("removeContrastiveDims index " + std::to_string(dims.back()) +
                                 " is not among the " + std::to_string(*params.fastContrastiveDims) +
                                 " computed contrastive directions");
    }
    if (params.mnnTargetNeighbors < 1 || params.mnnReferenceNeighbors < 1) {
        throw ConfigurationError("mutual nearest neighbour counts must be positive");
    }
    if (params.mnnDistanceScale <= 0) {
        throw ConfigurationError("mnnDistanceScale must be positive");
    }
}

void checkConsistent(const ExpressionMatrix& matrix, const std::string& stage) {
    if (static_cast<size_t>(matrix.values.rows()) != matrix.sampleIds.size()) {
        throw DataShapeError("matrix has " + std::to_string(matrix.values.rows()) + " rows but " +
                             std::to_string(matrix.sampleIds.size()) + " sample identifiers", stage);
    }
    if (static_cast<size_t>(matrix.values.cols()) != matrix.genes.size()) {
        throw DataShapeError("matrix has " + std::to_string(matrix.values.cols()) + " columns but " +
                             std::to_string(matrix.genes.size()) + " gene identifiers", stage);
    }
}

void checkSameGenes(const ExpressionMatrix& a, const ExpressionMatrix& b, const std::string& stage) {
    checkConsistent(a, stage);
    checkConsistent(b, stage);
    if (a.genes != b.genes) {
        throw DataShapeError("gene columns differ between matrices", stage);
    }
}

void checkSameSamples(const ExpressionMatrix& matrix, const ClusterAssignment& clusters,
                      const std::string& stage) {
    checkConsistent(matrix, stage);
    if (matrix.sampleIds != clusters.sampleIds || clusters.labels.size() != clusters.sampleIds.size()) {
        throw DataShapeError("cluster labels do not match the matrix samples", stage);
    }
    for (int label : clusters.labels) {
        if (label < 0 || label >= clusters.numClusters) {
            throw DataShapeError("cluster label " + std::to_string(label) + " out of range", stage);
        }
    }
}

}
