#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <vector>

namespace cellalign {

// Mutual-nearest-neighbour correction of a target domain toward a reference
// domain. Distances use the alignment genes only; corrections apply to every gene.
class NeighborBatchCorrector {
public:
    // targetNeighbors: target samples searched per reference sample.
    // referenceNeighbors: reference samples searched per target sample, also
    // the number of paired target samples averaged when smoothing.
    // distanceScale: tricube bandwidth in units of the middle neighbour distance.
    NeighborBatchCorrector(int targetNeighbors, int referenceNeighbors, double distanceScale);

    NeighborCorrection correct(const ExpressionMatrix& reference,
                               const ExpressionMatrix& target,
                               const AlignmentGeneSet& alignmentGenes) const;

    // (reference row, target row) pairs that are in each other's neighbour lists
    std::vector<std::pair<int, int>> findMutualPairs(const Eigen::MatrixXd& reference,
                                                     const Eigen::MatrixXd& target) const;

private:
    int targetNeighbors;
    int referenceNeighbors;
    double distanceScale;

    static Eigen::MatrixXd alignmentColumns(const ExpressionMatrix& matrix, const std::vector<int>& columns);
};

}
