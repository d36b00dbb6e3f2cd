#pragma once

#include <Eigen/Dense>

namespace cellalign {

struct NeighborList {
    Eigen::MatrixXi indices;    // queries x k, nearest first
    Eigen::MatrixXd distances;  // Euclidean
};

// Exact k nearest rows of reference for every row of query. With
// excludeSelf, query and reference are the same matrix and row i never
// lists itself. k is clamped to the number of available candidates.
NeighborList findNearestNeighbors(
    const Eigen::MatrixXd& query,
    const Eigen::MatrixXd& reference,
    int k,
    bool excludeSelf = false
);

}
