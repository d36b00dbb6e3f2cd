#include "NearestNeighbors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace cellalign {

NeighborList findNearestNeighbors(
    const Eigen::MatrixXd& query,
    const Eigen::MatrixXd& reference,
    int k,
    bool excludeSelf) {

    const int nQuery = static_cast<int>(query.rows());
    const int nRef = static_cast<int>(reference.rows());
    const int candidates = excludeSelf ? nRef - 1 : nRef;
    k = std::max(0, std::min(k, candidates));

    NeighborList result;
    result.indices.resize(nQuery, k);
    result.distances.resize(nQuery, k);
    if (k == 0) {
        return result;
    }

    // Squared distances via norms and a matrix-vector product per query
    Eigen::VectorXd refNorms = reference.rowwise().squaredNorm();
    Eigen::VectorXd cross(nRef);

    std::vector<int> order(nRef);
    std::vector<double> dist(nRef);
    for (int i = 0; i < nQuery; ++i) {
        cross.noalias() = reference * query.row(i).transpose();
        const double queryNorm = query.row(i).squaredNorm();
        for (int j = 0; j < nRef; ++j) {
            dist[j] = std::max(0.0, queryNorm + refNorms(j) - 2.0 * cross(j));
        }
        std::iota(order.begin(), order.end(), 0);
        if (excludeSelf) {
            std::swap(order[i], order[nRef - 1]);
        }
        auto last = excludeSelf ? order.end() - 1 : order.end();
        std::partial_sort(order.begin(), order.begin() + k, last, [&](int a, int b) {
            return dist[a] < dist[b] || (dist[a] == dist[b] && a < b);
        });
        // Reported distances are recomputed directly; the expansion above loses precision near zero
        for (int c = 0; c < k; ++c) {
            result.indices(i, c) = order[c];
            result.distances(i, c) = (query.row(i) - reference.row(order[c])).norm();
        }
    }
    return result;
}

}
