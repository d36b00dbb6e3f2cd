#include "DifferentialStateRanker.hpp"
#include "AlignmentErrors.hpp"
#include "ModeratedStatistics.hpp"
#include <algorithm>
#include <cmath>

namespace cellalign {

namespace {

const char* const kStage = "RankGenes";

}

DifferentialStateRanker::DifferentialStateRanker(bool varianceTrend)
    : varianceTrend(varianceTrend) {}

DifferentialGeneScore::Source DifferentialStateRanker::testFor(int numClusters) {
    if (numClusters <= 1) {
        return DifferentialGeneScore::Source::NO_SIGNAL;
    }
    if (numClusters == 2) {
        return DifferentialGeneScore::Source::PAIRWISE_TEST;
    }
    return DifferentialGeneScore::Source::MULTI_GROUP_TEST;
}

DifferentialGeneScore DifferentialStateRanker::rankGenes(
    const ExpressionMatrix& matrix,
    const ClusterAssignment& clusters) const {

    checkSameSamples(matrix, clusters, kStage);

    DifferentialGeneScore result;
    result.genes = matrix.genes;
    result.source = testFor(clusters.numClusters);
    result.scores.assign(matrix.genes.size(), std::nullopt);

    Eigen::VectorXd stat;
    switch (result.source) {
        case DifferentialGeneScore::Source::NO_SIGNAL:
            break;
        case DifferentialGeneScore::Source::PAIRWISE_TEST: {
            stats::ModeratedStatistics fit(matrix.values, clusters.labels, 2, varianceTrend);
            stat = fit.moderatedT().cwiseAbs();
            break;
        }
        case DifferentialGeneScore::Source::MULTI_GROUP_TEST: {
            stats::ModeratedStatistics fit(matrix.values, clusters.labels, clusters.numClusters, varianceTrend);
            stat = fit.moderatedF();
            break;
        }
    }

    for (Eigen::Index j = 0; j < stat.size(); ++j) {
        if (std::isnan(stat(j))) {
            throw NumericalError("undefined test statistic for gene " + matrix.genes[j], kStage);
        }
        result.scores[j] = stat(j);
    }
    result.ranks = denseRank(result.scores);
    return result;
}

std::vector<std::optional<int>> denseRank(const std::vector<std::optional<double>>& scores) {
    std::vector<size_t> order;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i]) order.push_back(i);
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return *scores[a] > *scores[b];
    });

    std::vector<std::optional<int>> ranks(scores.size(), std::nullopt);
    int rank = 0;
    for (size_t r = 0; r < order.size(); ++r) {
        if (r == 0 || *scores[order[r]] != *scores[order[r - 1]]) {
            ++rank;
        }
        ranks[order[r]] = rank;
    }
    return ranks;
}

}
