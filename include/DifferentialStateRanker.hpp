#pragma once

#include "DataStructures.hpp"

namespace cellalign {

// Scores every gene by how strongly its expression separates the clusters of
// one domain. The number of clusters decides the test:
//   1 cluster  -> NO_SIGNAL, every score missing
//   2 clusters -> PAIRWISE_TEST, |moderated t|
//   more       -> MULTI_GROUP_TEST, moderated F
// Larger scores are always more differential.
class DifferentialStateRanker {
public:
    explicit DifferentialStateRanker(bool varianceTrend = true);

    DifferentialGeneScore rankGenes(const ExpressionMatrix& matrix, const ClusterAssignment& clusters) const;

    static DifferentialGeneScore::Source testFor(int numClusters);

private:
    bool varianceTrend;
};

// Dense ranks of the present scores, 1 for the highest. Missing scores stay unranked.
std::vector<std::optional<int>> denseRank(const std::vector<std::optional<double>>& scores);

}
