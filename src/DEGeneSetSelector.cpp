#include "DEGeneSetSelector.hpp"
#include "AlignmentErrors.hpp"
#include "DifferentialStateRanker.hpp"
#include <algorithm>

namespace cellalign {

namespace {

const char* const kStage = "SelectAlignmentGenes";

}

DEGeneSetSelector::DEGeneSetSelector(int topK)
    : topK(topK) {
    if (topK < 1) {
        throw ConfigurationError("top-K threshold must be positive", kStage);
    }
}

std::vector<std::optional<int>> DEGeneSetSelector::bestRanks(
    const DifferentialGeneScore& tumor,
    const DifferentialGeneScore& cellLine) {

    if (tumor.genes != cellLine.genes) {
        throw DataShapeError("differential scores cover different genes", kStage);
    }
    if (tumor.scores.size() != tumor.genes.size() || cellLine.scores.size() != cellLine.genes.size()) {
        throw DataShapeError("differential scores do not match their gene lists", kStage);
    }

    auto tumorRanks = denseRank(tumor.scores);
    auto cellLineRanks = denseRank(cellLine.scores);

    std::vector<std::optional<int>> best(tumor.genes.size());
    for (size_t i = 0; i < best.size(); ++i) {
        if (tumorRanks[i] && cellLineRanks[i]) {
            best[i] = std::min(*tumorRanks[i], *cellLineRanks[i]);
        } else if (tumorRanks[i]) {
            best[i] = tumorRanks[i];
        } else {
            best[i] = cellLineRanks[i];
        }
    }
    return best;
}

AlignmentGeneSet DEGeneSetSelector::selectGenes(
    const DifferentialGeneScore& tumor,
    const DifferentialGeneScore& cellLine) const {

    auto best = bestRanks(tumor, cellLine);

    AlignmentGeneSet selected;
    for (size_t i = 0; i < best.size(); ++i) {
        if (best[i] && *best[i] < topK) {
            selected.insert(tumor.genes[i]);
        }
    }
    return selected;
}

}
