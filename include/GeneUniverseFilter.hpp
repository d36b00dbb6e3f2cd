#pragma once

#include "DataStructures.hpp"
#include <string>
#include <vector>

namespace cellalign {

// Shared gene universe of the two domains: genes measured in both matrices
// whose reference locus group is not excluded, sorted by identifier.
class GeneUniverseFilter {
public:
    explicit GeneUniverseFilter(std::vector<std::string> excludedLocusGroups = {"non-coding RNA", "pseudogene"});

    std::vector<std::string> filterGenes(
        const std::vector<std::string>& genesA,
        const std::vector<std::string>& genesB,
        const std::vector<GeneReference>& reference
    ) const;

    // Column subset of matrix in the order of genes
    static ExpressionMatrix restrictToGenes(
        const ExpressionMatrix& matrix,
        const std::vector<std::string>& genes
    );

    const std::vector<std::string>& excludedGroups() const { return excluded; }

private:
    std::vector<std::string> excluded;
};

// Per-gene mean and standard deviation in each domain, missing values ignored.
// Both matrices must already share the same gene columns.
std::vector<GeneStatistics> computeGeneStatistics(
    const ExpressionMatrix& tumor,
    const ExpressionMatrix& cellLine,
    const std::vector<GeneReference>& reference
);

}
