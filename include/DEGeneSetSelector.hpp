#pragma once

#include "DataStructures.hpp"
#include <optional>
#include <vector>

namespace cellalign {

// Merges the per-domain differential rankings into the alignment gene set:
// every gene whose best dense rank across the two domains is below topK.
class DEGeneSetSelector {
public:
    explicit DEGeneSetSelector(int topK = 1000);

    AlignmentGeneSet selectGenes(const DifferentialGeneScore& tumor,
                                 const DifferentialGeneScore& cellLine) const;

    // Smaller of the two domain ranks per gene; missing only when both are missing
    static std::vector<std::optional<int>> bestRanks(const DifferentialGeneScore& tumor,
                                                     const DifferentialGeneScore& cellLine);

    int threshold() const { return topK; }

private:
    int topK;
};

}
