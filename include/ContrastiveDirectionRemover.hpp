#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace cellalign {

// Finds directions of gene space along which within-cluster variance differs
// most between the domains, and regresses the selected ones out of both
// domains' expression.
class ContrastiveDirectionRemover {
public:
    struct Result {
        ContrastiveBasis basis;
        Eigen::MatrixXd removalBasis;  // genes x removed directions
        ExpressionMatrix tumor;
        ExpressionMatrix cellLine;
    };

    // fastDims unset: full eigendecomposition. removeDims are zero-based.
    ContrastiveDirectionRemover(std::optional<int> fastDims, std::vector<int> removeDims, unsigned int seed = 0);

    Result removeContrastiveDirections(
        const ExpressionMatrix& tumorRaw,
        const ExpressionMatrix& tumorCentered,
        const ClusterAssignment& tumorClusters,
        const ExpressionMatrix& cellLineRaw,
        const ExpressionMatrix& cellLineCentered,
        const ClusterAssignment& cellLineClusters
    ) const;

    // Eigenvectors of cov(tumor residuals) - cov(cell line residuals), where
    // residuals are each sample minus its own cluster mean
    ContrastiveBasis computeBasis(
        const ExpressionMatrix& tumorCentered,
        const ClusterAssignment& tumorClusters,
        const ExpressionMatrix& cellLineCentered,
        const ClusterAssignment& cellLineClusters
    ) const;

    Eigen::MatrixXd selectRemovalBasis(const ContrastiveBasis& basis) const;

    // Residual of regressing every sample's expression (no intercept) on the basis columns
    static ExpressionMatrix regressOut(const ExpressionMatrix& raw, const Eigen::MatrixXd& basis);

    static Eigen::MatrixXd withinClusterResiduals(const Eigen::MatrixXd& values, const ClusterAssignment& clusters);

private:
    std::optional<int> fastDims;
    std::vector<int> removeDims;
    unsigned int seed;

    ContrastiveBasis fullDecomposition(const Eigen::MatrixXd& tumorResiduals,
                                       const Eigen::MatrixXd& cellLineResiduals) const;
    ContrastiveBasis truncatedDecomposition(const Eigen::MatrixXd& tumorResiduals,
                                            const Eigen::MatrixXd& cellLineResiduals,
                                            int dims) const;
};

}
