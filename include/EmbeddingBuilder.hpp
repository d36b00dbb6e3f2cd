#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace cellalign {

// Gene-centered principal components plus a 2-D layout for one matrix
class EmbeddingBuilder {
public:
    explicit EmbeddingBuilder(const AlignmentParameters& params);

    DomainEmbedding buildEmbedding(const ExpressionMatrix& matrix) const;

    // Replace missing cells by the gene mean over the remaining samples
    // (0 when a gene is missing everywhere). Returns the number of cells replaced.
    static int imputeMissing(ExpressionMatrix& matrix);

    static ExpressionMatrix centerGenes(const ExpressionMatrix& matrix, Eigen::VectorXd& geneMeans);

private:
    AlignmentParameters params;

    void computePrincipalComponents(DomainEmbedding& embedding) const;
};

// UMAP-style 2-D layout of an embedding
class UmapLayout {
public:
    UmapLayout(int numNeighbors, double minDist, int numEpochs, unsigned int seed);

    Eigen::MatrixXd computeLayout(const Eigen::MatrixXd& embedding) const;

    // Curve parameters (a, b) of 1 / (1 + a d^(2b)) fitted to the minimum distance
    static std::pair<double, double> fitCurve(double minDist, double spread = 1.0);

private:
    int numNeighbors;
    double minDist;
    int numEpochs;
    unsigned int seed;

    struct Edge {
        int head;
        int tail;
        double weight;
    };

    std::vector<Edge> fuzzyGraph(const Eigen::MatrixXd& embedding, int k) const;
    Eigen::MatrixXd initialLayout(const Eigen::MatrixXd& embedding) const;
};

}
