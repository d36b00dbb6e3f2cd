#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <utility>
#include <set>
#include <optional>
#include <limits>

namespace cellalign {

enum class Domain {
    TUMOR,
    CELL_LINE
};

std::string domainName(Domain domain);

// Samples are rows, genes are columns. Missing values are NaN.
struct ExpressionMatrix {
    Eigen::MatrixXd values;
    std::vector<std::string> sampleIds;
    std::vector<std::string> genes;

    Eigen::Index numSamples() const { return values.rows(); }
    Eigen::Index numGenes() const { return values.cols(); }
};

struct SampleAnnotation {
    std::string sampleId;
    Domain domain = Domain::TUMOR;
    std::string tissue;
    std::string subtype;
    std::string collectionContext;  // Primary/Metastasis
};

// Row of the reference gene table (ensembl id, symbol, locus group)
struct GeneReference {
    std::string geneId;
    std::string symbol;
    std::string locusGroup;
};

struct GeneStatistics {
    std::string geneId;
    std::string symbol;
    double tumorMean = std::numeric_limits<double>::quiet_NaN();
    double tumorSd = std::numeric_limits<double>::quiet_NaN();
    double cellLineMean = std::numeric_limits<double>::quiet_NaN();
    double cellLineSd = std::numeric_limits<double>::quiet_NaN();
    double maxSd = std::numeric_limits<double>::quiet_NaN();
};

struct ClusterAssignment {
    std::vector<std::string> sampleIds;
    std::vector<int> labels;
    int numClusters = 0;

    std::vector<std::vector<int>> members() const;
};

// Per-gene differential score within one domain. A missing score means
// the domain carried no cluster structure to test.
struct DifferentialGeneScore {
    enum class Source {
        NO_SIGNAL,
        PAIRWISE_TEST,
        MULTI_GROUP_TEST
    } source = Source::NO_SIGNAL;

    std::vector<std::string> genes;
    std::vector<std::optional<double>> scores;
    std::vector<std::optional<int>> ranks;  // dense, 1 = top score
};

using AlignmentGeneSet = std::set<std::string>;

struct ContrastiveBasis {
    Eigen::MatrixXd directions;   // genes x directions, unit columns
    Eigen::VectorXd eigenvalues;  // signed covariance-difference eigenvalues
    bool fastMode = false;
};

struct DomainEmbedding {
    ExpressionMatrix centered;
    Eigen::VectorXd geneMeans;
    Eigen::MatrixXd pcs;        // samples x d
    Eigen::MatrixXd loadings;   // genes x d
    Eigen::VectorXd sdev;
    Eigen::MatrixXd layout;     // samples x 2
    std::vector<std::string> warnings;
};

struct NeighborCorrection {
    ExpressionMatrix reference;
    ExpressionMatrix target;
    std::vector<std::pair<int, int>> pairs;  // (reference row, target row)
    int unpairedTargetSamples = 0;
    int isolatedTargetSamples = 0;
};

struct GeneSummary {
    GeneStatistics stats;
    std::optional<double> tumorScore;
    std::optional<double> cellLineScore;
    std::optional<int> tumorRank;
    std::optional<int> cellLineRank;
    std::optional<int> bestRank;
    bool inAlignmentSet = false;
};

struct AlignedEmbedding {
    Eigen::MatrixXd pcs;
    Eigen::MatrixXd layout;
    ClusterAssignment clusters;
};

// Parameters for the alignment pipeline
struct AlignmentParameters {
    // Embedding parameters
    int pcDims = 70;
    int umapNeighbors = 10;
    double umapMinDist = 0.5;
    int umapEpochs = 200;

    // Clustering parameters
    std::string clusteringMethod = "louvain";
    int clusterNeighbors = 20;
    double clusterResolution = 5.0;
    double snnPruneThreshold = 1.0 / 15.0;
    int kmeansClusters = 10;

    // Alignment gene selection
    int topDEGenes = 1000;

    // Contrastive direction removal
    std::optional<int> fastContrastiveDims = 10;
    std::vector<int> removeContrastiveDims = {0, 1, 2, 3};

    // Mutual nearest neighbour correction
    int mnnTargetNeighbors = 50;
    int mnnReferenceNeighbors = 5;
    double mnnDistanceScale = 3.0;

    std::vector<std::string> excludedLocusGroups = {"non-coding RNA", "pseudogene"};

    unsigned int randomSeed = 0;
    bool parallelDomains = true;
};

void validateParameters(const AlignmentParameters& params);

// Stage-boundary checks, throwing DataShapeError tagged with the stage name
void checkConsistent(const ExpressionMatrix& matrix, const std::string& stage);
void checkSameGenes(const ExpressionMatrix& a, const ExpressionMatrix& b, const std::string& stage);
void checkSameSamples(const ExpressionMatrix& matrix, const ClusterAssignment& clusters,
                      const std::string& stage);

// Structure for the final pipeline output
struct AlignmentResult {
    ExpressionMatrix combined;
    std::vector<SampleAnnotation> annotation;
    AlignedEmbedding embedding;
    AlignmentGeneSet alignmentGenes;
    std::vector<GeneSummary> geneSummary;
    ContrastiveBasis contrastiveBasis;
    int mnnPairs = 0;
    int unpairedTargetSamples = 0;
    int isolatedTargetSamples = 0;
    std::vector<std::string> warnings;
};

}
