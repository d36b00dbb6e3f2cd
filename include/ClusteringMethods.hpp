#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <vector>
#include <memory>
#include <string>

namespace cellalign {
namespace clustering {

// Abstract base class for clustering methods
class ClusteringMethod {
public:
    virtual ~ClusteringMethod() = default;

    // Rows of embedding are samples, in the order of sampleIds
    virtual ClusterAssignment performClustering(
        const Eigen::MatrixXd& embedding,
        const std::vector<std::string>& sampleIds
    ) = 0;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;
};

// Shared-nearest-neighbour graph partitioned by Louvain modularity optimisation
class SharedNeighborLouvain : public ClusteringMethod {
public:
    SharedNeighborLouvain(int numNeighbors = 20, double resolution = 1.0,
                          double pruneThreshold = 1.0 / 15.0, unsigned int seed = 0);

    ClusterAssignment performClustering(
        const Eigen::MatrixXd& embedding,
        const std::vector<std::string>& sampleIds
    ) override;

    std::string getName() const override { return "SNN Louvain Clustering"; }
    std::string getDescription() const override;

    using Graph = std::vector<std::vector<std::pair<int, double>>>;

    Graph buildSharedNeighborGraph(const Eigen::MatrixXd& embedding) const;

    // Moves every sample that is alone in its community into the larger
    // community it shares the most edge weight with (lowest label on ties).
    // Samples with no edge into such a community stay alone. Returns the
    // number of samples moved.
    static int mergeSingletons(const Graph& graph, std::vector<int>& membership);

private:
    int numNeighbors;
    double resolution;
    double pruneThreshold;
    unsigned int seed;

    // One level of local moves; returns true if any node changed community
    bool moveNodes(const Graph& graph, std::vector<int>& community) const;

    Graph aggregate(const Graph& graph, const std::vector<int>& community, int numCommunities) const;
};

//K-means clustering implementation
class KMeansClustering : public ClusteringMethod {
public:
    explicit KMeansClustering(int k = 10, int maxIterations = 100, unsigned int seed = 0);

    ClusterAssignment performClustering(
        const Eigen::MatrixXd& embedding,
        const std::vector<std::string>& sampleIds
    ) override;

    std::string getName() const override { return "K-Means Clustering"; }
    std::string getDescription() const override;

private:
    int k;
    int maxIterations;
    unsigned int seed;

    Eigen::MatrixXd initializeCentroids(
        const Eigen::MatrixXd& data,
        int k
    );

    std::vector<int> assignClusters(
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& centroids
    );

    Eigen::MatrixXd updateCentroids(
        const Eigen::MatrixXd& data,
        const std::vector<int>& assignments,
        const Eigen::MatrixXd& previous
    );
};

class ClusteringMethodFactory {
public:
    static std::unique_ptr<ClusteringMethod> createMethod(
        const std::string& methodName,
        const AlignmentParameters& params
    );

    static std::vector<std::string> availableMethods();
};

// Renumbers raw labels 0..C-1 by decreasing cluster size, ties by first member
ClusterAssignment makeAssignment(const std::vector<std::string>& sampleIds, const std::vector<int>& rawLabels);

}
}
