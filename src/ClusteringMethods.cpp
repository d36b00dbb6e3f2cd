#include "ClusteringMethods.hpp"
#include "AlignmentErrors.hpp"
#include "NearestNeighbors.hpp"
#include <algorithm>
#include <limits>
#include <random>
#include <cmath>
#include <numeric>
#include <sstream>

namespace cellalign {
namespace clustering {

namespace {

const char* const kStage = "Cluster";

void checkInput(const Eigen::MatrixXd& embedding, const std::vector<std::string>& sampleIds) {
    if (static_cast<size_t>(embedding.rows()) != sampleIds.size()) {
        throw DataShapeError("embedding has " + std::to_string(embedding.rows()) + " rows for " +
                             std::to_string(sampleIds.size()) + " samples", kStage);
    }
    if (embedding.rows() == 0) {
        throw DataShapeError("cannot cluster an empty embedding", kStage);
    }
    if (!embedding.allFinite()) {
        throw NumericalError("embedding contains non-finite values", kStage);
    }
}

}

ClusterAssignment makeAssignment(const std::vector<std::string>& sampleIds, const std::vector<int>& rawLabels) {
    std::vector<int> sizes, first;
    for (size_t i = 0; i < rawLabels.size(); ++i) {
        int label = rawLabels[i];
        if (label >= static_cast<int>(sizes.size())) {
            sizes.resize(label + 1, 0);
            first.resize(label + 1, std::numeric_limits<int>::max());
        }
        sizes[label]++;
        first[label] = std::min(first[label], static_cast<int>(i));
    }

    std::vector<int> order;
    for (size_t c = 0; c < sizes.size(); ++c) {
        if (sizes[c] > 0) order.push_back(static_cast<int>(c));
    }
    std::sort(order.begin(), order.end(), [&](int a, int b) {
        return sizes[a] != sizes[b] ? sizes[a] > sizes[b] : first[a] < first[b];
    });

    std::vector<int> relabel(sizes.size(), -1);
    for (size_t r = 0; r < order.size(); ++r) {
        relabel[order[r]] = static_cast<int>(r);
    }

    ClusterAssignment assignment;
    assignment.sampleIds = sampleIds;
    assignment.numClusters = static_cast<int>(order.size());
    assignment.labels.reserve(rawLabels.size());
    for (int label : rawLabels) {
        assignment.labels.push_back(relabel[label]);
    }
    return assignment;
}

// SNN Louvain Clustering Implementation
SharedNeighborLouvain::SharedNeighborLouvain(int numNeighbors, double resolution,
                                             double pruneThreshold, unsigned int seed)
    : numNeighbors(numNeighbors), resolution(resolution), pruneThreshold(pruneThreshold), seed(seed) {}

SharedNeighborLouvain::Graph SharedNeighborLouvain::buildSharedNeighborGraph(
    const Eigen::MatrixXd& embedding) const {

    const int n = static_cast<int>(embedding.rows());
    // Every sample counts itself among its neighbours
    NeighborList knn = findNearestNeighbors(embedding, embedding, numNeighbors - 1, true);
    const int k = static_cast<int>(knn.indices.cols()) + 1;

    std::vector<std::vector<int>> neighbors(n), owners(n);
    for (int i = 0; i < n; ++i) {
        neighbors[i].push_back(i);
        for (int c = 0; c < knn.indices.cols(); ++c) {
            neighbors[i].push_back(knn.indices(i, c));
        }
        for (int j : neighbors[i]) {
            owners[j].push_back(i);
        }
    }

    Graph graph(n);
    std::vector<int> shared(n, 0);
    std::vector<int> touched;
    for (int i = 0; i < n; ++i) {
        touched.clear();
        for (int nb : neighbors[i]) {
            for (int j : owners[nb]) {
                if (j == i) continue;
                if (shared[j]++ == 0) touched.push_back(j);
            }
        }
        for (int j : touched) {
            double jaccard = static_cast<double>(shared[j]) / (2.0 * k - shared[j]);
            if (jaccard >= pruneThreshold && jaccard > 0) {
                graph[i].emplace_back(j, jaccard);
            }
            shared[j] = 0;
        }
    }
    return graph;
}

bool SharedNeighborLouvain::moveNodes(const Graph& graph, std::vector<int>& community) const {
    const int n = static_cast<int>(graph.size());

    std::vector<double> degree(n, 0.0);
    double totalWeight = 0.0;
    for (int i = 0; i < n; ++i) {
        for (const auto& edge : graph[i]) {
            degree[i] += edge.second;
        }
        totalWeight += degree[i];
    }
    if (totalWeight <= 0) {
        return false;
    }

    std::vector<double> communityDegree(n, 0.0);
    for (int i = 0; i < n; ++i) {
        communityDegree[community[i]] += degree[i];
    }

    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 gen(seed);
    std::shuffle(order.begin(), order.end(), gen);

    std::vector<double> linkWeight(n, 0.0);
    std::vector<int> linked;
    bool anyMove = false;

    for (int pass = 0; pass < 100; ++pass) {
        bool moved = false;
        for (int i : order) {
            const int current = community[i];
            linked.clear();
            for (const auto& [j, w] : graph[i]) {
                if (j == i) continue;
                int c = community[j];
                if (linkWeight[c] == 0.0) linked.push_back(c);
                linkWeight[c] += w;
            }

            communityDegree[current] -= degree[i];
            double best = linkWeight[current] - resolution * communityDegree[current] * degree[i] / totalWeight;
            int bestCommunity = current;
            for (int c : linked) {
                double gain = linkWeight[c] - resolution * communityDegree[c] * degree[i] / totalWeight;
                if (gain > best + 1e-12) {
                    best = gain;
                    bestCommunity = c;
                }
            }
            communityDegree[bestCommunity] += degree[i];
            if (bestCommunity != current) {
                community[i] = bestCommunity;
                moved = true;
            }

            linkWeight[current] = 0.0;
            for (int c : linked) linkWeight[c] = 0.0;
        }
        if (!moved) break;
        anyMove = true;
    }
    return anyMove;
}

SharedNeighborLouvain::Graph SharedNeighborLouvain::aggregate(
    const Graph& graph, const std::vector<int>& community, int numCommunities) const {

    Graph coarse(numCommunities);
    std::vector<double> weights(numCommunities, 0.0);
    std::vector<int> touched;
    std::vector<std::vector<int>> members(numCommunities);
    for (size_t i = 0; i < graph.size(); ++i) {
        members[community[i]].push_back(static_cast<int>(i));
    }

    for (int c = 0; c < numCommunities; ++c) {
        touched.clear();
        for (int i : members[c]) {
            for (const auto& [j, w] : graph[i]) {
                int d = community[j];
                if (weights[d] == 0.0) touched.push_back(d);
                weights[d] += w;
            }
        }
        std::sort(touched.begin(), touched.end());
        for (int d : touched) {
            coarse[c].emplace_back(d, weights[d]);
            weights[d] = 0.0;
        }
    }
    return coarse;
}

ClusterAssignment SharedNeighborLouvain::performClustering(
    const Eigen::MatrixXd& embedding,
    const std::vector<std::string>& sampleIds) {

    checkInput(embedding, sampleIds);
    const int n = static_cast<int>(embedding.rows());

    const Graph snn = buildSharedNeighborGraph(embedding);
    Graph graph = snn;

    // membership[i] = community of original sample i at the current level
    std::vector<int> membership(n);
    std::iota(membership.begin(), membership.end(), 0);

    for (int level = 0; level < 100; ++level) {
        std::vector<int> community(graph.size());
        std::iota(community.begin(), community.end(), 0);
        if (!moveNodes(graph, community)) {
            break;
        }

        // Compact community ids
        std::vector<int> compact(graph.size(), -1);
        int numCommunities = 0;
        for (auto& c : community) {
            if (compact[c] < 0) compact[c] = numCommunities++;
            c = compact[c];
        }
        for (auto& m : membership) {
            m = community[m];
        }
        if (numCommunities == static_cast<int>(graph.size())) {
            break;
        }
        graph = aggregate(graph, community, numCommunities);
    }

    mergeSingletons(snn, membership);
    return makeAssignment(sampleIds, membership);
}

int SharedNeighborLouvain::mergeSingletons(const Graph& graph, std::vector<int>& membership) {
    if (graph.size() != membership.size()) {
        throw DataShapeError("graph has " + std::to_string(graph.size()) + " nodes for " +
                             std::to_string(membership.size()) + " labels", kStage);
    }
    if (membership.empty()) {
        return 0;
    }

    const int numLabels = *std::max_element(membership.begin(), membership.end()) + 1;
    std::vector<int> sizes(numLabels, 0);
    for (int label : membership) {
        sizes[label]++;
    }

    std::vector<double> weight(numLabels, 0.0);
    int merged = 0;
    for (size_t i = 0; i < membership.size(); ++i) {
        const int own = membership[i];
        if (sizes[own] != 1) continue;

        std::fill(weight.begin(), weight.end(), 0.0);
        for (const auto& [j, w] : graph[i]) {
            int c = membership[j];
            if (c != own && sizes[c] > 1) weight[c] += w;
        }
        int best = -1;
        for (int c = 0; c < numLabels; ++c) {
            if (weight[c] > 0.0 && (best < 0 || weight[c] > weight[best])) best = c;
        }
        if (best < 0) continue;

        membership[i] = best;
        sizes[own] = 0;
        sizes[best]++;
        ++merged;
    }
    return merged;
}

std::string SharedNeighborLouvain::getDescription() const {
    std::ostringstream desc;
    desc << "Louvain modularity clustering of a shared nearest neighbour graph with k="
         << numNeighbors << ", resolution=" << resolution << " and prune threshold=" << pruneThreshold;
    return desc.str();
}

// K-means Clustering Implementation
KMeansClustering::KMeansClustering(int k, int maxIterations, unsigned int seed)
    : k(k), maxIterations(maxIterations), seed(seed) {}

ClusterAssignment KMeansClustering::performClustering(
    const Eigen::MatrixXd& embedding,
    const std::vector<std::string>& sampleIds) {

    checkInput(embedding, sampleIds);
    int n = embedding.rows();

    // Initialize centroids
    Eigen::MatrixXd centroids = initializeCentroids(embedding, std::min(k, n));
    std::vector<int> assignments;

    // Iterate until convergence or max iterations
    for (int iter = 0; iter < maxIterations; ++iter) {
        // Assign points to nearest centroid
        std::vector<int> newAssignments = assignClusters(embedding, centroids);

        // Check for convergence
        if (newAssignments == assignments) {
            break;
        }

        assignments = newAssignments;

        // Update centroids
        centroids = updateCentroids(embedding, assignments, centroids);
    }

    return makeAssignment(sampleIds, assignments);
}

Eigen::MatrixXd KMeansClustering::initializeCentroids(
    const Eigen::MatrixXd& data,
    int k) {

    // Use k-means++ initialization
    std::mt19937 gen(seed);
    std::uniform_real_distribution<> dis(0, 1);

    int n = data.rows();
    std::vector<int> centroidIndices;
    centroidIndices.push_back(std::min(n - 1, static_cast<int>(std::floor(dis(gen) * n))));

    std::vector<double> distances(n, std::numeric_limits<double>::infinity());

    // Choose remaining centroids
    for (int i = 1; i < k; ++i) {
        // Update distances
        for (int j = 0; j < n; ++j) {
            double minDist = std::numeric_limits<double>::infinity();
            for (int c : centroidIndices) {
                double dist = (data.row(j) - data.row(c)).squaredNorm();
                minDist = std::min(minDist, dist);
            }
            distances[j] = minDist;
        }

        // Choose next centroid
        double sum = std::accumulate(distances.begin(), distances.end(), 0.0);
        if (sum <= 0) {
            break;
        }
        double r = dis(gen) * sum;
        double cumSum = 0.0;
        int nextCentroid = n - 1;

        for (int j = 0; j < n; ++j) {
            cumSum += distances[j];
            if (cumSum >= r && distances[j] > 0) {
                nextCentroid = j;
                break;
            }
        }

        centroidIndices.push_back(nextCentroid);
    }

    // Create centroid matrix
    Eigen::MatrixXd centroids(centroidIndices.size(), data.cols());
    for (size_t i = 0; i < centroidIndices.size(); ++i) {
        centroids.row(i) = data.row(centroidIndices[i]);
    }

    return centroids;
}

std::vector<int> KMeansClustering::assignClusters(
    const Eigen::MatrixXd& data,
    const Eigen::MatrixXd& centroids) {

    int n = data.rows();
    std::vector<int> assignments(n);

    for (int i = 0; i < n; ++i) {
        double minDist = std::numeric_limits<double>::infinity();
        int bestCluster = 0;

        for (int j = 0; j < centroids.rows(); ++j) {
            double dist = (data.row(i) - centroids.row(j)).squaredNorm();
            if (dist < minDist) {
                minDist = dist;
                bestCluster = j;
            }
        }

        assignments[i] = bestCluster;
    }

    return assignments;
}

Eigen::MatrixXd KMeansClustering::updateCentroids(
    const Eigen::MatrixXd& data,
    const std::vector<int>& assignments,
    const Eigen::MatrixXd& previous) {

    const int k = previous.rows();
    Eigen::MatrixXd newCentroids = Eigen::MatrixXd::Zero(k, data.cols());
    std::vector<int> counts(k, 0);

    // Sum points in each cluster
    for (size_t i = 0; i < assignments.size(); ++i) {
        int cluster = assignments[i];
        newCentroids.row(cluster) += data.row(i);
        counts[cluster]++;
    }

    // Calculate means; an emptied cluster keeps its previous centroid
    for (int i = 0; i < k; ++i) {
        if (counts[i] > 0) {
            newCentroids.row(i) /= counts[i];
        } else {
            newCentroids.row(i) = previous.row(i);
        }
    }

    return newCentroids;
}

std::string KMeansClustering::getDescription() const {
    return "K-means clustering with k=" + std::to_string(k) +
           " and max_iterations=" + std::to_string(maxIterations);
}

// Factory Implementation
std::unique_ptr<ClusteringMethod> ClusteringMethodFactory::createMethod(
    const std::string& methodName,
    const AlignmentParameters& params) {

    if (methodName == "louvain") {
        return std::make_unique<SharedNeighborLouvain>(
            params.clusterNeighbors, params.clusterResolution, params.snnPruneThreshold, params.randomSeed);
    } else if (methodName == "kmeans") {
        return std::make_unique<KMeansClustering>(params.kmeansClusters, 100, params.randomSeed);
    } else {
        throw ConfigurationError("Unknown clustering method: " + methodName);
    }
}

std::vector<std::string> ClusteringMethodFactory::availableMethods() {
    return {"louvain", "kmeans"};
}

} // namespace clustering
} // namespace cellalign
