/**
 * Unit tests for the clustering methods.
 */

#include "ClusteringMethods.hpp"
#include "AlignmentErrors.hpp"
#include "TestUtils.hpp"
#include <limits>
#include <map>

using namespace cellalign;
using namespace cellalign::clustering;
using namespace cellalign::test;

namespace {

// Three tight blobs far apart in 5 dimensions; truth[i] is the blob of row i
Eigen::MatrixXd blobs(int perBlob, std::vector<int>& truth, std::vector<std::string>& ids) {
    std::mt19937 gen(17);
    std::normal_distribution<double> noise(0.0, 0.3);
    Eigen::MatrixXd x(3 * perBlob, 5);
    truth.clear();
    ids.clear();
    for (int i = 0; i < 3 * perBlob; ++i) {
        int blob = i % 3;
        truth.push_back(blob);
        ids.push_back("S" + std::to_string(i));
        for (int d = 0; d < 5; ++d) {
            x(i, d) = noise(gen) + (d == blob ? 10.0 : 0.0);
        }
    }
    return x;
}

// Every cluster holds samples of one blob only
bool pure(const ClusterAssignment& a, const std::vector<int>& truth) {
    std::map<int, int> blobOf;
    for (size_t i = 0; i < truth.size(); ++i) {
        auto it = blobOf.emplace(a.labels[i], truth[i]).first;
        if (it->second != truth[i]) return false;
    }
    return true;
}

bool test_make_assignment_orders_by_size() {
    auto a = makeAssignment({"a", "b", "c", "d", "e", "f"}, {5, 5, 2, 7, 2, 5});
    CHECK(a.numClusters == 3);
    CHECK((a.labels == std::vector<int>{0, 0, 1, 2, 1, 0}));
    auto members = a.members();
    CHECK(members.size() == 3);
    CHECK((members[1] == std::vector<int>{2, 4}));

    // Equal sizes keep first-appearance order
    auto tie = makeAssignment({"a", "b", "c", "d"}, {3, 1, 3, 1});
    CHECK((tie.labels == std::vector<int>{0, 1, 0, 1}));
    return true;
}

bool test_shared_neighbor_graph() {
    std::vector<int> truth;
    std::vector<std::string> ids;
    Eigen::MatrixXd x = blobs(15, truth, ids);
    SharedNeighborLouvain louvain(8);
    auto graph = louvain.buildSharedNeighborGraph(x);
    CHECK(graph.size() == 45);

    std::map<std::pair<int, int>, double> weights;
    for (int i = 0; i < 45; ++i) {
        for (const auto& [j, w] : graph[i]) {
            CHECK(j != i);
            CHECK(w >= 1.0 / 15.0 && w <= 1.0);
            // Neighbour sets never cross blobs of 15 with k = 8
            CHECK(truth[i] == truth[j]);
            weights[{i, j}] = w;
        }
    }
    for (const auto& [edge, w] : weights) {
        auto reverse = weights.find({edge.second, edge.first});
        CHECK(reverse != weights.end());
        CHECK(near(reverse->second, w));
    }
    return true;
}

bool test_louvain_separates_groups() {
    std::vector<int> truth;
    std::vector<std::string> ids;
    Eigen::MatrixXd x = blobs(20, truth, ids);
    SharedNeighborLouvain louvain(10, 1.0);
    ClusterAssignment a = louvain.performClustering(x, ids);
    CHECK(a.sampleIds == ids);
    CHECK(a.labels.size() == ids.size());
    CHECK(a.numClusters >= 3 && a.numClusters <= 9);
    CHECK(pure(a, truth));

    // Same seed, same partition
    ClusterAssignment again = SharedNeighborLouvain(10, 1.0).performClustering(x, ids);
    CHECK(again.labels == a.labels);
    return true;
}

bool test_singletons_join_best_connected_cluster() {
    SharedNeighborLouvain::Graph graph(9);
    auto link = [&](int a, int b, double w) {
        graph[a].emplace_back(b, w);
        graph[b].emplace_back(a, w);
    };
    link(0, 1, 1.0); link(1, 2, 1.0); link(0, 2, 1.0);
    link(3, 4, 1.0); link(4, 5, 1.0); link(3, 5, 1.0);
    // Sample 6: 0.3 to cluster 0, 0.4 in total to cluster 1
    link(6, 0, 0.3); link(6, 3, 0.2); link(6, 4, 0.2);
    // Sample 8: equal weight to both clusters
    link(8, 1, 0.5); link(8, 5, 0.5);
    // Sample 7 has no edges

    std::vector<int> membership = {0, 0, 0, 1, 1, 1, 2, 3, 4};
    CHECK(SharedNeighborLouvain::mergeSingletons(graph, membership) == 2);
    CHECK((membership == std::vector<int>{0, 0, 0, 1, 1, 1, 1, 3, 0}));

    // Nothing to join when every sample is alone
    std::vector<int> alone = {0, 1, 2, 3, 4, 5, 6, 7, 8};
    CHECK(SharedNeighborLouvain::mergeSingletons(graph, alone) == 0);
    CHECK((alone == std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8}));

    std::vector<int> shortLabels = {0, 0};
    CHECK_THROWS(SharedNeighborLouvain::mergeSingletons(graph, shortLabels), DataShapeError);
    return true;
}

bool test_louvain_leaves_no_connected_singletons() {
    std::vector<int> truth;
    std::vector<std::string> ids;
    Eigen::MatrixXd x = blobs(20, truth, ids);
    SharedNeighborLouvain louvain(10, 5.0);
    ClusterAssignment a = louvain.performClustering(x, ids);
    auto graph = louvain.buildSharedNeighborGraph(x);
    auto members = a.members();
    for (size_t i = 0; i < a.labels.size(); ++i) {
        if (members[a.labels[i]].size() != 1) continue;
        for (const auto& edge : graph[i]) {
            CHECK(members[a.labels[edge.first]].size() == 1);
        }
    }
    CHECK(pure(a, truth));
    return true;
}

bool test_kmeans_recovers_blobs() {
    std::vector<int> truth;
    std::vector<std::string> ids;
    Eigen::MatrixXd x = blobs(20, truth, ids);
    KMeansClustering kmeans(3, 100, 1);
    ClusterAssignment a = kmeans.performClustering(x, ids);
    CHECK(a.numClusters == 3);
    CHECK(pure(a, truth));
    return true;
}

bool test_kmeans_more_clusters_than_samples() {
    Eigen::MatrixXd x(3, 2);
    x << 0, 0,
         5, 5,
         10, 10;
    ClusterAssignment a = KMeansClustering(10).performClustering(x, {"a", "b", "c"});
    CHECK(a.numClusters == 3);
    return true;
}

bool test_invalid_input_rejected() {
    Eigen::MatrixXd x = Eigen::MatrixXd::Zero(3, 2);
    KMeansClustering kmeans(2);
    CHECK_THROWS(kmeans.performClustering(x, {"a", "b"}), DataShapeError);
    x(1, 1) = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS(kmeans.performClustering(x, {"a", "b", "c"}), NumericalError);
    return true;
}

bool test_factory() {
    AlignmentParameters params;
    auto louvain = ClusteringMethodFactory::createMethod("louvain", params);
    CHECK(louvain->getName() == "SNN Louvain Clustering");
    auto kmeans = ClusteringMethodFactory::createMethod("kmeans", params);
    CHECK(kmeans->getName() == "K-Means Clustering");
    CHECK(kmeans->getDescription().find("k=10") != std::string::npos);
    CHECK(ClusteringMethodFactory::availableMethods().size() == 2);
    CHECK_THROWS(ClusteringMethodFactory::createMethod("hierarchical", params), ConfigurationError);
    return true;
}

}

int main() {
    return runTests("Clustering Tests", {
        {"assignment ordering", test_make_assignment_orders_by_size},
        {"shared neighbour graph", test_shared_neighbor_graph},
        {"louvain separates groups", test_louvain_separates_groups},
        {"singletons join best connected cluster", test_singletons_join_best_connected_cluster},
        {"no connected singletons after louvain", test_louvain_leaves_no_connected_singletons},
        {"k-means recovers blobs", test_kmeans_recovers_blobs},
        {"k-means with few samples", test_kmeans_more_clusters_than_samples},
        {"invalid input", test_invalid_input_rejected},
        {"factory", test_factory},
    });
}
