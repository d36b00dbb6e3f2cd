/**
 * End-to-end tests of the alignment pipeline on synthetic two-domain data.
 */

#include "AlignmentOrchestrator.hpp"
#include "AlignmentErrors.hpp"
#include "TestUtils.hpp"
#include <limits>
#include <mutex>

using namespace cellalign;
using namespace cellalign::test;

namespace {

AlignmentInputs inputsFrom(const SyntheticData& data) {
    AlignmentInputs inputs;
    inputs.tumor = data.tumor;
    inputs.cellLine = data.cellLine;
    inputs.tumorAnnotation = data.tumorAnnotation;
    inputs.cellLineAnnotation = data.cellLineAnnotation;
    inputs.geneReference = data.reference;
    return inputs;
}

const std::vector<PipelineStage> kAllStages = {
    PipelineStage::LOAD_INPUTS,
    PipelineStage::FILTER_GENES,
    PipelineStage::BUILD_EMBEDDING_A,
    PipelineStage::BUILD_EMBEDDING_B,
    PipelineStage::CLUSTER_A,
    PipelineStage::CLUSTER_B,
    PipelineStage::RANK_GENES_A,
    PipelineStage::RANK_GENES_B,
    PipelineStage::SELECT_ALIGNMENT_GENES,
    PipelineStage::REMOVE_CONTRASTIVE_DIRECTIONS,
    PipelineStage::CORRECT_NEIGHBORS,
    PipelineStage::COMBINE_MATRICES,
    PipelineStage::BUILD_FINAL_EMBEDDING,
    PipelineStage::CLUSTER_FINAL,
};

bool contains(const std::vector<PipelineStage>& stages, PipelineStage stage) {
    return std::find(stages.begin(), stages.end(), stage) != stages.end();
}

double domainOffset(const Eigen::MatrixXd& tumor, const Eigen::MatrixXd& cellLine, const std::vector<int>& genes) {
    double total = 0.0;
    for (int j : genes) total += tumor.col(j).mean() - cellLine.col(j).mean();
    return total / genes.size();
}

bool test_end_to_end_alignment() {
    SyntheticData data = makeTwoDomainData();
    AlignmentOrchestrator orchestrator(smallDataParameters());

    std::mutex seenMutex;
    std::vector<PipelineStage> seen;
    orchestrator.setProgressCallback([&](PipelineStage stage) {
        std::lock_guard<std::mutex> lock(seenMutex);
        seen.push_back(stage);
    });

    AlignmentResult result = orchestrator.run(inputsFrom(data));

    CHECK(orchestrator.state() == PipelineStage::SUCCEEDED);
    CHECK(!orchestrator.failedStage());
    auto completed = orchestrator.completedStages();
    CHECK(completed.size() == kAllStages.size());
    for (PipelineStage stage : kAllStages) {
        CHECK(contains(completed, stage));
        CHECK(contains(seen, stage));
    }
    CHECK(completed.front() == PipelineStage::LOAD_INPUTS);
    CHECK(completed.back() == PipelineStage::CLUSTER_FINAL);

    // Tumor rows first, then cell lines, annotation in the same order
    CHECK(result.combined.numSamples() == 100);
    CHECK(result.combined.numGenes() == 200);
    CHECK(result.combined.sampleIds.front() == "TUMOR_0");
    CHECK(result.combined.sampleIds[50] == "CL_0");
    CHECK(result.annotation.size() == 100);
    for (size_t i = 0; i < result.annotation.size(); ++i) {
        CHECK(result.annotation[i].sampleId == result.combined.sampleIds[i]);
    }

    CHECK(!result.alignmentGenes.empty());
    CHECK(result.alignmentGenes.size() < 200);
    CHECK(result.geneSummary.size() == 200);
    size_t flagged = 0;
    for (const auto& row : result.geneSummary) {
        if (row.inAlignmentSet) {
            ++flagged;
            CHECK(row.bestRank && *row.bestRank < 50);
        }
    }
    CHECK(flagged == result.alignmentGenes.size());
    CHECK(result.mnnPairs > 0);

    CHECK(result.embedding.pcs.rows() == 100);
    CHECK(result.embedding.layout.rows() == 100 && result.embedding.layout.cols() == 2);
    CHECK(result.embedding.clusters.labels.size() == 100);
    CHECK(result.contrastiveBasis.fastMode);
    CHECK(result.contrastiveBasis.directions.cols() == 4);

    // Matched groups end up closer in the final embedding, and the tumor batch offset is mostly gone
    Eigen::MatrixXd tumorAfter = result.combined.values.topRows(50);
    Eigen::MatrixXd cellLineAfter = result.combined.values.bottomRows(50);
    double before = meanMatchedGroupDistance(data.tumor.values, data.tumorGroups,
                                             data.cellLine.values, data.cellLineGroups);
    double after = meanMatchedGroupDistance(result.embedding.pcs.topRows(50), data.tumorGroups,
                                            result.embedding.pcs.bottomRows(50), data.cellLineGroups);
    CHECK(after < before);
    CHECK(domainOffset(data.tumor.values, data.cellLine.values, data.batchGenes) > 2.5);
    CHECK(std::abs(domainOffset(tumorAfter, cellLineAfter, data.batchGenes)) < 0.5);

    Eigen::MatrixXd dist = tumorCellLineDistances(result);
    CHECK(dist.rows() == 50 && dist.cols() == 50);
    double matched = 0.0, unmatched = 0.0;
    int nMatched = 0, nUnmatched = 0;
    for (int t = 0; t < 50; ++t) {
        for (int c = 0; c < 50; ++c) {
            if (data.tumorGroups[t] == data.cellLineGroups[c]) {
                matched += dist(t, c);
                ++nMatched;
            } else {
                unmatched += dist(t, c);
                ++nUnmatched;
            }
        }
    }
    CHECK(matched / nMatched < unmatched / nUnmatched);
    return true;
}

bool test_parallel_matches_sequential() {
    SyntheticData data = makeTwoDomainData();
    AlignmentParameters params = smallDataParameters();
    params.parallelDomains = true;
    AlignmentResult parallel = AlignmentOrchestrator(params).run(inputsFrom(data));
    params.parallelDomains = false;
    AlignmentResult sequential = AlignmentOrchestrator(params).run(inputsFrom(data));

    CHECK(parallel.alignmentGenes == sequential.alignmentGenes);
    CHECK(matricesNear(parallel.combined.values, sequential.combined.values, 1e-12));
    CHECK(parallel.embedding.clusters.labels == sequential.embedding.clusters.labels);
    return true;
}

bool test_missing_values_imputed_with_warning() {
    SyntheticData data = makeTwoDomainData();
    data.tumor.values(3, 7) = std::numeric_limits<double>::quiet_NaN();
    AlignmentParameters params = smallDataParameters();
    params.parallelDomains = false;
    AlignmentResult result = AlignmentOrchestrator(params).run(inputsFrom(data));
    CHECK(result.combined.values.allFinite());
    bool warned = false;
    for (const auto& w : result.warnings) warned = warned || w.find("imputed 1 tumor") != std::string::npos;
    CHECK(warned);
    return true;
}

bool test_empty_universe_fails_filter_stage() {
    SyntheticData data = makeTwoDomainData();
    for (auto& entry : data.reference) entry.locusGroup = "pseudogene";
    AlignmentOrchestrator orchestrator(smallDataParameters());
    try {
        orchestrator.run(inputsFrom(data));
        return false;
    } catch (const StageError& e) {
        CHECK(e.pipelineStage() == PipelineStage::FILTER_GENES);
        CHECK(e.kind() == ErrorKind::CONFIGURATION);
        CHECK(e.stage() == "FilterGenes");
    }
    CHECK(orchestrator.state() == PipelineStage::FAILED);
    CHECK(orchestrator.failedStage() == PipelineStage::FILTER_GENES);
    CHECK((orchestrator.completedStages() == std::vector<PipelineStage>{PipelineStage::LOAD_INPUTS}));
    return true;
}

bool test_annotation_problems_fail_load_stage() {
    SyntheticData data = makeTwoDomainData();

    AlignmentInputs missing = inputsFrom(data);
    missing.tumorAnnotation.pop_back();
    AlignmentOrchestrator orchestrator(smallDataParameters());
    try {
        orchestrator.run(missing);
        return false;
    } catch (const StageError& e) {
        CHECK(e.pipelineStage() == PipelineStage::LOAD_INPUTS);
        CHECK(e.kind() == ErrorKind::DATA_SHAPE);
    }
    CHECK(orchestrator.completedStages().empty());

    AlignmentInputs wrongDomain = inputsFrom(data);
    wrongDomain.cellLineAnnotation[0].domain = Domain::TUMOR;
    CHECK_THROWS(orchestrator.run(wrongDomain), StageError);

    AlignmentInputs shared = inputsFrom(data);
    shared.cellLine.sampleIds[0] = shared.tumor.sampleIds[0];
    shared.cellLineAnnotation[0].sampleId = shared.tumor.sampleIds[0];
    CHECK_THROWS(orchestrator.run(shared), StageError);
    return true;
}

bool test_invalid_parameters_fail_load_stage() {
    SyntheticData data = makeTwoDomainData();
    AlignmentParameters params = smallDataParameters();
    params.removeContrastiveDims = {0, 0};
    AlignmentOrchestrator orchestrator(params);
    try {
        orchestrator.run(inputsFrom(data));
        return false;
    } catch (const StageError& e) {
        CHECK(e.pipelineStage() == PipelineStage::LOAD_INPUTS);
        CHECK(e.kind() == ErrorKind::CONFIGURATION);
    }
    return true;
}

bool test_branch_failure_names_domain_stage() {
    SyntheticData data = makeTwoDomainData();
    AlignmentInputs inputs = inputsFrom(data);
    inputs.tumor.values.conservativeResize(2, Eigen::NoChange);
    inputs.tumor.sampleIds.resize(2);
    inputs.tumorAnnotation.resize(2);

    AlignmentOrchestrator orchestrator(smallDataParameters());
    try {
        orchestrator.run(inputs);
        return false;
    } catch (const StageError& e) {
        CHECK(e.pipelineStage() == PipelineStage::BUILD_EMBEDDING_A);
        CHECK(e.kind() == ErrorKind::NUMERICAL);
    }
    CHECK(orchestrator.failedStage() == PipelineStage::BUILD_EMBEDDING_A);
    auto completed = orchestrator.completedStages();
    CHECK(!contains(completed, PipelineStage::BUILD_EMBEDDING_A));
    CHECK(!contains(completed, PipelineStage::SELECT_ALIGNMENT_GENES));
    return true;
}

bool test_no_cluster_structure_leaves_no_alignment_genes() {
    SyntheticData data = makeTwoDomainData();
    AlignmentParameters params = smallDataParameters();
    params.clusteringMethod = "kmeans";
    params.kmeansClusters = 1;
    AlignmentOrchestrator orchestrator(params);
    try {
        orchestrator.run(inputsFrom(data));
        return false;
    } catch (const StageError& e) {
        CHECK(e.pipelineStage() == PipelineStage::CORRECT_NEIGHBORS);
        CHECK(e.kind() == ErrorKind::CONFIGURATION);
    }
    CHECK(contains(orchestrator.completedStages(), PipelineStage::SELECT_ALIGNMENT_GENES));
    return true;
}

}

int main() {
    return runTests("Alignment Pipeline Tests", {
        {"end-to-end alignment", test_end_to_end_alignment},
        {"parallel matches sequential", test_parallel_matches_sequential},
        {"missing values imputed", test_missing_values_imputed_with_warning},
        {"empty universe", test_empty_universe_fails_filter_stage},
        {"annotation problems", test_annotation_problems_fail_load_stage},
        {"invalid parameters", test_invalid_parameters_fail_load_stage},
        {"branch failure", test_branch_failure_names_domain_stage},
        {"no cluster structure", test_no_cluster_structure_leaves_no_alignment_genes},
    });
}
