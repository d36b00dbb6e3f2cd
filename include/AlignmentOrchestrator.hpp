#pragma once

#include "AlignmentErrors.hpp"
#include "DataStructures.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cellalign {

enum class PipelineStage {
    LOAD_INPUTS,
    FILTER_GENES,
    BUILD_EMBEDDING_A,
    BUILD_EMBEDDING_B,
    CLUSTER_A,
    CLUSTER_B,
    RANK_GENES_A,
    RANK_GENES_B,
    SELECT_ALIGNMENT_GENES,
    REMOVE_CONTRASTIVE_DIRECTIONS,
    CORRECT_NEIGHBORS,
    COMBINE_MATRICES,
    BUILD_FINAL_EMBEDDING,
    CLUSTER_FINAL,
    SUCCEEDED,
    FAILED
};

std::string stageName(PipelineStage stage);

// Failure of one pipeline stage; keeps the kind of the originating error
class StageError : public AlignmentError {
public:
    StageError(PipelineStage stage, ErrorKind kind, const std::string& message)
        : AlignmentError(kind, message, stageName(stage)), failed(stage) {}

    PipelineStage pipelineStage() const { return failed; }

private:
    PipelineStage failed;
};

struct AlignmentInputs {
    ExpressionMatrix tumor;
    ExpressionMatrix cellLine;
    std::vector<SampleAnnotation> tumorAnnotation;
    std::vector<SampleAnnotation> cellLineAnnotation;
    std::vector<GeneReference> geneReference;
};

// Runs the alignment once, start to finish:
//   LoadInputs -> FilterGenes -> per domain {BuildEmbedding -> Cluster -> RankGenes}
//   -> SelectAlignmentGenes -> RemoveContrastiveDirections -> CorrectNeighbors
//   -> CombineMatrices -> BuildFinalEmbedding -> ClusterFinal
// Domain A is the tumor domain, domain B the cell lines. The two domain
// branches may run concurrently. A failing stage ends the run with a StageError.
class AlignmentOrchestrator {
public:
    // Called as each stage starts, possibly from a worker thread
    using ProgressCallback = std::function<void(PipelineStage)>;

    explicit AlignmentOrchestrator(AlignmentParameters params = AlignmentParameters());

    void setProgressCallback(ProgressCallback callback) { progress = std::move(callback); }

    AlignmentResult run(const AlignmentInputs& inputs);

    PipelineStage state() const;
    std::optional<PipelineStage> failedStage() const;
    std::vector<PipelineStage> completedStages() const;

    const AlignmentParameters& parameters() const { return params; }

private:
    struct DomainBranch {
        ExpressionMatrix raw;
        DomainEmbedding embedding;
        ClusterAssignment clusters;
        DifferentialGeneScore scores;
    };

    AlignmentParameters params;
    ProgressCallback progress;

    mutable std::mutex stateMutex;
    PipelineStage current = PipelineStage::LOAD_INPUTS;
    std::optional<PipelineStage> failed;
    std::vector<PipelineStage> completed;

    DomainBranch runDomainBranch(const ExpressionMatrix& matrix, bool isTumor);

    void enterStage(PipelineStage stage);
    void completeStage(PipelineStage stage);
    void failStage(PipelineStage stage);

    template <typename Fn>
    auto runStage(PipelineStage stage, Fn&& fn) -> decltype(fn());
};

// Rows of the result's annotation in combined-matrix order
std::vector<SampleAnnotation> combineAnnotations(const std::vector<SampleAnnotation>& tumor,
                                                 const std::vector<SampleAnnotation>& cellLine);

// Euclidean distances between every tumor (rows) and every cell line (columns)
// in the final principal-component space
Eigen::MatrixXd tumorCellLineDistances(const AlignmentResult& result);

template <typename Fn>
auto AlignmentOrchestrator::runStage(PipelineStage stage, Fn&& fn) -> decltype(fn()) {
    enterStage(stage);
    try {
        auto value = fn();
        completeStage(stage);
        return value;
    } catch (const StageError&) {
        failStage(stage);
        throw;
    } catch (const AlignmentError& e) {
        failStage(stage);
        throw StageError(stage, e.kind(), e.message());
    } catch (const std::exception& e) {
        failStage(stage);
        throw StageError(stage, ErrorKind::NUMERICAL, e.what());
    }
}

}
