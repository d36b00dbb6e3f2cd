#include "AlignmentOrchestrator.hpp"
#include "ClusteringMethods.hpp"
#include "ContrastiveDirectionRemover.hpp"
#include "DEGeneSetSelector.hpp"
#include "DifferentialStateRanker.hpp"
#include "EmbeddingBuilder.hpp"
#include "GeneUniverseFilter.hpp"
#include "NeighborBatchCorrector.hpp"
#include <future>
#include <unordered_map>
#include <unordered_set>

namespace cellalign {

namespace {

// Annotation rows reordered to the matrix rows; every sample needs exactly one
std::vector<SampleAnnotation> alignAnnotation(const ExpressionMatrix& matrix,
                                              const std::vector<SampleAnnotation>& annotation,
                                              Domain domain) {
    checkConsistent(matrix, "LoadInputs");

    std::unordered_map<std::string, const SampleAnnotation*> byId;
    for (const auto& row : annotation) {
        if (!byId.emplace(row.sampleId, &row).second) {
            throw DataShapeError("duplicate annotation for sample " + row.sampleId);
        }
        if (row.domain != domain) {
            throw DataShapeError("sample " + row.sampleId + " is annotated as " + domainName(row.domain) +
                                 " but supplied as " + domainName(domain));
        }
    }

    std::vector<SampleAnnotation> aligned;
    aligned.reserve(matrix.sampleIds.size());
    std::unordered_set<std::string> seen;
    for (const auto& id : matrix.sampleIds) {
        if (!seen.insert(id).second) {
            throw DataShapeError("duplicate sample " + id + " in the " + domainName(domain) + " matrix");
        }
        auto it = byId.find(id);
        if (it == byId.end()) {
            throw DataShapeError("sample " + id + " of the " + domainName(domain) + " matrix has no annotation");
        }
        aligned.push_back(*it->second);
    }
    if (annotation.size() != aligned.size()) {
        throw DataShapeError(std::to_string(annotation.size() - aligned.size()) + " annotated " +
                             domainName(domain) + " samples are missing from the matrix");
    }
    return aligned;
}

std::vector<GeneSummary> summarizeGenes(const std::vector<GeneStatistics>& stats,
                                        const DifferentialGeneScore& tumor,
                                        const DifferentialGeneScore& cellLine,
                                        const std::vector<std::optional<int>>& bestRanks,
                                        const AlignmentGeneSet& selected) {
    std::vector<GeneSummary> summary;
    summary.reserve(stats.size());
    for (size_t i = 0; i < stats.size(); ++i) {
        GeneSummary row;
        row.stats = stats[i];
        row.tumorScore = tumor.scores[i];
        row.cellLineScore = cellLine.scores[i];
        row.tumorRank = tumor.ranks[i];
        row.cellLineRank = cellLine.ranks[i];
        row.bestRank = bestRanks[i];
        row.inAlignmentSet = selected.count(stats[i].geneId) > 0;
        summary.push_back(row);
    }
    return summary;
}

}

std::string stageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::LOAD_INPUTS: return "LoadInputs";
        case PipelineStage::FILTER_GENES: return "FilterGenes";
        case PipelineStage::BUILD_EMBEDDING_A: return "BuildEmbeddingA";
        case PipelineStage::BUILD_EMBEDDING_B: return "BuildEmbeddingB";
        case PipelineStage::CLUSTER_A: return "ClusterA";
        case PipelineStage::CLUSTER_B: return "ClusterB";
        case PipelineStage::RANK_GENES_A: return "RankGenesA";
        case PipelineStage::RANK_GENES_B: return "RankGenesB";
        case PipelineStage::SELECT_ALIGNMENT_GENES: return "SelectAlignmentGenes";
        case PipelineStage::REMOVE_CONTRASTIVE_DIRECTIONS: return "RemoveContrastiveDirections";
        case PipelineStage::CORRECT_NEIGHBORS: return "CorrectNeighbors";
        case PipelineStage::COMBINE_MATRICES: return "CombineMatrices";
        case PipelineStage::BUILD_FINAL_EMBEDDING: return "BuildFinalEmbedding";
        case PipelineStage::CLUSTER_FINAL: return "ClusterFinal";
        case PipelineStage::SUCCEEDED: return "Succeeded";
        case PipelineStage::FAILED: return "Failed";
    }
    return "Unknown";
}

AlignmentOrchestrator::AlignmentOrchestrator(AlignmentParameters params)
    : params(std::move(params)) {}

PipelineStage AlignmentOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return current;
}

std::optional<PipelineStage> AlignmentOrchestrator::failedStage() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return failed;
}

std::vector<PipelineStage> AlignmentOrchestrator::completedStages() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return completed;
}

void AlignmentOrchestrator::enterStage(PipelineStage stage) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (current != PipelineStage::FAILED) {
            current = stage;
        }
    }
    if (progress) {
        progress(stage);
    }
}

void AlignmentOrchestrator::completeStage(PipelineStage stage) {
    std::lock_guard<std::mutex> lock(stateMutex);
    completed.push_back(stage);
}

void AlignmentOrchestrator::failStage(PipelineStage stage) {
    std::lock_guard<std::mutex> lock(stateMutex);
    current = PipelineStage::FAILED;
    if (!failed) {
        failed = stage;
    }
}

AlignmentOrchestrator::DomainBranch AlignmentOrchestrator::runDomainBranch(const ExpressionMatrix& matrix,
                                                                           bool isTumor) {
    DomainBranch branch;
    branch.raw = matrix;

    branch.embedding = runStage(isTumor ? PipelineStage::BUILD_EMBEDDING_A : PipelineStage::BUILD_EMBEDDING_B, [&] {
        return EmbeddingBuilder(params).buildEmbedding(matrix);
    });

    branch.clusters = runStage(isTumor ? PipelineStage::CLUSTER_A : PipelineStage::CLUSTER_B, [&] {
        auto method = clustering::ClusteringMethodFactory::createMethod(params.clusteringMethod, params);
        return method->performClustering(branch.embedding.pcs, branch.embedding.centered.sampleIds);
    });

    branch.scores = runStage(isTumor ? PipelineStage::RANK_GENES_A : PipelineStage::RANK_GENES_B, [&] {
        return DifferentialStateRanker().rankGenes(branch.embedding.centered, branch.clusters);
    });
    return branch;
}

AlignmentResult AlignmentOrchestrator::run(const AlignmentInputs& inputs) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        current = PipelineStage::LOAD_INPUTS;
        failed.reset();
        completed.clear();
    }

    AlignmentResult result;

    struct Loaded {
        std::vector<SampleAnnotation> tumorAnnotation;
        std::vector<SampleAnnotation> cellLineAnnotation;
    };
    Loaded loaded = runStage(PipelineStage::LOAD_INPUTS, [&] {
        validateParameters(params);
        Loaded l;
        l.tumorAnnotation = alignAnnotation(inputs.tumor, inputs.tumorAnnotation, Domain::TUMOR);
        l.cellLineAnnotation = alignAnnotation(inputs.cellLine, inputs.cellLineAnnotation, Domain::CELL_LINE);
        std::unordered_set<std::string> tumorIds(inputs.tumor.sampleIds.begin(), inputs.tumor.sampleIds.end());
        for (const auto& id : inputs.cellLine.sampleIds) {
            if (tumorIds.count(id)) {
                throw DataShapeError("sample " + id + " appears in both domains");
            }
        }
        return l;
    });
    result.annotation = combineAnnotations(loaded.tumorAnnotation, loaded.cellLineAnnotation);

    struct Filtered {
        ExpressionMatrix tumor;
        ExpressionMatrix cellLine;
        std::vector<GeneStatistics> stats;
    };
    Filtered filtered = runStage(PipelineStage::FILTER_GENES, [&] {
        GeneUniverseFilter filter(params.excludedLocusGroups);
        auto genes = filter.filterGenes(inputs.tumor.genes, inputs.cellLine.genes, inputs.geneReference);
        Filtered f;
        f.tumor = GeneUniverseFilter::restrictToGenes(inputs.tumor, genes);
        f.cellLine = GeneUniverseFilter::restrictToGenes(inputs.cellLine, genes);
        f.stats = computeGeneStatistics(f.tumor, f.cellLine, inputs.geneReference);

        int tumorImputed = EmbeddingBuilder::imputeMissing(f.tumor);
        int cellLineImputed = EmbeddingBuilder::imputeMissing(f.cellLine);
        if (tumorImputed + cellLineImputed > 0) {
            result.warnings.push_back("imputed " + std::to_string(tumorImputed) + " tumor and " +
                                      std::to_string(cellLineImputed) + " cell line missing values with gene means");
        }
        return f;
    });

    DomainBranch tumor, cellLine;
    if (params.parallelDomains) {
        auto tumorFuture = std::async(std::launch::async, [&] { return runDomainBranch(filtered.tumor, true); });
        auto cellLineFuture = std::async(std::launch::async, [&] { return runDomainBranch(filtered.cellLine, false); });
        // Both branches finish before either failure propagates
        tumorFuture.wait();
        cellLineFuture.wait();
        tumor = tumorFuture.get();
        cellLine = cellLineFuture.get();
    } else {
        tumor = runDomainBranch(filtered.tumor, true);
        cellLine = runDomainBranch(filtered.cellLine, false);
    }
    for (const auto& w : tumor.embedding.warnings) result.warnings.push_back("tumor embedding: " + w);
    for (const auto& w : cellLine.embedding.warnings) result.warnings.push_back("cell line embedding: " + w);
    if (tumor.scores.source == DifferentialGeneScore::Source::NO_SIGNAL) {
        result.warnings.push_back("tumor domain has a single cluster; its differential scores are missing");
    }
    if (cellLine.scores.source == DifferentialGeneScore::Source::NO_SIGNAL) {
        result.warnings.push_back("cell line domain has a single cluster; its differential scores are missing");
    }

    result.alignmentGenes = runStage(PipelineStage::SELECT_ALIGNMENT_GENES, [&] {
        DEGeneSetSelector selector(params.topDEGenes);
        AlignmentGeneSet selected = selector.selectGenes(tumor.scores, cellLine.scores);
        result.geneSummary = summarizeGenes(filtered.stats, tumor.scores, cellLine.scores,
                                            DEGeneSetSelector::bestRanks(tumor.scores, cellLine.scores), selected);
        return selected;
    });

    auto contrastive = runStage(PipelineStage::REMOVE_CONTRASTIVE_DIRECTIONS, [&] {
        ContrastiveDirectionRemover remover(params.fastContrastiveDims, params.removeContrastiveDims,
                                            params.randomSeed);
        return remover.removeContrastiveDirections(tumor.raw, tumor.embedding.centered, tumor.clusters,
                                                   cellLine.raw, cellLine.embedding.centered, cellLine.clusters);
    });
    result.contrastiveBasis = contrastive.basis;

    NeighborCorrection corrected = runStage(PipelineStage::CORRECT_NEIGHBORS, [&] {
        NeighborBatchCorrector corrector(params.mnnTargetNeighbors, params.mnnReferenceNeighbors,
                                         params.mnnDistanceScale);
        return corrector.correct(contrastive.cellLine, contrastive.tumor, result.alignmentGenes);
    });
    result.mnnPairs = static_cast<int>(corrected.pairs.size());
    result.unpairedTargetSamples = corrected.unpairedTargetSamples;
    result.isolatedTargetSamples = corrected.isolatedTargetSamples;
    if (corrected.isolatedTargetSamples > 0) {
        result.warnings.push_back(std::to_string(corrected.isolatedTargetSamples) +
                                  " tumor samples had no mutual-neighbour correction");
    }

    result.combined = runStage(PipelineStage::COMBINE_MATRICES, [&] {
        checkSameGenes(corrected.target, corrected.reference, stageName(PipelineStage::COMBINE_MATRICES));
        ExpressionMatrix combined;
        combined.genes = corrected.target.genes;
        combined.sampleIds = corrected.target.sampleIds;
        combined.sampleIds.insert(combined.sampleIds.end(), corrected.reference.sampleIds.begin(),
                                  corrected.reference.sampleIds.end());
        combined.values.resize(corrected.target.numSamples() + corrected.reference.numSamples(),
                               corrected.target.numGenes());
        combined.values << corrected.target.values, corrected.reference.values;
        return combined;
    });

    DomainEmbedding finalEmbedding = runStage(PipelineStage::BUILD_FINAL_EMBEDDING, [&] {
        return EmbeddingBuilder(params).buildEmbedding(result.combined);
    });
    for (const auto& w : finalEmbedding.warnings) result.warnings.push_back("combined embedding: " + w);

    result.embedding.clusters = runStage(PipelineStage::CLUSTER_FINAL, [&] {
        auto method = clustering::ClusteringMethodFactory::createMethod(params.clusteringMethod, params);
        return method->performClustering(finalEmbedding.pcs, result.combined.sampleIds);
    });
    result.embedding.pcs = finalEmbedding.pcs;
    result.embedding.layout = finalEmbedding.layout;

    {
        std::lock_guard<std::mutex> lock(stateMutex);
        current = PipelineStage::SUCCEEDED;
    }
    return result;
}

std::vector<SampleAnnotation> combineAnnotations(const std::vector<SampleAnnotation>& tumor,
                                                 const std::vector<SampleAnnotation>& cellLine) {
    std::vector<SampleAnnotation> combined = tumor;
    combined.insert(combined.end(), cellLine.begin(), cellLine.end());
    return combined;
}

Eigen::MatrixXd tumorCellLineDistances(const AlignmentResult& result) {
    const Eigen::MatrixXd& pcs = result.embedding.pcs;
    if (static_cast<size_t>(pcs.rows()) != result.annotation.size()) {
        throw DataShapeError("embedding rows do not match the combined annotation");
    }

    std::vector<Eigen::Index> tumors, cellLines;
    for (size_t i = 0; i < result.annotation.size(); ++i) {
        (result.annotation[i].domain == Domain::TUMOR ? tumors : cellLines).push_back(static_cast<Eigen::Index>(i));
    }

    Eigen::MatrixXd dist(tumors.size(), cellLines.size());
    for (size_t t = 0; t < tumors.size(); ++t) {
        for (size_t c = 0; c < cellLines.size(); ++c) {
            dist(t, c) = (pcs.row(tumors[t]) - pcs.row(cellLines[c])).norm();
        }
    }
    return dist;
}

}
