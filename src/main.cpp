#include "AlignmentOrchestrator.hpp"
#include "DataIO.hpp"
#include <iostream>
#include <filesystem>

using namespace cellalign;

int main(int argc, char* argv[]) {
    try {
        if (argc < 5 || argc > 7) {
            std::cerr << "Usage: " << argv[0]
                      << " <tumor_matrix.csv> <cell_line_matrix.csv> <annotation.csv> <gene_reference.csv>"
                         " [config_file] [output_dir]\n";
            return 1;
        }

        std::string configFile = argc >= 6 ? argv[5] : "";
        std::filesystem::path outputDir = argc >= 7 ? argv[6] : "output";

        // Create output directory if it doesn't exist
        std::filesystem::create_directories(outputDir);

        AlignmentParameters params;
        if (!configFile.empty()) {
            std::cout << "Reading parameters from " << configFile << "...\n";
            params = io::loadParameters(configFile, params);
        }

        // Load data
        std::cout << "Loading data...\n";
        AlignmentInputs inputs;
        inputs.tumor = io::loadExpressionMatrix(argv[1]);
        inputs.cellLine = io::loadExpressionMatrix(argv[2]);
        for (const auto& row : io::loadAnnotation(argv[3])) {
            (row.domain == Domain::TUMOR ? inputs.tumorAnnotation : inputs.cellLineAnnotation).push_back(row);
        }
        inputs.geneReference = io::loadGeneReference(argv[4]);
        std::cout << "Tumor samples: " << inputs.tumor.numSamples()
                  << ", cell line samples: " << inputs.cellLine.numSamples() << "\n";

        AlignmentOrchestrator orchestrator(params);
        orchestrator.setProgressCallback([](PipelineStage stage) {
            std::cout << "  stage " << stageName(stage) << "\n" << std::flush;
        });

        std::cout << "Running alignment...\n";
        AlignmentResult result = orchestrator.run(inputs);

        for (const auto& warning : result.warnings) {
            std::cerr << "Warning: " << warning << "\n";
        }

        // Export results
        std::cout << "Exporting results...\n";
        io::exportMatrix(result.combined, (outputDir / "corrected_matrix.csv").string());
        io::exportEmbedding(result, (outputDir / "embedding.csv").string());
        io::exportGeneSummary(result.geneSummary, (outputDir / "gene_summary.csv").string());
        io::exportAlignmentGenes(result.alignmentGenes, (outputDir / "alignment_genes.txt").string());

        // Print summary
        std::cout << "\nAlignment complete!\n";
        std::cout << "Genes in universe: " << result.combined.numGenes() << "\n";
        std::cout << "Alignment genes: " << result.alignmentGenes.size() << "\n";
        std::cout << "Mutual nearest neighbour pairs: " << result.mnnPairs << "\n";
        std::cout << "Number of clusters: " << result.embedding.clusters.numClusters << "\n";
        std::cout << "Results saved in '" << outputDir.string() << "'\n";

        return 0;
    }
    catch (const StageError& e) {
        std::cerr << "Alignment failed at stage " << stageName(e.pipelineStage()) << ": " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
