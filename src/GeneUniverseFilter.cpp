#include "GeneUniverseFilter.hpp"
#include "AlignmentErrors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace cellalign {

namespace {

const char* const kStage = "FilterGenes";

std::unordered_set<std::string> uniqueGenes(const std::vector<std::string>& genes, const char* label) {
    std::unordered_set<std::string> unique;
    for (const auto& gene : genes) {
        if (!unique.insert(gene).second) {
            throw DataShapeError(std::string("duplicate gene identifier in ") + label + ": " + gene, kStage);
        }
    }
    return unique;
}

// Mean and sample standard deviation over the finite entries of a column
std::pair<double, double> columnMoments(const Eigen::MatrixXd& values, Eigen::Index col) {
    double sum = 0.0;
    int count = 0;
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        double v = values(i, col);
        if (std::isfinite(v)) {
            sum += v;
            ++count;
        }
    }
    const double nan = std::numeric_limits<double>::quiet_NaN();
    if (count == 0) {
        return {nan, nan};
    }
    double mean = sum / count;
    if (count < 2) {
        return {mean, nan};
    }
    double ss = 0.0;
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        double v = values(i, col);
        if (std::isfinite(v)) {
            ss += (v - mean) * (v - mean);
        }
    }
    return {mean, std::sqrt(ss / (count - 1))};
}

}

GeneUniverseFilter::GeneUniverseFilter(std::vector<std::string> excludedLocusGroups)
    : excluded(std::move(excludedLocusGroups)) {}

std::vector<std::string> GeneUniverseFilter::filterGenes(
    const std::vector<std::string>& genesA,
    const std::vector<std::string>& genesB,
    const std::vector<GeneReference>& reference) const {

    auto setA = uniqueGenes(genesA, "first matrix");
    auto setB = uniqueGenes(genesB, "second matrix");

    std::unordered_set<std::string> functional;
    for (const auto& entry : reference) {
        if (std::find(excluded.begin(), excluded.end(), entry.locusGroup) == excluded.end()) {
            functional.insert(entry.geneId);
        }
    }

    std::vector<std::string> universe;
    for (const auto& gene : genesA) {
        if (setB.count(gene) && functional.count(gene)) {
            universe.push_back(gene);
        }
    }
    std::sort(universe.begin(), universe.end());

    if (universe.empty()) {
        throw ConfigurationError("no gene is shared by both matrices and the functional reference set "
                                 "(" + std::to_string(setA.size()) + " and " + std::to_string(setB.size()) +
                                 " genes, " + std::to_string(functional.size()) + " functional)", kStage);
    }
    return universe;
}

ExpressionMatrix GeneUniverseFilter::restrictToGenes(
    const ExpressionMatrix& matrix,
    const std::vector<std::string>& genes) {

    checkConsistent(matrix, kStage);

    std::unordered_map<std::string, Eigen::Index> column;
    for (size_t j = 0; j < matrix.genes.size(); ++j) {
        column.emplace(matrix.genes[j], static_cast<Eigen::Index>(j));
    }

    ExpressionMatrix restricted;
    restricted.sampleIds = matrix.sampleIds;
    restricted.genes = genes;
    restricted.values.resize(matrix.values.rows(), static_cast<Eigen::Index>(genes.size()));

    for (size_t j = 0; j < genes.size(); ++j) {
        auto it = column.find(genes[j]);
        if (it == column.end()) {
            throw DataShapeError("gene " + genes[j] + " is not a column of the matrix", kStage);
        }
        restricted.values.col(static_cast<Eigen::Index>(j)) = matrix.values.col(it->second);
    }
    return restricted;
}

std::vector<GeneStatistics> computeGeneStatistics(
    const ExpressionMatrix& tumor,
    const ExpressionMatrix& cellLine,
    const std::vector<GeneReference>& reference) {

    checkSameGenes(tumor, cellLine, kStage);

    // First symbol wins for duplicated identifiers
    std::unordered_map<std::string, std::string> symbols;
    for (const auto& entry : reference) {
        symbols.emplace(entry.geneId, entry.symbol);
    }

    std::vector<GeneStatistics> stats;
    stats.reserve(tumor.genes.size());
    for (size_t j = 0; j < tumor.genes.size(); ++j) {
        const auto col = static_cast<Eigen::Index>(j);
        auto [tumorMean, tumorSd] = columnMoments(tumor.values, col);
        auto [cellLineMean, cellLineSd] = columnMoments(cellLine.values, col);

        double maxSd = std::numeric_limits<double>::quiet_NaN();
        if (std::isfinite(tumorSd) && std::isfinite(cellLineSd)) {
            maxSd = std::max(tumorSd, cellLineSd);
        } else if (std::isfinite(tumorSd)) {
            maxSd = tumorSd;
        } else if (std::isfinite(cellLineSd)) {
            maxSd = cellLineSd;
        }

        auto symbol = symbols.find(tumor.genes[j]);
        stats.push_back(GeneStatistics{
            tumor.genes[j],
            symbol != symbols.end() ? symbol->second : std::string(),
            tumorMean,
            tumorSd,
            cellLineMean,
            cellLineSd,
            maxSd
        });
    }
    return stats;
}

}
